#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace ds {

// Regular files directly inside dir whose name matches any glob, sorted by path.
// A missing or unreadable directory yields an empty list.
std::vector<std::string> discover_files(const std::string &dir,
                                        const std::vector<std::string> &patterns);

// Comma-separated glob list -> patterns (empty items dropped)
std::vector<std::string> split_patterns(std::string_view list);

// Throws std::runtime_error when the file cannot be opened or written
void write_text_file(const std::string &path, std::string_view content);

} // namespace ds
