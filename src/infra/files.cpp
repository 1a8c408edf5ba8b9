#include "ds/files.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>

#include <fnmatch.h>

namespace ds {

namespace fs = std::filesystem;

std::vector<std::string> discover_files(const std::string &dir,
                                        const std::vector<std::string> &patterns)
{
    std::vector<std::string> out;
    if (dir.empty()) return out;

    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) return out;

    for (const auto &entry : it)
    {
        std::error_code type_ec;
        if (!entry.is_regular_file(type_ec)) continue;
        const std::string name = entry.path().filename().string();
        const bool hit = std::ranges::any_of(patterns, [&](const std::string &p)
        {
            return ::fnmatch(p.c_str(), name.c_str(), 0) == 0;
        });
        if (hit) out.push_back(entry.path().string());
    }

    std::ranges::sort(out);
    out.erase(std::ranges::unique(out).begin(), out.end());
    return out;
}

std::vector<std::string> split_patterns(std::string_view list)
{
    std::vector<std::string> out;
    std::string cur;
    for (char ch : list)
    {
        if (ch == ',')
        {
            if (!cur.empty()) out.push_back(std::move(cur));
            cur.clear();
        }
        else if (ch != ' ')
        {
            cur.push_back(ch);
        }
    }
    if (!cur.empty()) out.push_back(std::move(cur));
    return out;
}

void write_text_file(const std::string &path, std::string_view content)
{
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs)
    {
        throw std::runtime_error("Failed to open file for writing: " + path);
    }
    ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
    ofs.flush();
    if (!ofs)
    {
        throw std::runtime_error("Failed to write file: " + path);
    }
}

} // namespace ds
