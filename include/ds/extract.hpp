#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "ds/model.hpp"

namespace ds {

enum class ExtractErrorKind {
    None = 0,
    OpenFailed,
    ReadFailed,
    ParseFailed,
    BadStructure,
};

const char *extract_error_str(ExtractErrorKind kind);

// Outcome of one file pass. When kind != None, events is empty and error is set.
struct ExtractResult {
    std::vector<Event> events;
    ExtractErrorKind   kind{ExtractErrorKind::None};
    std::string        error;
    std::size_t        lines_read{};    // text logs: physical lines; traces: event tuples
    std::size_t        lines_matched{};

    bool ok() const { return kind == ExtractErrorKind::None; }
};

using EventSink = std::function<void(const Event &)>;

} // namespace ds
