#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <json/value.h>

#include "ds/extract.hpp"

namespace ds {

// Positional [time, ..., data] tuple reduced to a fixed record at the parse boundary
struct TraceEnvelope {
    double      time{};
    Json::Value data;
};

// nullopt when the tuple is not an array whose last element is an object
std::optional<TraceEnvelope> make_envelope(const Json::Value &tuple);

// Expects {"traces": [{"events": [[time, ..., {...}], ...]}]}; only traces[0] is read
ExtractResult extract_qlog_events(std::string_view document);
ExtractResult extract_qlog_file(const std::string &path);

} // namespace ds
