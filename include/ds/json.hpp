#pragma once

#include <string>
#include <string_view>

#include <json/value.h>

namespace ds {

std::string json_escape(std::string_view s);

// Compact single-line rendering of an arbitrary value (trace payloads)
std::string json_compact(const Json::Value &v);

} // namespace ds
