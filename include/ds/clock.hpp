#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "ds/model.hpp"

namespace ds {

// "HH:MM:SS" or "HH:MM:SS.fff" -> milliseconds. Minutes/seconds must be < 60.
std::optional<TimestampMs> parse_clock(std::string_view token);

// First "[HH:MM:SS]" token anywhere in the line
std::optional<TimestampMs> find_bracketed_clock(std::string_view line);

// Inverse of parse_clock; the fraction is only printed when non-zero
std::string format_clock(TimestampMs t);

} // namespace ds
