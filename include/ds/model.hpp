#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <variant>

#include <json/value.h>

namespace ds {

using StreamId    = std::uint64_t;
using TimestampMs = std::int64_t; // milliseconds since 00:00:00 of the log clock

// Substituted when a matched log line carries no bracketed HH:MM:SS token
inline constexpr TimestampMs kSentinelTime = 0;

// Byte counters clamp at the u64 maximum instead of wrapping
inline std::uint64_t saturating_add(std::uint64_t a, std::uint64_t b)
{
    return b > std::numeric_limits<std::uint64_t>::max() - a
               ? std::numeric_limits<std::uint64_t>::max()
               : a + b;
}

struct StreamRecord {
    std::optional<std::int64_t> deadline_ms;
    std::optional<bool>         is_hard;
    std::optional<TimestampMs>  set_time;
    bool                        completed{};
    std::optional<TimestampMs>  completion_time;
    std::uint64_t               bytes_dropped{};  // accumulated, never overwritten
    std::uint64_t               blocked_events{};

    bool operator==(const StreamRecord&) const = default;
};

struct GapEvent {
    StreamId                     stream_id{};
    std::uint64_t                bytes_dropped{};
    TimestampMs                  time{};
    std::optional<std::uint64_t> offset; // "gap at offset N" when the log carries it

    bool operator==(const GapEvent&) const = default;
};

struct DeadlineTraceEvent {
    double      time{};      // trace-relative milliseconds
    std::string type;
    Json::Value raw_payload; // event-data object, kept verbatim
};

// Events handed from the extractors to the aggregator
struct DeadlineSet {
    StreamId     stream_id{};
    std::int64_t deadline_ms{};
    bool         is_hard{};
    TimestampMs  time{kSentinelTime};
};

struct Drop {
    StreamId                     stream_id{};
    std::uint64_t                bytes{};
    TimestampMs                  time{kSentinelTime};
    std::optional<std::uint64_t> offset;
};

struct Completed {
    StreamId    stream_id{};
    TimestampMs time{kSentinelTime};
};

struct StreamBlocked {
    StreamId stream_id{};
};

struct DeadlineTrace {
    DeadlineTraceEvent event;
};

using Event = std::variant<DeadlineSet, Drop, Completed, StreamBlocked, DeadlineTrace>;

struct InputSummary {
    std::size_t log_files{};
    std::size_t log_failed{};
    std::size_t trace_files{};
    std::size_t trace_failed{};
};

} // namespace ds
