#pragma once

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "ds/extract.hpp"
#include "ds/model.hpp"

namespace ds {

// Closed set of recognised client log line grammars.
//   Set deadline on stream <id>: <ms> ms (hard|soft)
//   Stream <id>: Dropped <n> bytes due to deadline [(gap at offset <off>)]
//   Stream <id> completed[...]
struct DeadlineSetLine {
    StreamId     stream_id{};
    std::int64_t deadline_ms{};
    bool         is_hard{};
};

struct DropLine {
    StreamId                     stream_id{};
    std::uint64_t                bytes{};
    std::optional<std::uint64_t> offset;
};

struct CompletionLine {
    StreamId stream_id{};
};

using LogLine = std::variant<std::monostate, DeadlineSetLine, DropLine, CompletionLine>;

struct ClassifiedLine {
    LogLine     kind;
    TimestampMs time{kSentinelTime};

    bool matched() const { return !std::holds_alternative<std::monostate>(kind); }
};

// Single tokenizing pass over one line; unmatched lines yield std::monostate
ClassifiedLine classify_log_line(std::string_view line);

// Converts a matched line into the aggregator event; nullopt for unmatched lines
std::optional<Event> to_event(const ClassifiedLine &line);

// Streams events to sink as lines are read. Returns counters only (events left empty).
ExtractResult scan_log_stream(std::istream &in, const EventSink &sink);

ExtractResult extract_log_events(std::istream &in);
ExtractResult extract_log_file(const std::string &path);

} // namespace ds
