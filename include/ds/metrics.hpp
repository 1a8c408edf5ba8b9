#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <vector>

#include "ds/model.hpp"

namespace ds {

class StreamAggregator;

struct AggregateMetrics {
    std::size_t   total_streams{};
    std::size_t   streams_with_deadlines{};
    std::size_t   hard_deadlines{};
    std::size_t   soft_deadlines{};
    std::size_t   deadlines_met{};
    std::size_t   deadlines_missed{};
    std::size_t   deadlines_undecidable{};
    double        avg_deadline_margin{};      // ms, mean over met streams; 0 when none
    double        deadline_compliance_rate{}; // 0..1
    std::size_t   streams_with_drops{};
    std::uint64_t total_bytes_dropped{};
    std::size_t   completed_streams{};
    double        completion_rate{};          // 0..1
    std::uint64_t total_blocked_events{};
    std::size_t   gap_event_count{};
    std::size_t   deadline_trace_events{};
};

enum class DeadlineVerdict { NoDeadline, Met, Missed, Undecidable };

const char *verdict_str(DeadlineVerdict v);

struct StreamEvaluation {
    StreamId                    stream_id{};
    DeadlineVerdict             verdict{DeadlineVerdict::NoDeadline};
    std::optional<std::int64_t> duration_ms; // set when both timestamps are known
    std::optional<std::int64_t> margin_ms;   // deadline - duration, only for Met
};

// Undecidable when either timestamp is missing or completion precedes set time
StreamEvaluation evaluate_stream(StreamId id, const StreamRecord &rec);

// One entry per record, ascending stream id
std::vector<StreamEvaluation> evaluate_streams(const std::map<StreamId, StreamRecord> &records);

AggregateMetrics compute_metrics(const std::map<StreamId, StreamRecord> &records,
                                 std::size_t gap_events = 0,
                                 std::size_t deadline_trace_events = 0);

AggregateMetrics compute_metrics(const StreamAggregator &agg);

} // namespace ds
