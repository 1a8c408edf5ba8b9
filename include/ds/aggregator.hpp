#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <vector>

#include "ds/model.hpp"

namespace ds {

// Owns the per-run stream records and the two append-only event sequences.
// Not safe for concurrent writers. Applying the same input twice double-counts
// bytes_dropped and blocked_events; each input must be applied at most once.
class StreamAggregator
{
public:
    // Last writer wins for deadline_ms / is_hard / set_time
    void deadline_set(StreamId id, std::int64_t deadline_ms, bool is_hard, TimestampMs time);
    void drop(StreamId id,
              std::uint64_t bytes,
              TimestampMs time,
              std::optional<std::uint64_t> offset = std::nullopt);
    void completed(StreamId id, TimestampMs time);
    void stream_blocked(StreamId id);
    void deadline_trace(DeadlineTraceEvent event);

    void apply(const Event &ev);
    void apply_all(const std::vector<Event> &events);

    // After finalize() every mutator throws std::logic_error
    void finalize() { finalized_ = true; }
    bool finalized() const { return finalized_; }

    const std::map<StreamId, StreamRecord> &records() const { return records_; }
    const std::vector<GapEvent> &gaps() const { return gaps_; }
    const std::vector<DeadlineTraceEvent> &deadline_traces() const { return traces_; }

    const StreamRecord *find(StreamId id) const;

private:
    StreamRecord &record_for(StreamId id);
    void ensure_mutable() const;

    std::map<StreamId, StreamRecord> records_;
    std::vector<GapEvent>            gaps_;
    std::vector<DeadlineTraceEvent>  traces_;
    bool                             finalized_{false};
};

} // namespace ds
