#include "ds/aggregator.hpp"

#include <stdexcept>
#include <utility>

namespace ds {

namespace {

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };

} // namespace

void StreamAggregator::ensure_mutable() const
{
    if (finalized_) throw std::logic_error("stream aggregator already finalized");
}

StreamRecord &StreamAggregator::record_for(StreamId id)
{
    // created lazily; the same record is shared by every later event for id
    return records_[id];
}

const StreamRecord *StreamAggregator::find(StreamId id) const
{
    auto it = records_.find(id);
    return it == records_.end() ? nullptr : &it->second;
}

void StreamAggregator::deadline_set(StreamId id, std::int64_t deadline_ms, bool is_hard, TimestampMs time)
{
    ensure_mutable();
    StreamRecord &rec = record_for(id);
    rec.deadline_ms = deadline_ms;
    rec.is_hard     = is_hard;
    rec.set_time    = time;
}

void StreamAggregator::drop(StreamId id,
                            std::uint64_t bytes,
                            TimestampMs time,
                            std::optional<std::uint64_t> offset)
{
    ensure_mutable();
    StreamRecord &rec = record_for(id);
    rec.bytes_dropped = saturating_add(rec.bytes_dropped, bytes);
    gaps_.push_back(GapEvent{id, bytes, time, offset});
}

void StreamAggregator::completed(StreamId id, TimestampMs time)
{
    ensure_mutable();
    StreamRecord &rec   = record_for(id);
    rec.completed       = true;
    rec.completion_time = time;
}

void StreamAggregator::stream_blocked(StreamId id)
{
    ensure_mutable();
    StreamRecord &rec = record_for(id);
    rec.blocked_events = saturating_add(rec.blocked_events, 1);
}

void StreamAggregator::deadline_trace(DeadlineTraceEvent event)
{
    ensure_mutable();
    traces_.push_back(std::move(event));
}

void StreamAggregator::apply(const Event &ev)
{
    std::visit(overloaded{
        [this](const DeadlineSet &e) { deadline_set(e.stream_id, e.deadline_ms, e.is_hard, e.time); },
        [this](const Drop &e) { drop(e.stream_id, e.bytes, e.time, e.offset); },
        [this](const Completed &e) { completed(e.stream_id, e.time); },
        [this](const StreamBlocked &e) { stream_blocked(e.stream_id); },
        [this](const DeadlineTrace &e) { deadline_trace(e.event); },
    }, ev);
}

void StreamAggregator::apply_all(const std::vector<Event> &events)
{
    for (const auto &ev : events) apply(ev);
}

} // namespace ds
