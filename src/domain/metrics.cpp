#include "ds/metrics.hpp"

#include "ds/aggregator.hpp"

namespace ds {

const char *verdict_str(DeadlineVerdict v)
{
    switch (v)
    {
        case DeadlineVerdict::NoDeadline: return "no-deadline";
        case DeadlineVerdict::Met: return "met";
        case DeadlineVerdict::Missed: return "missed";
        case DeadlineVerdict::Undecidable: return "undecidable";
    }
    return "unknown";
}

StreamEvaluation evaluate_stream(StreamId id, const StreamRecord &rec)
{
    StreamEvaluation ev{};
    ev.stream_id = id;

    if (rec.set_time && rec.completion_time)
        ev.duration_ms = *rec.completion_time - *rec.set_time;

    if (!rec.deadline_ms)
    {
        ev.verdict = DeadlineVerdict::NoDeadline;
        return ev;
    }
    // a completion logged before the deadline was set has no usable duration
    if (!ev.duration_ms || *ev.duration_ms < 0)
    {
        ev.verdict = DeadlineVerdict::Undecidable;
        return ev;
    }
    if (*ev.duration_ms <= *rec.deadline_ms)
    {
        ev.verdict   = DeadlineVerdict::Met;
        ev.margin_ms = *rec.deadline_ms - *ev.duration_ms;
    }
    else
    {
        ev.verdict = DeadlineVerdict::Missed;
    }
    return ev;
}

std::vector<StreamEvaluation> evaluate_streams(const std::map<StreamId, StreamRecord> &records)
{
    std::vector<StreamEvaluation> out;
    out.reserve(records.size());
    for (const auto &[id, rec] : records) out.push_back(evaluate_stream(id, rec));
    return out;
}

AggregateMetrics compute_metrics(const std::map<StreamId, StreamRecord> &records,
                                 std::size_t gap_events,
                                 std::size_t deadline_trace_events)
{
    AggregateMetrics m{};
    m.total_streams         = records.size();
    m.gap_event_count       = gap_events;
    m.deadline_trace_events = deadline_trace_events;

    double margin_sum = 0.0;
    for (const auto &[id, rec] : records)
    {
        if (rec.deadline_ms)
        {
            ++m.streams_with_deadlines;
            if (rec.is_hard.value_or(false)) ++m.hard_deadlines;
            else ++m.soft_deadlines;
        }

        const StreamEvaluation ev = evaluate_stream(id, rec);
        switch (ev.verdict)
        {
            case DeadlineVerdict::Met:
                ++m.deadlines_met;
                margin_sum += static_cast<double>(*ev.margin_ms);
                break;
            case DeadlineVerdict::Missed: ++m.deadlines_missed; break;
            case DeadlineVerdict::Undecidable: ++m.deadlines_undecidable; break;
            case DeadlineVerdict::NoDeadline: break;
        }

        if (rec.bytes_dropped > 0) ++m.streams_with_drops;
        m.total_bytes_dropped  = saturating_add(m.total_bytes_dropped, rec.bytes_dropped);
        m.total_blocked_events = saturating_add(m.total_blocked_events, rec.blocked_events);
        if (rec.completed) ++m.completed_streams;
    }

    if (m.deadlines_met > 0)
        m.avg_deadline_margin = margin_sum / static_cast<double>(m.deadlines_met);
    if (m.streams_with_deadlines > 0)
        m.deadline_compliance_rate = static_cast<double>(m.deadlines_met) /
                                     static_cast<double>(m.streams_with_deadlines);
    if (m.total_streams > 0)
        m.completion_rate = static_cast<double>(m.completed_streams) /
                            static_cast<double>(m.total_streams);
    return m;
}

AggregateMetrics compute_metrics(const StreamAggregator &agg)
{
    return compute_metrics(agg.records(), agg.gaps().size(), agg.deadline_traces().size());
}

} // namespace ds
