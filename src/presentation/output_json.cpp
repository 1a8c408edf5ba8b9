#include "ds/output.hpp"

#include <iomanip>
#include <sstream>

#include "ds/aggregator.hpp"
#include "ds/clock.hpp"
#include "ds/json.hpp"
#include "ds/metrics.hpp"
#include "ds/model.hpp"

namespace ds
{
static void write_opt_int(std::ostringstream &os, const std::optional<std::int64_t> &v)
{
    if (v) os << *v;
    else os << "null";
}

static void write_opt_clock(std::ostringstream &os,
                            const char *key,
                            const std::optional<TimestampMs> &t)
{
    os << "\"" << key << "\":";
    if (t) os << "\"" << format_clock(*t) << R"(",")" << key << "_ms\":" << *t;
    else os << "null,\"" << key << "_ms\":null";
}

static void write_metrics(std::ostringstream &os, const AggregateMetrics &m)
{
    os << "{";
    os << R"("total_streams":)" << m.total_streams
            << R"(,"streams_with_deadlines":)" << m.streams_with_deadlines
            << R"(,"hard_deadlines":)" << m.hard_deadlines
            << R"(,"soft_deadlines":)" << m.soft_deadlines
            << R"(,"deadlines_met":)" << m.deadlines_met
            << R"(,"deadlines_missed":)" << m.deadlines_missed
            << R"(,"deadlines_undecidable":)" << m.deadlines_undecidable
            << R"(,"avg_deadline_margin":)" << m.avg_deadline_margin
            << R"(,"deadline_compliance_rate":)" << m.deadline_compliance_rate
            << R"(,"streams_with_drops":)" << m.streams_with_drops
            << R"(,"total_bytes_dropped":)" << m.total_bytes_dropped
            << R"(,"completed_streams":)" << m.completed_streams
            << R"(,"completion_rate":)" << m.completion_rate
            << R"(,"total_blocked_events":)" << m.total_blocked_events
            << R"(,"gap_event_count":)" << m.gap_event_count
            << R"(,"deadline_trace_events":)" << m.deadline_trace_events;
    os << "}";
}

static void write_streams(std::ostringstream &os,
                          const StreamAggregator &agg,
                          const std::vector<StreamEvaluation> &evals)
{
    os << "[";
    bool first = true;
    for (const auto &ev : evals)
    {
        const StreamRecord *rec = agg.find(ev.stream_id);
        if (!rec) continue;
        if (!first) os << ",";
        first = false;

        os << R"({"stream_id":)" << ev.stream_id << R"(,"deadline_ms":)";
        write_opt_int(os, rec->deadline_ms);
        os << R"(,"is_hard":)";
        if (rec->is_hard) os << (*rec->is_hard ? "true" : "false");
        else os << "null";
        os << ",";
        write_opt_clock(os, "set_time", rec->set_time);
        os << R"(,"completed":)" << (rec->completed ? "true" : "false") << ",";
        write_opt_clock(os, "completion_time", rec->completion_time);
        os << R"(,"bytes_dropped":)" << rec->bytes_dropped
                << R"(,"blocked_events":)" << rec->blocked_events
                << R"(,"verdict":")" << json_escape(verdict_str(ev.verdict))
                << R"(","duration_ms":)";
        write_opt_int(os, ev.duration_ms);
        os << R"(,"margin_ms":)";
        write_opt_int(os, ev.margin_ms);
        os << "}";
    }
    os << "]";
}

std::string build_metrics_json(const AggregateMetrics &m)
{
    std::ostringstream os;
    os << std::fixed << std::setprecision(3);
    write_metrics(os, m);
    return os.str();
}

std::string build_report_json(const StreamAggregator &agg,
                              const AggregateMetrics &m,
                              const std::vector<StreamEvaluation> &evals,
                              const InputSummary &inputs)
{
    std::ostringstream os;
    os << std::fixed << std::setprecision(3);
    os << "{";
    os << R"("inputs":{"log_files":)" << inputs.log_files
            << R"(,"log_failed":)" << inputs.log_failed
            << R"(,"trace_files":)" << inputs.trace_files
            << R"(,"trace_failed":)" << inputs.trace_failed << "},";
    os << R"("metrics":)";
    write_metrics(os, m);
    os << R"(,"streams":)";
    write_streams(os, agg, evals);
    os << "}";
    return os.str();
}

std::string build_timeline_json(const StreamAggregator &agg,
                                const AggregateMetrics &m,
                                const std::vector<StreamEvaluation> &evals)
{
    std::ostringstream os;
    os << std::fixed << std::setprecision(3);
    os << "{";
    os << R"("metrics":)";
    write_metrics(os, m);
    os << R"(,"streams":)";
    write_streams(os, agg, evals);

    os << R"(,"gaps":[)";
    const auto &gaps = agg.gaps();
    for (size_t i = 0; i < gaps.size(); ++i)
    {
        const auto &g = gaps[i];
        if (i) os << ",";
        os << R"({"stream_id":)" << g.stream_id
                << R"(,"bytes":)" << g.bytes_dropped
                << R"(,"time":")" << format_clock(g.time)
                << R"(","time_ms":)" << g.time
                << R"(,"offset":)";
        if (g.offset) os << *g.offset;
        else os << "null";
        os << "}";
    }
    os << "]";

    os << R"(,"deadline_traces":[)";
    const auto &traces = agg.deadline_traces();
    for (size_t i = 0; i < traces.size(); ++i)
    {
        const auto &t = traces[i];
        if (i) os << ",";
        os << R"({"time":)" << t.time
                << R"(,"type":")" << json_escape(t.type)
                << R"(","data":)" << json_compact(t.raw_payload) << "}";
    }
    os << "]";
    os << "}";
    return os.str();
}
} // namespace ds
