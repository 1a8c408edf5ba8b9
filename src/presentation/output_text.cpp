#include "ds/output.hpp"

#include <format>
#include <sstream>
#include <string_view>

#include "ds/aggregator.hpp"
#include "ds/clock.hpp"
#include "ds/metrics.hpp"
#include "ds/model.hpp"

namespace ds {

std::string format_thousands(std::uint64_t v)
{
    std::string digits = std::to_string(v);
    std::string out;
    out.reserve(digits.size() + digits.size() / 3);
    const std::size_t lead = digits.size() % 3;
    for (std::size_t i = 0; i < digits.size(); ++i)
    {
        if (i != 0 && (i + 3 - lead) % 3 == 0) out += ',';
        out += digits[i];
    }
    return out;
}

std::string format_percent(double fraction)
{
    return std::format("{:.1f}%", fraction * 100.0);
}

static std::string row(std::string_view label, std::string_view value)
{
    return std::format("{:<24}{}\n", label, value);
}

static void heading(std::ostringstream& os, std::string_view title)
{
    os << title << '\n' << std::string(title.size(), '-') << '\n';
}

static std::string ms_or_dash(const std::optional<std::int64_t>& v)
{
    return v ? std::format("{} ms", *v) : std::string("-");
}

std::string format_title_text()
{
    constexpr std::string_view title = "Deadline Stream Analysis Report";
    return std::format("{}\n{}\n\n", title, std::string(title.size(), '='));
}

std::string format_summary_text(const AggregateMetrics& m, const InputSummary& inputs)
{
    std::ostringstream os;
    heading(os, "Summary");
    os << row("Input files:",
              std::format("{} log ({} failed), {} trace ({} failed)",
                          inputs.log_files, inputs.log_failed,
                          inputs.trace_files, inputs.trace_failed));
    os << row("Total streams:", std::to_string(m.total_streams));
    os << row("Streams with deadlines:",
              std::format("{} (hard: {}, soft: {})",
                          m.streams_with_deadlines, m.hard_deadlines, m.soft_deadlines));
    os << row("Gap events:", std::to_string(m.gap_event_count));
    os << row("Blocked events:", std::to_string(m.total_blocked_events));
    os << row("Deadline trace events:", std::to_string(m.deadline_trace_events));
    os << '\n';
    return os.str();
}

std::string format_compliance_text(const AggregateMetrics& m)
{
    std::ostringstream os;
    heading(os, "Deadline Compliance");
    os << row("Deadlines met:",
              std::format("{} of {}", m.deadlines_met, m.streams_with_deadlines));
    os << row("Deadlines missed:", std::to_string(m.deadlines_missed));
    os << row("Undecidable:", std::to_string(m.deadlines_undecidable));
    os << row("Compliance rate:", format_percent(m.deadline_compliance_rate));
    os << row("Avg deadline margin:", std::format("{:.1f} ms", m.avg_deadline_margin));
    os << '\n';
    return os.str();
}

std::string format_drops_text(const AggregateMetrics& m)
{
    std::ostringstream os;
    heading(os, "Data Drops");
    os << row("Streams with drops:", std::to_string(m.streams_with_drops));
    os << row("Total bytes dropped:", format_thousands(m.total_bytes_dropped));
    os << '\n';
    return os.str();
}

std::string format_completion_text(const AggregateMetrics& m)
{
    std::ostringstream os;
    heading(os, "Completion");
    os << row("Completed streams:",
              std::format("{} of {}", m.completed_streams, m.total_streams));
    os << row("Completion rate:", format_percent(m.completion_rate));
    os << '\n';
    return os.str();
}

std::string format_stream_table_text(const StreamAggregator& agg,
                                     const std::vector<StreamEvaluation>& evals)
{
    std::ostringstream os;
    heading(os, "Per-Stream Detail");
    if (evals.empty())
    {
        os << "(no streams observed)\n";
        return os.str();
    }

    constexpr std::string_view fmt = "{:>8}{:>10}  {:<4}  {:<12}  {:<12}{:>10}{:>10}{:>14}{:>9}  {}\n";
    os << std::vformat(fmt, std::make_format_args(
        "Stream", "Deadline", "Type", "Set At", "Completed At",
        "Duration", "Margin", "Dropped (B)", "Blocked", "Outcome"));

    for (const auto& ev : evals)
    {
        const StreamRecord* rec = agg.find(ev.stream_id);
        if (!rec) continue;

        const std::string id        = std::to_string(ev.stream_id);
        const std::string deadline  = ms_or_dash(rec->deadline_ms);
        const std::string type      = rec->is_hard ? (*rec->is_hard ? "hard" : "soft") : "-";
        const std::string set_at    = rec->set_time ? format_clock(*rec->set_time) : "-";
        const std::string done_at   = rec->completion_time ? format_clock(*rec->completion_time) : "-";
        const std::string duration  = ms_or_dash(ev.duration_ms);
        const std::string margin    = ev.margin_ms
                                          ? std::format("{:.1f} ms", static_cast<double>(*ev.margin_ms))
                                          : std::string("-");
        const std::string dropped   = format_thousands(rec->bytes_dropped);
        const std::string blocked   = std::to_string(rec->blocked_events);
        const std::string_view outcome = verdict_str(ev.verdict);

        os << std::vformat(fmt, std::make_format_args(
            id, deadline, type, set_at, done_at, duration, margin, dropped, blocked, outcome));
    }
    return os.str();
}

std::string format_report_text(const StreamAggregator& agg,
                               const AggregateMetrics& m,
                               const std::vector<StreamEvaluation>& evals,
                               const InputSummary& inputs)
{
    std::string out = format_title_text();
    out += format_summary_text(m, inputs);
    out += format_compliance_text(m);
    out += format_drops_text(m);
    out += format_completion_text(m);
    out += format_stream_table_text(agg, evals);
    return out;
}

} // namespace ds
