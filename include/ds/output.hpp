#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace ds
{
// Forward declarations to avoid heavy includes in header
class StreamAggregator;
struct AggregateMetrics;
struct StreamEvaluation;
struct InputSummary;

// 1234567 -> "1,234,567"
std::string format_thousands(std::uint64_t v);

// 0.6667 -> "66.7%"
std::string format_percent(double fraction);

// Text sections (each ends with a blank line)
std::string format_title_text();

std::string format_summary_text(const AggregateMetrics &m,
                                const InputSummary &inputs);

std::string format_compliance_text(const AggregateMetrics &m);

std::string format_drops_text(const AggregateMetrics &m);

std::string format_completion_text(const AggregateMetrics &m);

// Fixed-width per-stream table, ascending stream id
std::string format_stream_table_text(const StreamAggregator &agg,
                                     const std::vector<StreamEvaluation> &evals);

// Full report: title, summary, compliance, drops, completion, stream table
std::string format_report_text(const StreamAggregator &agg,
                               const AggregateMetrics &m,
                               const std::vector<StreamEvaluation> &evals,
                               const InputSummary &inputs);

// JSON builders (single object string without trailing newline)
std::string build_metrics_json(const AggregateMetrics &m);

std::string build_report_json(const StreamAggregator &agg,
                              const AggregateMetrics &m,
                              const std::vector<StreamEvaluation> &evals,
                              const InputSummary &inputs);

// Data read by the external timeline chart renderer
std::string build_timeline_json(const StreamAggregator &agg,
                                const AggregateMetrics &m,
                                const std::vector<StreamEvaluation> &evals);
} // namespace ds
