#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>

#include "ds/aggregator.hpp"
#include "ds/json.hpp"
#include "ds/metrics.hpp"
#include "ds/model.hpp"
#include "ds/output.hpp"

using namespace ds;

static void assert_true(bool cond, std::string_view msg)
{
    if (!cond)
    {
        std::cerr << "ASSERT FAILED: " << msg << std::endl;
        std::exit(1);
    }
}

static void assert_contains(const std::string& haystack, std::string_view needle, std::string_view msg)
{
    if (haystack.find(needle) == std::string::npos)
    {
        std::cerr << "ASSERT FAILED: missing substring: " << needle << " | " << msg << std::endl;
        std::cerr << "Actual: " << haystack << std::endl;
        std::exit(1);
    }
}

static std::string line(std::string_view label, std::string_view value)
{
    return std::string(label) + std::string(24 - label.size(), ' ') + std::string(value) + "\n";
}

static std::string lpad(std::string_view s, std::size_t w)
{
    return std::string(w > s.size() ? w - s.size() : 0, ' ') + std::string(s);
}

static std::string rpad(std::string_view s, std::size_t w)
{
    return std::string(s) + std::string(w > s.size() ? w - s.size() : 0, ' ');
}

static StreamAggregator scenario()
{
    StreamAggregator agg;
    agg.deadline_set(4, 100, true, 1000);
    agg.drop(4, 20, 3000);
    agg.completed(4, kSentinelTime);
    agg.finalize();
    return agg;
}

static void test_number_formats()
{
    assert_true(format_thousands(0) == "0", "0");
    assert_true(format_thousands(999) == "999", "999");
    assert_true(format_thousands(1000) == "1,000", "1,000");
    assert_true(format_thousands(1234567) == "1,234,567", "1,234,567");
    assert_true(format_thousands(18446744073709551615ULL) == "18,446,744,073,709,551,615", "u64 max");
    assert_true(format_percent(0.0) == "0.0%", "0%");
    assert_true(format_percent(2.0 / 3.0) == "66.7%", "two thirds");
    assert_true(format_percent(1.0) == "100.0%", "100%");
}

static void test_sections()
{
    StreamAggregator agg = scenario();
    AggregateMetrics m = compute_metrics(agg);
    InputSummary in{1, 0, 2, 1};

    std::string s = format_summary_text(m, in);
    assert_contains(s, "Summary\n-------\n", "summary heading");
    assert_contains(s, line("Input files:", "1 log (0 failed), 2 trace (1 failed)"), "inputs");
    assert_contains(s, line("Total streams:", "1"), "total streams");
    assert_contains(s, line("Streams with deadlines:", "1 (hard: 1, soft: 0)"), "deadline partition");

    std::string c = format_compliance_text(m);
    assert_contains(c, line("Deadlines met:", "0 of 1"), "met");
    assert_contains(c, line("Undecidable:", "1"), "undecidable");
    assert_contains(c, line("Compliance rate:", "0.0%"), "rate");
    assert_contains(c, line("Avg deadline margin:", "0.0 ms"), "margin");

    std::string d = format_drops_text(m);
    assert_contains(d, line("Streams with drops:", "1"), "drop streams");
    assert_contains(d, line("Total bytes dropped:", "20"), "drop bytes");

    std::string p = format_completion_text(m);
    assert_contains(p, line("Completed streams:", "1 of 1"), "completed");
    assert_contains(p, line("Completion rate:", "100.0%"), "completion rate");
}

static void test_stream_table()
{
    StreamAggregator agg = scenario();
    auto evals = evaluate_streams(agg.records());
    std::string t = format_stream_table_text(agg, evals);

    const std::string header = lpad("Stream", 8) + lpad("Deadline", 10) + "  " + rpad("Type", 4) + "  " +
                               rpad("Set At", 12) + "  " + rpad("Completed At", 12) +
                               lpad("Duration", 10) + lpad("Margin", 10) + lpad("Dropped (B)", 14) +
                               lpad("Blocked", 9) + "  Outcome\n";
    assert_contains(t, header, "table header");

    const std::string row = lpad("4", 8) + lpad("100 ms", 10) + "  hard  " +
                            rpad("00:00:01", 12) + "  " + rpad("00:00:00", 12) +
                            lpad("-1000 ms", 10) + lpad("-", 10) + lpad("20", 14) +
                            lpad("0", 9) + "  undecidable\n";
    assert_contains(t, row, "stream 4 row");

    StreamAggregator empty;
    assert_contains(format_stream_table_text(empty, {}), "(no streams observed)\n", "empty table");
}

static void test_table_sorted_and_grouped()
{
    StreamAggregator agg;
    agg.drop(12, 1234567, 0);
    agg.deadline_set(3, 100, false, 0);
    agg.completed(3, 80);
    auto evals = evaluate_streams(agg.records());
    std::string t = format_stream_table_text(agg, evals);
    assert_true(t.find(lpad("3", 8)) < t.find(lpad("12", 8)), "ascending stream id");
    assert_contains(t, "1,234,567", "dropped bytes grouped");
    assert_contains(t, lpad("20.0 ms", 10) + lpad("0", 14), "margin with one decimal");
    assert_contains(t, "  met\n", "met outcome");
    assert_contains(t, "  no-deadline\n", "no deadline outcome");
}

static void test_full_report_order()
{
    StreamAggregator agg = scenario();
    AggregateMetrics m = compute_metrics(agg);
    auto evals = evaluate_streams(agg.records());
    std::string r = format_report_text(agg, m, evals, InputSummary{1, 0, 0, 0});
    const auto title = r.find("Deadline Stream Analysis Report\n===============================\n");
    const auto sum = r.find("Summary\n");
    const auto comp = r.find("Deadline Compliance\n");
    const auto drops = r.find("Data Drops\n");
    const auto done = r.find("Completion\n----------\n");
    const auto table = r.find("Per-Stream Detail\n");
    assert_true(title == 0, "title first");
    assert_true(sum < comp && comp < drops && drops < done && done < table, "fixed section order");
    assert_true(r == format_report_text(agg, m, evals, InputSummary{1, 0, 0, 0}), "deterministic");
}

static void test_json_documents()
{
    StreamAggregator agg;
    agg.deadline_set(4, 100, true, 1000);
    agg.drop(4, 20, 3000);
    agg.completed(4, kSentinelTime);
    DeadlineTraceEvent te{};
    te.time = 1.5;
    te.type = "deadline_set";
    te.raw_payload["type"] = "deadline_set";
    agg.deadline_trace(te);
    agg.finalize();

    AggregateMetrics m = compute_metrics(agg);
    auto evals = evaluate_streams(agg.records());

    std::string mj = build_metrics_json(m);
    assert_contains(mj, "\"total_streams\":1,", "total streams");
    assert_contains(mj, "\"deadlines_met\":0,", "met");
    assert_contains(mj, "\"completion_rate\":1.000,", "completion rate");
    assert_contains(mj, "\"total_bytes_dropped\":20,", "bytes");

    std::string rj = build_report_json(agg, m, evals, InputSummary{1, 0, 1, 0});
    assert_contains(rj, "\"inputs\":{\"log_files\":1,\"log_failed\":0,\"trace_files\":1,\"trace_failed\":0}", "inputs");
    assert_contains(rj, "{\"stream_id\":4,\"deadline_ms\":100,\"is_hard\":true,", "stream head");
    assert_contains(rj, "\"set_time\":\"00:00:01\",\"set_time_ms\":1000", "set time");
    assert_contains(rj, "\"completion_time\":\"00:00:00\",\"completion_time_ms\":0", "sentinel completion");
    assert_contains(rj, "\"verdict\":\"undecidable\",\"duration_ms\":-1000,\"margin_ms\":null}", "verdict");

    std::string tj = build_timeline_json(agg, m, evals);
    assert_contains(tj, "\"gaps\":[{\"stream_id\":4,\"bytes\":20,\"time\":\"00:00:03\",\"time_ms\":3000,\"offset\":null}]", "gap");
    assert_contains(tj, "\"deadline_traces\":[{\"time\":1.500,\"type\":\"deadline_set\",\"data\":{\"type\":\"deadline_set\"}}]", "trace");
}

static void test_json_escape()
{
    assert_true(json_escape("plain") == "plain", "plain text untouched");
    assert_true(json_escape("a\"b\\c") == "a\\\"b\\\\c", "quote and backslash");
    assert_true(json_escape("x\ny\tz") == "x\\ny\\tz", "short escapes");
    assert_true(json_escape(std::string_view("\x01\x1f", 2)) == "\\u0001\\u001f", "control chars as \\u");
    assert_true(json_escape("caf\xc3\xa9") == "caf\xc3\xa9", "UTF-8 bytes pass through");
}

static void test_trace_type_escaped_in_timeline()
{
    StreamAggregator agg;
    DeadlineTraceEvent te{};
    te.time = 0.0;
    te.type = "deadline \"x\"";
    te.raw_payload["type"] = te.type;
    agg.deadline_trace(te);
    agg.finalize();
    std::string tj = build_timeline_json(agg, compute_metrics(agg), {});
    assert_contains(tj, "{\"time\":0.000,\"type\":\"deadline \\\"x\\\"\"", "escaped type");
}

int main()
{
    test_number_formats();
    test_sections();
    test_stream_table();
    test_table_sorted_and_grouped();
    test_full_report_order();
    test_json_documents();
    test_json_escape();
    test_trace_type_escaped_in_timeline();
    std::cout << "presentation tests: OK" << std::endl;
    return 0;
}
