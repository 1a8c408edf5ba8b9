#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <variant>

#include "ds/log_extractor.hpp"

using namespace ds;

static void assert_true(bool cond, std::string_view msg)
{
    if (!cond)
    {
        std::cerr << "ASSERT FAILED: " << msg << std::endl;
        std::exit(1);
    }
}

static void assert_eq_u64(std::uint64_t a, std::uint64_t b, std::string_view msg)
{
    if (a != b)
    {
        std::cerr << "ASSERT FAILED: " << msg << " | expected=" << b << " actual=" << a << std::endl;
        std::exit(1);
    }
}

static void test_deadline_set_line()
{
    auto cl = classify_log_line("[00:00:01] Set deadline on stream 4: 100 ms (hard)");
    const auto* set = std::get_if<DeadlineSetLine>(&cl.kind);
    assert_true(set != nullptr, "deadline-set recognised");
    assert_eq_u64(set->stream_id, 4, "stream id");
    assert_true(set->deadline_ms == 100, "deadline ms");
    assert_true(set->is_hard, "hard tag");
    assert_true(cl.time == 1000, "bracketed time");

    auto soft = classify_log_line("[DEADLINE] Set deadline on stream 8: 200 ms (soft)");
    const auto* s = std::get_if<DeadlineSetLine>(&soft.kind);
    assert_true(s != nullptr && !s->is_hard && s->stream_id == 8, "soft with tag prefix");
    assert_true(soft.time == kSentinelTime, "no clock -> sentinel");

    assert_true(!classify_log_line("Set deadline on stream 8: 200 ms (firm)").matched(), "unknown tag");
    assert_true(!classify_log_line("Client: Set deadline 100 ms on stream 4").matched(), "other client wording");
}

static void test_drop_line()
{
    auto cl = classify_log_line("[00:00:03] Stream 4: Dropped 20 bytes due to deadline");
    const auto* d = std::get_if<DropLine>(&cl.kind);
    assert_true(d != nullptr, "drop recognised");
    assert_eq_u64(d->stream_id, 4, "drop stream id");
    assert_eq_u64(d->bytes, 20, "drop bytes");
    assert_true(!d->offset, "no offset");
    assert_true(cl.time == 3000, "drop time");

    auto gap = classify_log_line("Stream 12: Dropped 1400 bytes due to deadline (gap at offset 28000)");
    const auto* g = std::get_if<DropLine>(&gap.kind);
    assert_true(g != nullptr && g->offset && *g->offset == 28000, "gap offset captured");
}

static void test_completion_line()
{
    auto cl = classify_log_line("Stream 4 completed");
    const auto* c = std::get_if<CompletionLine>(&cl.kind);
    assert_true(c != nullptr && c->stream_id == 4, "completion recognised");
    assert_true(cl.time == kSentinelTime, "completion without clock");

    auto ext = classify_log_line("[CLIENT] Stream 8 completed: 5000 bytes in 80 ms (deadline: 100 ms) - SUCCESS");
    const auto* e = std::get_if<CompletionLine>(&ext.kind);
    assert_true(e != nullptr && e->stream_id == 8, "extended completion line");

    assert_true(!classify_log_line("Streams completed:  3").matched(), "stats line is not a completion");
    assert_true(!classify_log_line("Client: All streams completed in 12.000 ms").matched(), "summary line");
    assert_true(!classify_log_line("Stream 4 completedness").matched(), "word must be exact");
}

static void test_unmatched_lines()
{
    assert_true(!classify_log_line("").matched(), "empty line");
    assert_true(!classify_log_line("Client: Connection ready").matched(), "noise");
    assert_true(!classify_log_line("Stream x: Dropped 5 bytes").matched(), "non-numeric id");
    assert_true(!classify_log_line("Stream 4: Dropped many bytes").matched(), "non-numeric count");
    assert_true(!to_event(classify_log_line("noise")), "no event for noise");
}

static void test_stream_extraction()
{
    std::istringstream in(
        "Connecting to server\r\n"
        "[00:00:01] Set deadline on stream 4: 100 ms (hard)\n"
        "[00:00:03] Stream 4: Dropped 20 bytes due to deadline\n"
        "garbage line\n"
        "Stream 4 completed\n");
    ExtractResult res = extract_log_events(in);
    assert_true(res.ok(), "stream ok");
    assert_eq_u64(res.lines_read, 5, "lines read");
    assert_eq_u64(res.lines_matched, 3, "lines matched");
    assert_eq_u64(res.events.size(), 3, "events");
    assert_true(std::holds_alternative<DeadlineSet>(res.events[0]), "order: set");
    assert_true(std::holds_alternative<Drop>(res.events[1]), "order: drop");
    assert_true(std::holds_alternative<Completed>(res.events[2]), "order: completed");
    assert_true(std::get<Completed>(res.events[2]).time == kSentinelTime, "sentinel completion time");
}

static void test_scan_sink()
{
    std::istringstream in("Stream 1 completed\nStream 2 completed\n");
    int seen = 0;
    ExtractResult res = scan_log_stream(in, [&](const Event&) { ++seen; });
    assert_true(seen == 2, "sink called per event");
    assert_true(res.events.empty(), "scan leaves events empty");
}

static void test_missing_file()
{
    ExtractResult res = extract_log_file("/nonexistent/dir/client.log");
    assert_true(!res.ok(), "missing file fails");
    assert_true(res.kind == ExtractErrorKind::OpenFailed, "open failed kind");
    assert_true(res.events.empty(), "no events on failure");
    assert_true(res.error.find("/nonexistent/dir/client.log") != std::string::npos, "error names path");
}

int main()
{
    test_deadline_set_line();
    test_drop_line();
    test_completion_line();
    test_unmatched_lines();
    test_stream_extraction();
    test_scan_sink();
    test_missing_file();
    std::cout << "log extractor tests: OK" << std::endl;
    return 0;
}
