#include "ds/log_extractor.hpp"

#include <cerrno>
#include <charconv>
#include <cstring>
#include <fstream>
#include <istream>
#include <limits>
#include <string>
#include <vector>

#include "ds/clock.hpp"

namespace ds {

namespace {

using Tokens = std::vector<std::string_view>;

Tokens tokenize(std::string_view line)
{
    Tokens out;
    std::size_t i = 0;
    while (i < line.size())
    {
        while (i < line.size() && (line[i] == ' ' || line[i] == '\t')) ++i;
        const std::size_t start = i;
        while (i < line.size() && line[i] != ' ' && line[i] != '\t') ++i;
        if (i > start) out.push_back(line.substr(start, i - start));
    }
    return out;
}

// Whole token must be digits followed by exactly `suffix`
std::optional<std::uint64_t> number_with_suffix(std::string_view tok, std::string_view suffix = {})
{
    if (tok.size() <= suffix.size() || !tok.ends_with(suffix)) return std::nullopt;
    tok.remove_suffix(suffix.size());
    std::uint64_t v = 0;
    auto [ptr, ec] = std::from_chars(tok.data(), tok.data() + tok.size(), v);
    if (ec != std::errc{} || ptr != tok.data() + tok.size()) return std::nullopt;
    return v;
}

bool completion_word(std::string_view tok)
{
    if (!tok.starts_with("completed")) return false;
    tok.remove_prefix(9);
    return tok.empty() || tok == ":" || tok == "," || tok == "." || tok == "!";
}

// Set deadline on stream <id>: <ms> ms (hard|soft)
std::optional<DeadlineSetLine> match_deadline_set(const Tokens &t, std::size_t i)
{
    if (i + 7 >= t.size()) return std::nullopt;
    if (t[i] != "Set" || t[i + 1] != "deadline" || t[i + 2] != "on" || t[i + 3] != "stream")
        return std::nullopt;
    auto id = number_with_suffix(t[i + 4], ":");
    auto ms = number_with_suffix(t[i + 5]);
    if (!id || !ms || t[i + 6] != "ms") return std::nullopt;
    if (*ms > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) return std::nullopt;

    bool hard = false;
    if (t[i + 7] == "(hard)") hard = true;
    else if (t[i + 7] != "(soft)") return std::nullopt;
    return DeadlineSetLine{*id, static_cast<std::int64_t>(*ms), hard};
}

// Stream <id>: Dropped <n> bytes ... [(gap at offset <off>)]
std::optional<DropLine> match_drop(const Tokens &t, std::size_t i)
{
    if (i + 4 >= t.size()) return std::nullopt;
    if (t[i] != "Stream" || t[i + 2] != "Dropped" || !t[i + 4].starts_with("bytes"))
        return std::nullopt;
    auto id    = number_with_suffix(t[i + 1], ":");
    auto bytes = number_with_suffix(t[i + 3]);
    if (!id || !bytes) return std::nullopt;

    DropLine d{*id, *bytes, std::nullopt};
    for (std::size_t j = i + 5; j + 1 < t.size(); ++j)
    {
        if (t[j] != "offset") continue;
        if (auto off = number_with_suffix(t[j + 1], ")")) d.offset = off;
        else if (auto bare = number_with_suffix(t[j + 1])) d.offset = bare;
        break;
    }
    return d;
}

// Stream <id> completed...
std::optional<CompletionLine> match_completion(const Tokens &t, std::size_t i)
{
    if (i + 2 >= t.size()) return std::nullopt;
    if (t[i] != "Stream" || !completion_word(t[i + 2])) return std::nullopt;
    auto id = number_with_suffix(t[i + 1]);
    if (!id) return std::nullopt;
    return CompletionLine{*id};
}

} // namespace

ClassifiedLine classify_log_line(std::string_view line)
{
    ClassifiedLine out{};
    const Tokens t = tokenize(line);
    for (std::size_t i = 0; i < t.size() && !out.matched(); ++i)
    {
        if (auto set = match_deadline_set(t, i)) out.kind = *set;
        else if (auto d = match_drop(t, i)) out.kind = *d;
        else if (auto c = match_completion(t, i)) out.kind = *c;
    }
    if (out.matched()) out.time = find_bracketed_clock(line).value_or(kSentinelTime);
    return out;
}

std::optional<Event> to_event(const ClassifiedLine &line)
{
    if (const auto *set = std::get_if<DeadlineSetLine>(&line.kind))
        return DeadlineSet{set->stream_id, set->deadline_ms, set->is_hard, line.time};
    if (const auto *d = std::get_if<DropLine>(&line.kind))
        return Drop{d->stream_id, d->bytes, line.time, d->offset};
    if (const auto *c = std::get_if<CompletionLine>(&line.kind))
        return Completed{c->stream_id, line.time};
    return std::nullopt;
}

ExtractResult scan_log_stream(std::istream &in, const EventSink &sink)
{
    ExtractResult res{};
    std::string line;
    while (std::getline(in, line))
    {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        ++res.lines_read;
        auto ev = to_event(classify_log_line(line));
        if (!ev) continue;
        ++res.lines_matched;
        if (sink) sink(*ev);
    }
    if (in.bad())
    {
        res.kind  = ExtractErrorKind::ReadFailed;
        res.error = "read error after line " + std::to_string(res.lines_read);
    }
    return res;
}

ExtractResult extract_log_events(std::istream &in)
{
    std::vector<Event> events;
    ExtractResult res = scan_log_stream(in, [&](const Event &ev) { events.push_back(ev); });
    if (res.ok()) res.events = std::move(events);
    return res;
}

ExtractResult extract_log_file(const std::string &path)
{
    std::ifstream in(path);
    if (!in)
    {
        ExtractResult res{};
        res.kind  = ExtractErrorKind::OpenFailed;
        res.error = "cannot open " + path + ": " + std::strerror(errno);
        return res;
    }
    ExtractResult res = extract_log_events(in);
    if (!res.ok()) res.error = path + ": " + res.error;
    return res;
}

} // namespace ds
