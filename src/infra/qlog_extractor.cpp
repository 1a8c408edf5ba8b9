#include "ds/qlog_extractor.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstring>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>

#include <json/reader.h>

namespace ds {

namespace {

ExtractResult failure(ExtractErrorKind kind, std::string error)
{
    ExtractResult res{};
    res.kind  = kind;
    res.error = std::move(error);
    return res;
}

bool contains_deadline(std::string type)
{
    std::ranges::transform(type, type.begin(), [](unsigned char c) { return std::tolower(c); });
    return type.find("deadline") != std::string::npos;
}

// Accepts an unsigned integer or a string of digits
std::optional<StreamId> stream_id_of(const Json::Value &v)
{
    if (v.isUInt64()) return v.asUInt64();
    if (v.isString())
    {
        const std::string s = v.asString();
        if (s.empty() || !std::ranges::all_of(s, [](unsigned char c) { return std::isdigit(c); }))
            return std::nullopt;
        try { return static_cast<StreamId>(std::stoull(s)); }
        catch (const std::out_of_range &) { return std::nullopt; }
    }
    return std::nullopt;
}

} // namespace

std::optional<TraceEnvelope> make_envelope(const Json::Value &tuple)
{
    if (!tuple.isArray() || tuple.size() < 2) return std::nullopt;
    const Json::Value &data = tuple[tuple.size() - 1];
    if (!data.isObject()) return std::nullopt;

    TraceEnvelope env{};
    const Json::Value &time = tuple[0u];
    if (time.isNumeric()) env.time = time.asDouble();
    else if (time.isString())
    {
        try { env.time = std::stod(time.asString()); }
        catch (const std::exception &) { env.time = 0.0; }
    }
    // "nan" / "inf" strings have no JSON rendering downstream
    if (!std::isfinite(env.time)) env.time = 0.0;
    env.data = data;
    return env;
}

ExtractResult extract_qlog_events(std::string_view document)
{
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    builder["allowComments"]   = false;
    builder["failIfExtra"]     = true;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errs;
    if (!reader->parse(document.data(), document.data() + document.size(), &root, &errs))
        return failure(ExtractErrorKind::ParseFailed, errs.empty() ? "invalid JSON" : errs);

    if (!root.isObject() || !root["traces"].isArray() || root["traces"].empty())
        return failure(ExtractErrorKind::BadStructure, "missing \"traces\" array");
    const Json::Value &trace = root["traces"][0u];
    if (!trace.isObject() || !trace["events"].isArray())
        return failure(ExtractErrorKind::BadStructure, "missing \"events\" array in traces[0]");

    ExtractResult res{};
    const Json::Value &events = trace["events"];
    for (Json::ArrayIndex i = 0; i < events.size(); ++i)
    {
        auto env = make_envelope(events[i]);
        if (!env)
        {
            return failure(ExtractErrorKind::BadStructure,
                           "event " + std::to_string(i) + " is not a [time, ..., {data}] tuple");
        }
        ++res.lines_read;

        const Json::Value &data   = env->data;
        const Json::Value &type_v = data["type"];
        if (!type_v.isString()) continue;
        const std::string type = type_v.asString();

        bool matched = false;
        if (contains_deadline(type))
        {
            res.events.emplace_back(DeadlineTrace{DeadlineTraceEvent{env->time, type, data}});
            matched = true;
        }
        if (type == "stream_data_blocked")
        {
            if (auto id = stream_id_of(data["stream_id"]))
            {
                res.events.emplace_back(StreamBlocked{*id});
                matched = true;
            }
        }
        if (matched) ++res.lines_matched;
    }
    return res;
}

ExtractResult extract_qlog_file(const std::string &path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return failure(ExtractErrorKind::OpenFailed,
                       "cannot open " + path + ": " + std::strerror(errno));

    std::ostringstream buf;
    buf << in.rdbuf();
    if (in.bad())
        return failure(ExtractErrorKind::ReadFailed, path + ": read error");

    ExtractResult res = extract_qlog_events(buf.str());
    if (!res.ok()) res.error = path + ": " + res.error;
    return res;
}

} // namespace ds
