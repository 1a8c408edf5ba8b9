#include "ds/usecases.hpp"

#include <spdlog/spdlog.h>

#include "ds/concurrency.hpp"
#include "ds/files.hpp"
#include "ds/log_extractor.hpp"
#include "ds/qlog_extractor.hpp"

namespace ds {

namespace {

struct PendingFile {
    std::string path;
    SourceKind  source{SourceKind::TextLog};
};

const char *source_str(SourceKind s)
{
    return s == SourceKind::TextLog ? "log" : "trace";
}

} // namespace

AnalysisResult analyze_files(const std::vector<std::string> &log_files,
                             const std::vector<std::string> &trace_files,
                             int jobs)
{
    std::vector<PendingFile> pending;
    pending.reserve(log_files.size() + trace_files.size());
    for (const auto &p : log_files) pending.push_back({p, SourceKind::TextLog});
    for (const auto &p : trace_files) pending.push_back({p, SourceKind::Trace});

    AnalysisResult out{};
    if (pending.empty())
    {
        out.status = AnalysisStatus::NothingToAnalyze;
        return out;
    }

    // Extraction only reads its own file, so it may run in parallel.
    std::vector<ExtractResult> extracted(pending.size());
    for_each_index_batched(pending.size(), jobs, [&](std::size_t i)
    {
        const PendingFile &f = pending[i];
        extracted[i] = f.source == SourceKind::TextLog ? extract_log_file(f.path)
                                                       : extract_qlog_file(f.path);
    });

    // The aggregator has a single writer: apply per file, in discovery order.
    std::size_t applied = 0;
    for (std::size_t i = 0; i < pending.size(); ++i)
    {
        const PendingFile &f = pending[i];
        ExtractResult &res   = extracted[i];

        FileOutcome fo{};
        fo.path          = f.path;
        fo.source        = f.source;
        fo.kind          = res.kind;
        fo.error         = res.error;
        fo.events        = res.events.size();
        fo.lines_read    = res.lines_read;
        fo.lines_matched = res.lines_matched;

        if (f.source == SourceKind::TextLog) ++out.inputs.log_files;
        else ++out.inputs.trace_files;

        if (!res.ok())
        {
            if (f.source == SourceKind::TextLog) ++out.inputs.log_failed;
            else ++out.inputs.trace_failed;
            spdlog::warn("skipping {} file ({}): {}", source_str(f.source),
                         extract_error_str(res.kind), res.error);
        }
        else
        {
            spdlog::debug("{}: {} {} read, {} matched, {} events", f.path,
                          res.lines_read,
                          f.source == SourceKind::TextLog ? "lines" : "trace events",
                          res.lines_matched, res.events.size());
            out.aggregator.apply_all(res.events);
            applied += res.events.size();
        }
        out.files.push_back(std::move(fo));
    }

    out.aggregator.finalize();
    out.metrics     = compute_metrics(out.aggregator);
    out.evaluations = evaluate_streams(out.aggregator.records());

    spdlog::info("processed {} log and {} trace file(s), applied {} events to {} stream(s)",
                 out.inputs.log_files, out.inputs.trace_files, applied,
                 out.metrics.total_streams);
    return out;
}

AnalysisResult run_analysis(const Options &opt)
{
    const auto logs = discover_files(opt.log_dir, opt.log_patterns);
    if (logs.empty()) spdlog::warn("no log files found in {}", opt.log_dir);

    std::vector<std::string> traces;
    if (!opt.qlog_dir.empty())
    {
        traces = discover_files(opt.qlog_dir, opt.qlog_patterns);
        if (traces.empty()) spdlog::warn("no trace files found in {}", opt.qlog_dir);
    }

    spdlog::debug("discovered {} log file(s), {} trace file(s)", logs.size(), traces.size());
    return analyze_files(logs, traces, opt.jobs);
}

} // namespace ds
