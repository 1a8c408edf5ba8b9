#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "ds/aggregator.hpp"
#include "ds/extract.hpp"
#include "ds/metrics.hpp"
#include "ds/model.hpp"
#include "ds/options.hpp"

namespace ds {

enum class SourceKind { TextLog, Trace };

struct FileOutcome {
    std::string      path;
    SourceKind       source{SourceKind::TextLog};
    ExtractErrorKind kind{ExtractErrorKind::None};
    std::string      error;
    std::size_t      events{};
    std::size_t      lines_read{};
    std::size_t      lines_matched{};
};

enum class AnalysisStatus { Ok, NothingToAnalyze };

struct AnalysisResult {
    AnalysisStatus                status{AnalysisStatus::Ok};
    StreamAggregator              aggregator;
    AggregateMetrics              metrics;
    std::vector<StreamEvaluation> evaluations;
    std::vector<FileOutcome>      files;
    InputSummary                  inputs;
};

// Extracts every file (up to `jobs` at a time), then applies each file's events
// to one aggregator in order: log files first, then trace files, each in the
// given order. Metrics are computed once over the finalized state.
AnalysisResult analyze_files(const std::vector<std::string> &log_files,
                             const std::vector<std::string> &trace_files,
                             int jobs);

// Discovers inputs per opt and runs analyze_files. NothingToAnalyze when no
// file was found in either directory.
AnalysisResult run_analysis(const Options &opt);

} // namespace ds
