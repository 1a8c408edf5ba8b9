// Deadline-aware stream analyzer (C++23)
// Correlates client text logs with qlog traces and reports per-stream
// deadline compliance, drops and completion.

#include <exception>
#include <print>
#include <string>

#include <spdlog/spdlog.h>

#include "ds/cli.hpp"
#include "ds/files.hpp"
#include "ds/logging.hpp"
#include "ds/options.hpp"
#include "ds/output.hpp"
#include "ds/usecases.hpp"

using namespace ds;

namespace {

constexpr int kExitOk         = 0;
constexpr int kExitUsage      = 1;
constexpr int kExitNoInput    = 2;
constexpr int kExitOutputFail = 3;

} // namespace

int main(int argc, char **argv)
{
    Options opt;
    if (argc <= 1)
    {
        print_usage(argv[0]);
        return kExitOk;
    }
    if (!parse_args(argc, argv, opt))
    {
        return opt.show_help ? kExitOk : kExitUsage;
    }

    init_logging(opt.verbosity);

    AnalysisResult result = run_analysis(opt);
    if (result.status == AnalysisStatus::NothingToAnalyze)
    {
        spdlog::error("nothing to analyze: no input files under {}{}{}",
                      opt.log_dir,
                      opt.qlog_dir.empty() ? "" : " or ",
                      opt.qlog_dir);
        return kExitNoInput;
    }

    const std::string report =
        opt.json
            ? build_report_json(result.aggregator, result.metrics, result.evaluations, result.inputs) + "\n"
            : format_report_text(result.aggregator, result.metrics, result.evaluations, result.inputs);

    try
    {
        if (opt.report_path.empty())
        {
            std::print("{}", report);
        }
        else
        {
            write_text_file(opt.report_path, report);
            spdlog::info("report written to {}", opt.report_path);
        }

        if (!opt.timeline_path.empty())
        {
            write_text_file(opt.timeline_path,
                            build_timeline_json(result.aggregator, result.metrics, result.evaluations) + "\n");
            spdlog::info("timeline data written to {}", opt.timeline_path);
        }
    }
    catch (const std::exception &e)
    {
        spdlog::error("{}", e.what());
        return kExitOutputFail;
    }
    return kExitOk;
}
