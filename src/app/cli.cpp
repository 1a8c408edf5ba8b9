#include "ds/cli.hpp"

#include <exception>
#include <optional>
#include <print>
#include <string>
#include <string_view>
#include <vector>

#include "ds/files.hpp"

using namespace std::string_view_literals;

namespace ds {

void print_usage(const char *prog)
{
    std::println("Deadline-aware stream analyzer (client logs + qlog traces)");
    std::println("Usage: {} [options] <log_dir>", prog);
    std::println("Options:");
    std::println(
        "  --qlog-dir DIR       Directory of qlog trace documents (optional)");
    std::println(
        "  --log-pattern LIST   Comma-separated globs for logs (default: *.log,*.out)");
    std::println(
        "  --qlog-pattern LIST  Comma-separated globs for traces (default: *.qlog,*.json)");
    std::println(
        "  --report FILE        Write the report to FILE (default: stdout)");
    std::println(
        "  --timeline FILE      Write timeline data (JSON) for the chart renderer");
    std::println("  --json               Render the report as JSON");
    std::println(
        "  --jobs N             Number of files extracted in parallel (default: 1)");
    std::println("  --parallel N         Alias of --jobs");
    std::println("  -v, --verbose        Debug diagnostics on stderr");
    std::println("  -q, --quiet          Only errors on stderr");
    std::println("  -h, --help           Show this help");
    std::println("");
    std::println("Examples:");
    std::println("  {} logs/", prog);
    std::println(
        "  {} --qlog-dir qlogs/ --report report.txt --timeline timeline.json logs/",
        prog);
}

namespace {

// "--name VALUE" or "--name=VALUE"; nullopt (after a message) on misuse
std::optional<std::string> option_value(std::string_view a,
                                        std::string_view name,
                                        int &i,
                                        int argc,
                                        char **argv)
{
    if (a == name)
    {
        if (i + 1 < argc) return std::string(argv[++i]);
    }
    else if (a.size() > name.size() + 1 && a[name.size()] == '=')
    {
        return std::string(a.substr(name.size() + 1));
    }
    std::println("invalid {} usage", name);
    return std::nullopt;
}

bool matches_option(std::string_view a, std::string_view name)
{
    return a == name || (a.starts_with(name) && a.size() > name.size() && a[name.size()] == '=');
}

} // namespace

bool parse_args(int argc, char **argv, Options &opt)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string_view a = argv[i];
        if (a == "-h"sv || a == "--help"sv)
        {
            print_usage(argv[0]);
            opt.show_help = true;
            return false;
        }
        if (a == "-v"sv || a == "--verbose"sv)
        {
            opt.verbosity = Verbosity::Verbose;
        }
        else if (a == "-q"sv || a == "--quiet"sv)
        {
            opt.verbosity = Verbosity::Quiet;
        }
        else if (a == "--json"sv)
        {
            opt.json = true;
        }
        else if (matches_option(a, "--qlog-dir"))
        {
            auto v = option_value(a, "--qlog-dir", i, argc, argv);
            if (!v) return false;
            opt.qlog_dir = std::move(*v);
        }
        else if (matches_option(a, "--log-pattern") || matches_option(a, "--qlog-pattern"))
        {
            const bool is_log = a.starts_with("--log-pattern");
            auto v = option_value(a, is_log ? "--log-pattern" : "--qlog-pattern", i, argc, argv);
            if (!v) return false;
            auto patterns = split_patterns(*v);
            if (patterns.empty())
            {
                std::println("empty pattern list: {}", *v);
                return false;
            }
            (is_log ? opt.log_patterns : opt.qlog_patterns) = std::move(patterns);
        }
        else if (matches_option(a, "--report"))
        {
            auto v = option_value(a, "--report", i, argc, argv);
            if (!v) return false;
            opt.report_path = std::move(*v);
        }
        else if (matches_option(a, "--timeline"))
        {
            auto v = option_value(a, "--timeline", i, argc, argv);
            if (!v) return false;
            opt.timeline_path = std::move(*v);
        }
        else if (matches_option(a, "--jobs") || matches_option(a, "--parallel"))
        {
            auto v = option_value(a, a.starts_with("--jobs") ? "--jobs" : "--parallel", i, argc, argv);
            if (!v) return false;
            try { opt.jobs = std::stoi(*v); }
            catch (const std::exception &)
            {
                std::println("invalid jobs: {}", *v);
                return false;
            }
            if (opt.jobs <= 0) opt.jobs = 1;
        }
        else if (!a.empty() && a[0] == '-')
        {
            std::println("unknown option: {}", a);
            return false;
        }
        else if (opt.log_dir.empty())
        {
            opt.log_dir = std::string(a);
        }
        else
        {
            std::println("unexpected argument: {}", a);
            return false;
        }
    }
    if (opt.log_dir.empty())
    {
        std::println("missing <log_dir>");
        return false;
    }
    return true;
}

} // namespace ds
