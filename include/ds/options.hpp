#pragma once

#include <string>
#include <vector>

namespace ds
{
enum class Verbosity { Quiet, Normal, Verbose };

struct Options
{
    std::string log_dir;                  // directory of client text logs
    std::string qlog_dir;                 // directory of trace documents (optional)
    std::vector<std::string> log_patterns{"*.log", "*.out"};
    std::vector<std::string> qlog_patterns{"*.qlog", "*.json"};
    std::string report_path;              // empty = stdout
    std::string timeline_path;            // empty = no timeline document
    bool json = false;                    // JSON report instead of text
    int jobs = 1;                         // files extracted concurrently
    Verbosity verbosity = Verbosity::Normal;
    bool show_help = false;
};
} // namespace ds
