#include "ds/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace ds {

void init_logging(Verbosity verbosity)
{
    auto logger = spdlog::get(kLoggerName);
    if (!logger)
    {
        logger = spdlog::stderr_color_mt(kLoggerName);
        logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    }

    switch (verbosity)
    {
        case Verbosity::Quiet: logger->set_level(spdlog::level::err); break;
        case Verbosity::Normal: logger->set_level(spdlog::level::info); break;
        case Verbosity::Verbose: logger->set_level(spdlog::level::debug); break;
    }
    spdlog::set_default_logger(logger);
}

} // namespace ds
