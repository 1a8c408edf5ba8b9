#pragma once

#include "ds/options.hpp"

namespace ds {

inline constexpr const char *kLoggerName = "deadlinescope";

// Installs the stderr logger as spdlog's default. Safe to call more than once.
void init_logging(Verbosity verbosity);

} // namespace ds
