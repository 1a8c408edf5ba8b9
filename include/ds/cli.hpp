#pragma once

#include "ds/options.hpp"

namespace ds {

void print_usage(const char *prog);

// Fills opt from argv. Returns false on -h/--help (opt.show_help set) or on any
// usage error, after printing a one-line message.
bool parse_args(int argc, char **argv, Options &opt);

} // namespace ds
