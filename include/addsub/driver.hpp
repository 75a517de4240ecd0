#pragma once
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>
#include "addsub/result.hpp"

namespace addsub {

struct DriverOptions {
    bool trace{false}; // log each pipeline stage to the error stream
    bool quiet{false}; // print the bare value only
    bool help{false};
    std::vector<std::string> expressions{}; // empty: read lines from input
};

Result<DriverOptions, std::string> parse_args(int argc, const char* const* argv);

void print_usage(std::ostream& os, std::string_view prog);

// 0 if every expression evaluated, 1 otherwise.
int run_driver(const DriverOptions& opts, std::istream& in, std::ostream& out, std::ostream& err);

// Whole program: 2 on a usage error, 0 for --help, else run_driver().
int run_cli(int argc, const char* const* argv, std::istream& in, std::ostream& out, std::ostream& err);

} // namespace addsub
