#pragma once
#include <string>
#include <vector>

#include "../core/logger.hpp"

namespace slc {
struct Options {
    bool debug{false};
    bool silent{false};
    bool show_help{false};
    std::string path = "/dev/log";
    int frequency_s{30};
    int timeout_s{5};
    std::vector<std::string> command;
};

// Parses argv (argv[0] is the program name). On failure returns false and
// fills `err`; `opts` is then unspecified.
bool parse_options(int argc, const char* const* argv, Options& opts, std::string& err);

LogConfig log_config(const Options& opts);

std::string usage(const std::string& prog);
}  // namespace slc
