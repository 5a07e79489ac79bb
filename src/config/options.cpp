#include "options.hpp"

#include <cctype>
#include <exception>

namespace slc {
namespace {
// Keeps seconds * 1000 inside an int.
const int kMaxSeconds = 1000000;

bool parse_seconds(const std::string& flag, const std::string& text, int& out, std::string& err) {
    size_t pos = 0;
    int v = 0;
    if (!text.empty() && std::isdigit(static_cast<unsigned char>(text[0]))) {
        try {
            v = std::stoi(text, &pos);
        } catch (const std::exception&) {
            pos = 0;
        }
    }
    if (pos == 0 || pos != text.size()) {
        err = flag + " expects an integer number of seconds, got '" + text + "'";
        return false;
    }
    if (v <= 0 || v > kMaxSeconds) {
        err = flag + " must be between 1 and " + std::to_string(kMaxSeconds);
        return false;
    }
    out = v;
    return true;
}
}  // namespace

bool parse_options(int argc, const char* const* argv, Options& opts, std::string& err) {
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (!opts.command.empty() || a == "--" || a.empty() || a[0] != '-' || a == "-") {
            if (a == "--" && opts.command.empty()) ++i;
            for (; i < argc; ++i) opts.command.emplace_back(argv[i]);
            break;
        }

        std::string value;
        bool has_inline = false;
        if (a.rfind("--", 0) == 0) {
            size_t eq = a.find('=');
            if (eq != std::string::npos) {
                value = a.substr(eq + 1);
                a = a.substr(0, eq);
                has_inline = true;
            }
        }
        auto take_value = [&](std::string& out) {
            if (has_inline) {
                out = value;
                return true;
            }
            if (i + 1 >= argc) {
                err = a + " requires a value";
                return false;
            }
            out = argv[++i];
            return true;
        };
        auto no_value = [&]() {
            if (has_inline) err = a + " does not take a value";
            return !has_inline;
        };

        if (a == "--debug" || a == "-d") {
            if (!no_value()) return false;
            opts.debug = true;
        } else if (a == "--silent" || a == "-s") {
            if (!no_value()) return false;
            opts.silent = true;
        } else if (a == "--help" || a == "-h") {
            if (!no_value()) return false;
            opts.show_help = true;
        } else if (a == "--log" || a == "-l") {
            if (!take_value(opts.path)) return false;
            if (opts.path.empty()) {
                err = a + " must not be empty";
                return false;
            }
        } else if (a == "--frequency" || a == "-f") {
            std::string text;
            if (!take_value(text) || !parse_seconds(a, text, opts.frequency_s, err)) return false;
        } else if (a == "--timeout" || a == "-t") {
            std::string text;
            if (!take_value(text) || !parse_seconds(a, text, opts.timeout_s, err)) return false;
        } else {
            err = "unknown option " + a;
            return false;
        }
    }
    if (opts.show_help) return true;
    if (opts.debug && opts.silent) {
        err = "--debug and --silent are mutually exclusive";
        return false;
    }
    if (opts.command.empty()) {
        err = "missing recovery command";
        return false;
    }
    return true;
}

LogConfig log_config(const Options& opts) {
    LogConfig cfg;
    if (opts.debug)
        cfg.level = LogLevel::DEBUG;
    else if (opts.silent)
        cfg.level = LogLevel::WARN;
    return cfg;
}

std::string usage(const std::string& prog) {
    return "Usage: " + prog +
           " [-d|-s] [-l PATH] [-f SECONDS] [-t SECONDS] [--] command [args...]\n"
           "  -d, --debug            verbose logging\n"
           "  -s, --silent           only log warnings and errors\n"
           "  -l, --log PATH         socket to probe (default /dev/log)\n"
           "  -f, --frequency SEC    seconds between probes (default 30)\n"
           "  -t, --timeout SEC      seconds to wait for connect and for write (default 5)\n"
           "  -h, --help             show this help\n"
           "  command                run when the socket is stuck, e.g. systemctl restart rsyslog\n";
}
}  // namespace slc
