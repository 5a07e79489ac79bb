#include <cassert>
#include <string>
#include <vector>

#include "../src/config/options.hpp"

static bool parse(std::vector<const char*> args, slc::Options& opts, std::string& err) {
    args.insert(args.begin(), "syslog-canary");
    return slc::parse_options(static_cast<int>(args.size()), args.data(), opts, err);
}

int main() {
    std::string err;
    {
        slc::Options o;
        if (!parse({"systemctl", "restart", "rsyslog"}, o, err)) return 1;
        if (o.path != "/dev/log" || o.frequency_s != 30 || o.timeout_s != 5) return 2;
        if (o.debug || o.silent) return 3;
        if (o.command != std::vector<std::string>{"systemctl", "restart", "rsyslog"}) return 4;
        assert(slc::log_config(o).level == slc::LogLevel::INFO);
    }
    {
        slc::Options o;
        if (!parse({"-d", "-l", "/run/systemd/journal/dev-log", "-f", "10", "-t", "2", "restart-logger"},
                   o, err))
            return 5;
        if (!o.debug || o.path != "/run/systemd/journal/dev-log") return 6;
        if (o.frequency_s != 10 || o.timeout_s != 2) return 7;
        assert(slc::log_config(o).level == slc::LogLevel::DEBUG);
    }
    {
        slc::Options o;
        if (!parse({"--silent", "--log=/tmp/sock", "--frequency=7", "--timeout", "3", "cmd"}, o, err))
            return 8;
        if (!o.silent || o.path != "/tmp/sock" || o.frequency_s != 7 || o.timeout_s != 3) return 9;
        assert(slc::log_config(o).level == slc::LogLevel::WARN);
    }
    {
        // everything after the first positional belongs to the command
        slc::Options o;
        if (!parse({"-s", "sh", "-c", "kill -HUP 1", "-d"}, o, err)) return 10;
        if (o.debug) return 11;
        if (o.command != std::vector<std::string>{"sh", "-c", "kill -HUP 1", "-d"}) return 12;
    }
    {
        slc::Options o;
        if (!parse({"--", "-weird-name", "x"}, o, err)) return 13;
        if (o.command != std::vector<std::string>{"-weird-name", "x"}) return 14;
    }
    {
        slc::Options o;
        if (parse({"-d", "-s", "cmd"}, o, err)) return 15;
        if (err.find("mutually exclusive") == std::string::npos) return 16;
    }
    {
        slc::Options o;
        if (parse({"-d"}, o, err)) return 17;
        if (err != "missing recovery command") return 18;
    }
    {
        slc::Options o;
        if (parse({"-f", "0", "cmd"}, o, err)) return 19;
        slc::Options o2;
        if (parse({"-t", "abc", "cmd"}, o2, err)) return 20;
        slc::Options o3;
        if (parse({"-t", "5s", "cmd"}, o3, err)) return 21;
        slc::Options o4;
        if (parse({"-f"}, o4, err)) return 22;
        slc::Options o5;
        if (parse({"--bogus", "cmd"}, o5, err)) return 23;
        slc::Options o6;
        if (parse({"--debug=yes", "cmd"}, o6, err)) return 24;
        slc::Options o7;
        if (parse({"-t", " 5", "cmd"}, o7, err)) return 26;
        slc::Options o8;
        if (parse({"--frequency=+5", "cmd"}, o8, err)) return 27;
    }
    {
        slc::Options o;
        if (!parse({"-h"}, o, err) || !o.show_help) return 25;
    }
    return 0;
}
