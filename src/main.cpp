#include <signal.h>

#include <atomic>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <string>

#include "config/options.hpp"
#include "core/cadence_loop.hpp"
#include "core/logger.hpp"
#include "probes/recovery.hpp"
#include "probes/socket_probe.hpp"

using namespace slc;

namespace {
std::atomic<bool> g_stop{false};

void request_stop(int) {
    g_stop.store(true);
}

// No SA_RESTART: select, nanosleep and waitpid return EINTR so the loop
// notices the request without waiting out the current sleep.
bool install_stop_handlers() {
    struct sigaction sa {};
    sa.sa_handler = request_stop;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    return ::sigaction(SIGINT, &sa, nullptr) == 0 && ::sigaction(SIGTERM, &sa, nullptr) == 0;
}
}  // namespace

int main(int argc, char** argv) {
    std::string prog = argc > 0 ? argv[0] : "syslog-canary";
    Options opts;
    std::string err;
    if (!parse_options(argc, argv, opts, err)) {
        std::cerr << prog << ": " << err << "\n" << usage(prog);
        return 2;
    }
    if (opts.show_help) {
        std::cout << usage(prog);
        return 0;
    }

    Logger log("syslog-canary", log_config(opts));
    if (!install_stop_handlers()) {
        log.error(std::string("sigaction failed: ") + std::strerror(errno));
        return 1;
    }

    CommandRecovery recovery(opts.command, log);
    SocketTarget target{opts.path, opts.timeout_s * 1000};
    log.info("probing " + target.path + " every " + std::to_string(opts.frequency_s) +
             "s (timeout " + std::to_string(opts.timeout_s) + "s), recovery: " +
             recovery.command_line());

    CadenceLoop loop(opts.frequency_s * 1000, log);
    uint64_t cycles = loop.run(
        [&]() {
            ProbeOutcome o = probe_socket(target, recovery, log);
            if (o != ProbeOutcome::HEALTHY) log.info(std::string("probe result: ") + outcome_name(o));
        },
        g_stop);

    log.info("interrupted after " + std::to_string(cycles) + " probes, exiting");
    return 0;
}
