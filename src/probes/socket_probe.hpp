#pragma once
#include <string>

#include "../core/logger.hpp"
#include "../core/unix_socket.hpp"
#include "recovery.hpp"

namespace slc {
struct SocketTarget {
    std::string path;
    int timeout_ms;
};

enum class ProbeOutcome { HEALTHY, RECOVERED_AFTER_CONNECT_TIMEOUT, RECOVERED_AFTER_WRITE_TIMEOUT };

const char* outcome_name(ProbeOutcome o);

// Connects a fresh non-blocking datagram socket to t.path and checks that a
// write could be queued within t.timeout_ms. A timeout in either phase runs
// `recovery` once and is reported in the outcome; any other failure throws
// (std::system_error for OS errors, whatever `recovery` throws).
ProbeOutcome probe_socket(const SocketTarget& t, Recovery& recovery, const Logger& log);

// The same check over an already created, non-blocking channel.
ProbeOutcome check_channel(const SocketTarget& t, DatagramChannel& chan, Recovery& recovery,
                           const Logger& log);
}  // namespace slc
