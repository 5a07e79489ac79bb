#include "socket_probe.hpp"

#include <cerrno>
#include <system_error>

#include "../core/time_utils.hpp"

namespace slc {
const char* outcome_name(ProbeOutcome o) {
    switch (o) {
        case ProbeOutcome::HEALTHY: return "healthy";
        case ProbeOutcome::RECOVERED_AFTER_CONNECT_TIMEOUT: return "recovered_after_connect_timeout";
        case ProbeOutcome::RECOVERED_AFTER_WRITE_TIMEOUT: return "recovered_after_write_timeout";
    }
    return "?";
}

ProbeOutcome probe_socket(const SocketTarget& t, Recovery& recovery, const Logger& log) {
    UnixSocket sock = UnixSocket::open_datagram();
    sock.set_nonblocking();
    return check_channel(t, sock, recovery, log);
}

ProbeOutcome check_channel(const SocketTarget& t, DatagramChannel& sock, Recovery& recovery,
                           const Logger& log) {
    auto start = MonoClock::now();
    int err = sock.connect(t.path);
    if (err == EINPROGRESS) {
        if (!sock.wait_writable(t.timeout_ms)) {
            log.warn("connect to " + t.path + " timed out after " + std::to_string(t.timeout_ms) +
                     "ms");
            recovery.invoke();
            return ProbeOutcome::RECOVERED_AFTER_CONNECT_TIMEOUT;
        }
        err = sock.pending_error();
    }
    if (err != 0) throw std::system_error(err, std::generic_category(), "connect " + t.path);

    if (!sock.wait_writable(t.timeout_ms)) {
        log.warn("write to " + t.path + " timed out after " + std::to_string(t.timeout_ms) + "ms");
        recovery.invoke();
        return ProbeOutcome::RECOVERED_AFTER_WRITE_TIMEOUT;
    }
    log.debug(t.path + " writable after " + std::to_string(elapsed_ms(start)) + "ms");
    return ProbeOutcome::HEALTHY;
}
}  // namespace slc
