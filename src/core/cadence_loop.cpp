#include "cadence_loop.hpp"

#include <time.h>

#include <cerrno>
#include <cstring>
#include <exception>
#include <string>
#include <system_error>
#include <typeinfo>

#include "time_utils.hpp"

namespace slc {
CadenceLoop::CadenceLoop(int period_ms, const Logger& log) : period_ms_(period_ms), log_(log) {}

uint64_t CadenceLoop::run(const std::function<void()>& cycle, const std::atomic<bool>& stop) {
    uint64_t cycles = 0;
    while (!stop.load()) {
        auto start = MonoClock::now();
        ++cycles;
        try {
            cycle();
        } catch (const std::exception& e) {
            report(e, stop.load());
        } catch (...) {
            log_.error("probe cycle failed: non-standard exception");
        }
        if (stop.load()) break;
        int64_t rem = remaining_ms(period_ms_, elapsed_ms(start));
        if (rem == 0) {
            log_.debug("cycle overran period of " + std::to_string(period_ms_) + "ms");
            continue;
        }
        if (!sleep_ms(rem, stop)) break;
    }
    return cycles;
}

bool CadenceLoop::sleep_ms(int64_t ms, const std::atomic<bool>& stop) {
    timespec req{};
    req.tv_sec = static_cast<time_t>(ms / 1000);
    req.tv_nsec = static_cast<long>((ms % 1000) * 1000000);
    timespec rem{};
    while (::nanosleep(&req, &rem) < 0) {
        if (errno != EINTR) {
            log_.error(std::string("nanosleep failed: ") + std::strerror(errno));
            break;
        }
        if (stop.load()) return false;
        req = rem;
    }
    return !stop.load();
}

void CadenceLoop::report(const std::exception& e, bool stopping) {
    auto* se = dynamic_cast<const std::system_error*>(&e);
    if (stopping && se && se->code() == std::errc::interrupted) {
        log_.debug(std::string("cycle interrupted: ") + e.what());
        return;
    }
    log_.error(std::string("probe cycle failed: ") + e.what());
    report_detail(e, 0);
}

void CadenceLoop::report_detail(const std::exception& e, int depth) {
    std::string prefix = depth == 0 ? "" : "caused by: ";
    if (depth > 0) log_.debug(prefix + e.what());
    if (auto* se = dynamic_cast<const std::system_error*>(&e))
        log_.debug(prefix + "errno " + std::to_string(se->code().value()) + " (" +
                   se->code().category().name() + ")");
    log_.debug(prefix + "exception type " + typeid(e).name());
    try {
        std::rethrow_if_nested(e);
    } catch (const std::exception& inner) {
        report_detail(inner, depth + 1);
    } catch (...) {
        log_.debug("caused by: non-standard exception");
    }
}
}  // namespace slc
