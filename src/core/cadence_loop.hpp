#pragma once
#include <atomic>
#include <cstdint>
#include <exception>
#include <functional>

#include "logger.hpp"

namespace slc {
// Runs a cycle every period_ms measured from cycle start to cycle start. A
// cycle that overruns the period is followed immediately by the next one.
class CadenceLoop {
   public:
    CadenceLoop(int period_ms, const Logger& log);

    // Returns once `stop` is set; the flag is checked between cycles and
    // after an interrupted sleep. Exceptions from `cycle` are logged, with
    // EINTR while stopping kept at debug level.
    uint64_t run(const std::function<void()>& cycle, const std::atomic<bool>& stop);

   private:
    int period_ms_;
    const Logger& log_;
    bool sleep_ms(int64_t ms, const std::atomic<bool>& stop);
    void report(const std::exception& e, bool stopping);
    // Logs e and its nested causes at debug level.
    void report_detail(const std::exception& e, int depth);
};
}  // namespace slc
