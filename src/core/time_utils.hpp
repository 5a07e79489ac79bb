#pragma once
#include <chrono>
#include <cstdint>

namespace slc {
using MonoClock = std::chrono::steady_clock;

inline int64_t elapsed_ms(MonoClock::time_point since) {
    using namespace std::chrono;
    return duration_cast<milliseconds>(MonoClock::now() - since).count();
}

// Sleep left in a cycle of period_ms that has already run elapsed_ms; never negative.
inline int64_t remaining_ms(int64_t period_ms, int64_t elapsed) {
    int64_t rem = period_ms - elapsed;
    return rem > 0 ? rem : 0;
}
}  // namespace slc
