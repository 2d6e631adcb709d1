#include "clock.hpp"
#include <platform/platform.hpp>

Clock::time_point SystemClock::now() const {
    return std::chrono::steady_clock::now();
}

void SystemClock::sleep_for(duration d) {
    platform::sleep_ms(static_cast<int>(d.count()));
}

Clock& system_clock() {
    static SystemClock clock;
    return clock;
}

Deadline::Deadline(const Clock& clock, Clock::duration budget)
    : clock_(clock), start_(clock.now()), budget_(budget) {}

bool Deadline::expired() const {
    return elapsed() >= budget_;
}

Clock::duration Deadline::elapsed() const {
    return ms_between(start_, clock_.now());
}

Clock::duration Deadline::remaining() const {
    auto left = budget_ - elapsed();
    return left.count() > 0 ? left : Clock::duration(0);
}
