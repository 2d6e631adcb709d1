#pragma once

#include <chrono>

// Time source for every polling loop. Production code uses SystemClock;
// tests substitute a virtual clock so waits cost nothing.
class Clock {
public:
    using time_point = std::chrono::steady_clock::time_point;
    using duration = std::chrono::milliseconds;

    virtual ~Clock() = default;

    virtual time_point now() const = 0;
    virtual void sleep_for(duration d) = 0;
};

class SystemClock : public Clock {
public:
    time_point now() const override;
    void sleep_for(duration d) override;
};

// Process-wide real clock.
Clock& system_clock();

// A wall-clock budget computed once and checked on each poll.
class Deadline {
public:
    Deadline(const Clock& clock, Clock::duration budget);

    bool expired() const;
    Clock::duration elapsed() const;
    Clock::duration remaining() const;

private:
    const Clock& clock_;
    Clock::time_point start_;
    Clock::duration budget_;
};

inline Clock::duration ms_between(Clock::time_point from, Clock::time_point to) {
    return std::chrono::duration_cast<Clock::duration>(to - from);
}
