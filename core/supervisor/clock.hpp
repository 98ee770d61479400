#pragma once

#include <chrono>

namespace minekeeper {
namespace supervisor {

// Time source for the supervision loop. Injected so tests can run
// multi-hour schedules instantly.
class Clock {
public:
    using time_point = std::chrono::steady_clock::time_point;
    using duration = std::chrono::steady_clock::duration;

    virtual ~Clock() = default;

    virtual time_point now() const = 0;

    // Block the calling thread. Returns false if the wait was cut short by a shutdown request.
    virtual bool sleep_for(duration d) = 0;
};

// Real clock. Sleeps in short slices so a SIGINT/SIGTERM is noticed promptly.
class SystemClock : public Clock {
public:
    time_point now() const override { return std::chrono::steady_clock::now(); }
    bool sleep_for(duration d) override;
};

}  // namespace supervisor
}  // namespace minekeeper
