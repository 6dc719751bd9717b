#pragma once

#include <chrono>
#include <memory>

namespace ydispatch {

// Timestamp source for notifications. Only ordering matters, so the
// default is the monotonic clock.
class Clock {
public:
    using time_point = std::chrono::steady_clock::time_point;
    using duration = std::chrono::steady_clock::duration;

    virtual ~Clock() = default;
    virtual time_point now() const = 0;
};

using ClockPtr = std::shared_ptr<Clock>;

class SystemClock : public Clock {
public:
    time_point now() const override { return std::chrono::steady_clock::now(); }
};

inline ClockPtr default_clock() {
    static ClockPtr clock = std::make_shared<SystemClock>();
    return clock;
}

} // namespace ydispatch
