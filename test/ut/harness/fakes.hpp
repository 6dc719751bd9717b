#pragma once

#include "ydispatch/clock.hpp"
#include "ydispatch/event.hpp"
#include "ydispatch/id_generator.hpp"
#include <atomic>
#include <deque>
#include <mutex>
#include <string>

namespace ydispatch::test {

// Clock that moves forward by a fixed step on every read
class SteppingClock : public Clock {
public:
    explicit SteppingClock(duration step = std::chrono::milliseconds(5)) : _step(step) {}

    time_point now() const override {
        std::lock_guard<std::mutex> lock(_mutex);
        _current += _step;
        return _current;
    }

private:
    mutable std::mutex _mutex;
    mutable time_point _current{};
    duration _step;
};

// Clock that runs backwards, to check duration clamping
class BackwardsClock : public Clock {
public:
    time_point now() const override {
        std::lock_guard<std::mutex> lock(_mutex);
        _current -= std::chrono::milliseconds(1);
        return _current;
    }

private:
    mutable std::mutex _mutex;
    mutable time_point _current = time_point{} + std::chrono::hours(1);
};

// Hands out scripted codes first, then falls back to unique ones
class ScriptedIdGenerator : public IdGenerator {
public:
    explicit ScriptedIdGenerator(std::deque<std::string> codes) : _codes(std::move(codes)) {}

    uint64_t next_id() override { return _next_id++; }

    std::string next_code() override {
        std::lock_guard<std::mutex> lock(_mutex);
        if (!_codes.empty()) {
            auto code = _codes.front();
            _codes.pop_front();
            return code;
        }
        return "generated-" + std::to_string(_next_id++);
    }

private:
    std::mutex _mutex;
    std::deque<std::string> _codes;
    std::atomic<uint64_t> _next_id{100};
};

inline EventPtr make_event(const std::string& name, Dict data = {}) {
    auto res = Event::create(name, std::move(data));
    return res ? *res : nullptr;
}

} // namespace ydispatch::test
