#pragma once

#include "result.hpp"
#include "handler.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace ydispatch {

class Subscription;
using SubscriptionPtr = std::shared_ptr<const Subscription>;

// Handler registered under a namespace, optionally filtered by event code.
// Never mutated after construction: changing priority or namespace means
// remove and add again.
class Subscription {
public:
    static Result<SubscriptionPtr> create(
        std::string code,
        std::optional<std::string> event_code,
        Handler handler,
        std::string ns,
        bool persistent,
        int priority
    );

    const std::string& code() const { return _code; }
    const std::optional<std::string>& event_code() const { return _event_code; }
    const Handler& handler() const { return _handler; }
    const std::string& ns() const { return _ns; }
    bool persistent() const { return _persistent; }
    int priority() const { return _priority; }

    // No event filter: fires for every event dispatched to the namespace
    bool namespace_wide() const { return !_event_code.has_value(); }

    // Registration order, assigned by the registry on insert
    uint64_t sequence() const { return _sequence; }
    SubscriptionPtr with_sequence(uint64_t sequence) const;

    bool operator==(const Subscription& other) const { return _code == other._code; }

    std::string to_string() const;

private:
    Subscription(std::string code, std::optional<std::string> event_code, Handler handler,
                 std::string ns, bool persistent, int priority, uint64_t sequence)
        : _code(std::move(code)), _event_code(std::move(event_code)), _handler(std::move(handler)),
          _ns(std::move(ns)), _persistent(persistent), _priority(priority), _sequence(sequence) {}

    std::string _code;
    std::optional<std::string> _event_code;
    Handler _handler;
    std::string _ns;
    bool _persistent;
    int _priority;
    uint64_t _sequence;
};

} // namespace ydispatch
