#include "subscription.hpp"

namespace ydispatch {

Result<SubscriptionPtr> Subscription::create(
    std::string code,
    std::optional<std::string> event_code,
    Handler handler,
    std::string ns,
    bool persistent,
    int priority
) {
    if (!handler.valid()) {
        return Err<SubscriptionPtr>(ErrorKind::InvalidHandler,
            "Subscription::create: handler '" + handler.name() + "' is not callable");
    }
    if (code.empty()) {
        return Err<SubscriptionPtr>(ErrorKind::Configuration, "Subscription::create: empty code");
    }
    if (ns.empty()) {
        return Err<SubscriptionPtr>(ErrorKind::Configuration, "Subscription::create: empty namespace");
    }
    if (event_code && event_code->empty()) {
        return Err<SubscriptionPtr>(ErrorKind::Configuration, "Subscription::create: empty event code");
    }

    return SubscriptionPtr(new Subscription(
        std::move(code), std::move(event_code), std::move(handler),
        std::move(ns), persistent, priority, 0));
}

SubscriptionPtr Subscription::with_sequence(uint64_t sequence) const {
    return SubscriptionPtr(new Subscription(
        _code, _event_code, _handler, _ns, _persistent, _priority, sequence));
}

std::string Subscription::to_string() const {
    return "Subscription(code=" + _code +
           ", event=" + (namespace_wide() ? std::string("*") : *_event_code) +
           ", handler=" + _handler.name() +
           ", namespace=" + _ns +
           ", persistent=" + (_persistent ? "true" : "false") +
           ", priority=" + std::to_string(_priority) + ")";
}

} // namespace ydispatch
