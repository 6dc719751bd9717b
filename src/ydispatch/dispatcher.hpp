#pragma once

#include "result.hpp"
#include "types.hpp"
#include "object.hpp"
#include "clock.hpp"
#include "config.hpp"
#include "error_log.hpp"
#include "event.hpp"
#include "handler.hpp"
#include "id_generator.hpp"
#include "notification.hpp"
#include "registry.hpp"
#include "subscription.hpp"
#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ydispatch {

// A scalar is broadcast to every item, a vector is zipped positionally
template<typename T>
using PerItem = std::variant<T, std::vector<T>>;

// Input of Dispatcher::bulk_subscribe
struct BulkSubscription {
    std::vector<std::string> events;
    PerItem<Handler> handlers = std::vector<Handler>{};
    PerItem<std::string> namespaces = std::string(GLOBAL_NAMESPACE);
    PerItem<bool> persistents = false;
    PerItem<int> priorities = 0;
};

// Dispatcher - subscription surface and dispatch engine over one Registry
//
// All methods are safe to call concurrently, including from inside a
// handler: handlers run on the dispatching thread after the registry lock
// has been released.
class Dispatcher : public Object {
public:
    static Result<std::shared_ptr<Dispatcher>> create(
        Config config = {},
        IdGeneratorPtr id_generator = default_id_generator(),
        ClockPtr clock = default_clock()
    );

    ~Dispatcher() override;

    // Subscribe

    Result<std::string> subscribe(
        const std::string& event_code,
        const Handler& handler,
        const std::string& ns = GLOBAL_NAMESPACE,
        bool persistent = false,
        int priority = 0
    );

    Result<std::string> subscribe(
        const Event& event,
        const Handler& handler,
        const std::string& ns = GLOBAL_NAMESPACE,
        bool persistent = false,
        int priority = 0
    );

    // No event filter: the handler runs for every event dispatched to ns
    Result<std::string> subscribe_namespace(
        const Handler& handler,
        const std::string& ns = GLOBAL_NAMESPACE,
        bool persistent = false,
        int priority = 0
    );

    // Lengths are checked for every parameter before anything is registered.
    // Items are then subscribed in order; the first invalid item stops the
    // batch and the items before it stay registered.
    Result<std::vector<std::string>> bulk_subscribe(const BulkSubscription& bulk);

    // Unsubscribe

    // Removes the earliest subscription of handler to event_code in ns
    Result<void> unsubscribe(
        const std::string& event_code,
        const Handler& handler,
        const std::string& ns = GLOBAL_NAMESPACE
    );

    Result<void> unsubscribe(
        const Event& event,
        const Handler& handler,
        const std::string& ns = GLOBAL_NAMESPACE
    );

    // Removes the earliest namespace-wide subscription of handler in ns
    Result<void> unsubscribe_namespace(const Handler& handler, const std::string& ns = GLOBAL_NAMESPACE);

    Result<void> unsubscribe_by_code(const std::string& code);

    // Bulk removals return how many subscriptions went away
    size_t unsubscribe_by_function(const Handler& handler, const std::optional<std::string>& ns = std::nullopt);
    size_t unsubscribe_by_namespace(const std::string& ns);
    size_t unsubscribe_by_event(const std::string& event_code);
    size_t unsubscribe_all();

    // Introspection

    std::vector<SubscriptionPtr> get_subscriptions_by_event(const std::string& event_code) const;
    std::vector<SubscriptionPtr> get_subscriptions_by_function(const Handler& handler) const;
    std::vector<SubscriptionPtr> get_subscriptions_by_namespace(const std::string& ns) const;
    Result<SubscriptionPtr> get_subscription_by_code(const std::string& code) const;

    size_t subscription_count() const;
    std::vector<std::string> namespaces() const;

    // Dispatch

    // Runs every matching handler, highest priority first, ties in
    // registration order. Handler failures are collected into the
    // notification; only a malformed event or namespace fails the call.
    Result<NotificationPtr> dispatch(
        const EventPtr& event,
        const std::string& ns = GLOBAL_NAMESPACE,
        const Args& args = {}
    );

    const Config& config() const { return _config; }
    const ErrorLog& error_log() const { return _error_log; }
    ErrorLog& error_log() { return _error_log; }

    Result<void> init() override;
    Result<void> dispose() override;

private:
    Dispatcher(Config config, IdGeneratorPtr id_generator, ClockPtr clock);

    Result<std::string> _subscribe(
        std::optional<std::string> event_code,
        const Handler& handler,
        const std::string& ns,
        bool persistent,
        int priority
    );

    Result<void> _unsubscribe_first(
        const std::optional<std::string>& event_code,
        const Handler& handler,
        const std::string& ns
    );

    // Converts a returned error or a thrown exception into an Error
    static Result<Value> _invoke(const Subscription& subscription, const Event& event, const Args& args);

    Config _config;
    IdGeneratorPtr _id_generator;
    ClockPtr _clock;
    // Set once by init() and never reset; dispose() only empties it
    RegistryPtr _registry;
    std::atomic<bool> _disposed{false};
    ErrorLog _error_log;
};

using DispatcherPtr = std::shared_ptr<Dispatcher>;

} // namespace ydispatch
