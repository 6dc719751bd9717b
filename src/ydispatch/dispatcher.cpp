#include "dispatcher.hpp"
#include <algorithm>
#include <exception>
#include <ytrace/ytrace.hpp>

namespace ydispatch {

namespace {

template<typename T>
size_t per_item_size(const PerItem<T>& v) {
    if (auto list = std::get_if<std::vector<T>>(&v)) {
        return list->size();
    }
    return 0;
}

template<typename T>
bool is_scalar(const PerItem<T>& v) {
    return std::holds_alternative<T>(v);
}

template<typename T>
T per_item_at(const PerItem<T>& v, size_t i) {
    if (auto scalar = std::get_if<T>(&v)) {
        return *scalar;
    }
    return std::get<std::vector<T>>(v)[i];
}

template<typename T>
Result<void> check_length(const char* name, const PerItem<T>& v, size_t expected) {
    if (is_scalar(v) || per_item_size(v) == expected) {
        return Ok();
    }
    return Err<void>(ErrorKind::Configuration,
        std::string("Dispatcher::bulk_subscribe: ") + name + " has " +
        std::to_string(per_item_size(v)) + " items, expected " + std::to_string(expected));
}

} // namespace

Result<std::shared_ptr<Dispatcher>> Dispatcher::create(
    Config config,
    IdGeneratorPtr id_generator,
    ClockPtr clock
) {
    if (!id_generator) {
        return Err<std::shared_ptr<Dispatcher>>(ErrorKind::Configuration, "Dispatcher::create: no id generator");
    }
    if (!clock) {
        return Err<std::shared_ptr<Dispatcher>>(ErrorKind::Configuration, "Dispatcher::create: no clock");
    }

    auto dispatcher = std::shared_ptr<Dispatcher>(
        new Dispatcher(std::move(config), std::move(id_generator), std::move(clock)));
    if (auto res = dispatcher->init(); !res) {
        return Err<std::shared_ptr<Dispatcher>>("Dispatcher::create: init failed", res);
    }
    return dispatcher;
}

Dispatcher::Dispatcher(Config config, IdGeneratorPtr id_generator, ClockPtr clock)
    : _config(std::move(config)),
      _id_generator(std::move(id_generator)),
      _clock(std::move(clock)),
      _error_log(_config.error_log_size, _config.handler_error_level) {}

Dispatcher::~Dispatcher() {
    if (auto res = dispose(); !res) {
        ywarn("Dispatcher: dispose failed: {}", error_msg(res));
    }
}

Result<void> Dispatcher::init() {
    auto reg_res = Registry::create();
    if (!reg_res) {
        return Err<void>("Dispatcher::init: registry create failed", reg_res);
    }
    _registry = *reg_res;
    ydebug("Dispatcher {} ready", uid());
    return Ok();
}

Result<void> Dispatcher::dispose() {
    if (_disposed.exchange(true) || !_registry) {
        return Ok();
    }
    if (auto res = _registry->dispose(); !res) {
        return Err<void>("Dispatcher::dispose: registry dispose failed", res);
    }
    return Ok();
}

//-----------------------------------------------------------------------------
// Subscribe
//-----------------------------------------------------------------------------

Result<std::string> Dispatcher::_subscribe(
    std::optional<std::string> event_code,
    const Handler& handler,
    const std::string& ns,
    bool persistent,
    int priority
) {
    if (_disposed.load()) {
        return Err<std::string>(ErrorKind::Internal, "Dispatcher::subscribe: dispatcher disposed");
    }
    if (!handler.valid()) {
        return Err<std::string>(ErrorKind::InvalidHandler,
            "Dispatcher::subscribe: handler '" + handler.name() + "' is not callable");
    }

    auto sub_res = Subscription::create(
        _id_generator->next_code(), std::move(event_code), handler, ns, persistent, priority);
    if (!sub_res) {
        return Err<std::string>("Dispatcher::subscribe: invalid subscription", sub_res);
    }

    auto add_res = _registry->add(*sub_res);
    if (!add_res) {
        yerror("Dispatcher: id generator produced a duplicate code: {}", error_msg(add_res));
        return Err<std::string>("Dispatcher::subscribe: registry rejected subscription", add_res);
    }

    return (*add_res)->code();
}

Result<std::string> Dispatcher::subscribe(
    const std::string& event_code,
    const Handler& handler,
    const std::string& ns,
    bool persistent,
    int priority
) {
    if (event_code.empty()) {
        return Err<std::string>(ErrorKind::Configuration,
            "Dispatcher::subscribe: empty event code, use subscribe_namespace for namespace-wide handlers");
    }
    return _subscribe(event_code, handler, ns, persistent, priority);
}

Result<std::string> Dispatcher::subscribe(
    const Event& event,
    const Handler& handler,
    const std::string& ns,
    bool persistent,
    int priority
) {
    return subscribe(event.match_code(), handler, ns, persistent, priority);
}

Result<std::string> Dispatcher::subscribe_namespace(
    const Handler& handler,
    const std::string& ns,
    bool persistent,
    int priority
) {
    return _subscribe(std::nullopt, handler, ns, persistent, priority);
}

Result<std::vector<std::string>> Dispatcher::bulk_subscribe(const BulkSubscription& bulk) {
    const size_t n = bulk.events.size();

    if (auto res = check_length("handlers", bulk.handlers, n); !res) {
        return Err<std::vector<std::string>>("Dispatcher::bulk_subscribe: bad configuration", res);
    }
    if (auto res = check_length("namespaces", bulk.namespaces, n); !res) {
        return Err<std::vector<std::string>>("Dispatcher::bulk_subscribe: bad configuration", res);
    }
    if (auto res = check_length("persistents", bulk.persistents, n); !res) {
        return Err<std::vector<std::string>>("Dispatcher::bulk_subscribe: bad configuration", res);
    }
    if (auto res = check_length("priorities", bulk.priorities, n); !res) {
        return Err<std::vector<std::string>>("Dispatcher::bulk_subscribe: bad configuration", res);
    }

    std::vector<std::string> codes;
    codes.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        auto res = subscribe(
            bulk.events[i],
            per_item_at(bulk.handlers, i),
            per_item_at(bulk.namespaces, i),
            per_item_at(bulk.persistents, i),
            per_item_at(bulk.priorities, i));
        if (!res) {
            return Err<std::vector<std::string>>(
                "Dispatcher::bulk_subscribe: item " + std::to_string(i) + " ('" + bulk.events[i] +
                "') failed after " + std::to_string(codes.size()) + " subscribed", res);
        }
        codes.push_back(*res);
    }

    ydebug("Dispatcher: bulk subscribed {} handlers", codes.size());
    return codes;
}

//-----------------------------------------------------------------------------
// Unsubscribe
//-----------------------------------------------------------------------------

Result<void> Dispatcher::_unsubscribe_first(
    const std::optional<std::string>& event_code,
    const Handler& handler,
    const std::string& ns
) {
    if (_disposed.load()) {
        return Err<void>(ErrorKind::Internal, "Dispatcher::unsubscribe: dispatcher disposed");
    }

    for (const auto& s : _registry->find_by_namespace(ns)) {
        if (s->event_code() == event_code && s->handler() == handler) {
            if (auto res = _registry->remove_by_code(s->code()); !res) {
                return Err<void>("Dispatcher::unsubscribe: removal raced with another caller", res);
            }
            return Ok();
        }
    }

    return Err<void>(ErrorKind::SubscriptionLookup,
        "Dispatcher::unsubscribe: no subscription of '" + handler.name() + "' to '" +
        event_code.value_or("*") + "' in namespace '" + ns + "'");
}

Result<void> Dispatcher::unsubscribe(
    const std::string& event_code,
    const Handler& handler,
    const std::string& ns
) {
    if (event_code.empty()) {
        return Err<void>(ErrorKind::SubscriptionLookup, "Dispatcher::unsubscribe: empty event code");
    }
    return _unsubscribe_first(event_code, handler, ns);
}

Result<void> Dispatcher::unsubscribe(
    const Event& event,
    const Handler& handler,
    const std::string& ns
) {
    return unsubscribe(event.match_code(), handler, ns);
}

Result<void> Dispatcher::unsubscribe_namespace(const Handler& handler, const std::string& ns) {
    return _unsubscribe_first(std::nullopt, handler, ns);
}

Result<void> Dispatcher::unsubscribe_by_code(const std::string& code) {
    if (_disposed.load()) {
        return Err<void>(ErrorKind::Internal, "Dispatcher::unsubscribe_by_code: dispatcher disposed");
    }
    if (auto res = _registry->remove_by_code(code); !res) {
        return Err<void>("Dispatcher::unsubscribe_by_code", res);
    }
    return Ok();
}

size_t Dispatcher::unsubscribe_by_function(const Handler& handler, const std::optional<std::string>& ns) {
    return _disposed.load() ? 0 : _registry->remove_by_handler(handler, ns);
}

size_t Dispatcher::unsubscribe_by_namespace(const std::string& ns) {
    return _disposed.load() ? 0 : _registry->remove_by_namespace(ns);
}

size_t Dispatcher::unsubscribe_by_event(const std::string& event_code) {
    return _disposed.load() ? 0 : _registry->remove_by_event(event_code);
}

size_t Dispatcher::unsubscribe_all() {
    size_t removed = _disposed.load() ? 0 : _registry->remove_all();
    ydebug("Dispatcher: removed all {} subscriptions", removed);
    return removed;
}

//-----------------------------------------------------------------------------
// Introspection
//-----------------------------------------------------------------------------

std::vector<SubscriptionPtr> Dispatcher::get_subscriptions_by_event(const std::string& event_code) const {
    return _disposed.load() ? std::vector<SubscriptionPtr>{} : _registry->find_by_event(event_code);
}

std::vector<SubscriptionPtr> Dispatcher::get_subscriptions_by_function(const Handler& handler) const {
    return _disposed.load() ? std::vector<SubscriptionPtr>{} : _registry->find_by_handler(handler);
}

std::vector<SubscriptionPtr> Dispatcher::get_subscriptions_by_namespace(const std::string& ns) const {
    return _disposed.load() ? std::vector<SubscriptionPtr>{} : _registry->find_by_namespace(ns);
}

Result<SubscriptionPtr> Dispatcher::get_subscription_by_code(const std::string& code) const {
    if (_disposed.load()) {
        return Err<SubscriptionPtr>(ErrorKind::Internal, "Dispatcher::get_subscription_by_code: dispatcher disposed");
    }
    return _registry->find_by_code(code);
}

size_t Dispatcher::subscription_count() const {
    return _disposed.load() ? 0 : _registry->size();
}

std::vector<std::string> Dispatcher::namespaces() const {
    return _disposed.load() ? std::vector<std::string>{} : _registry->namespaces();
}

//-----------------------------------------------------------------------------
// Dispatch
//-----------------------------------------------------------------------------

Result<Value> Dispatcher::_invoke(const Subscription& subscription, const Event& event, const Args& args) {
    const auto& name = subscription.handler().name();
    try {
        auto res = subscription.handler()(event, args);
        if (!res) {
            return Err<Value>(ErrorKind::HandlerFailure, "handler '" + name + "' returned an error", res);
        }
        return res;
    } catch (const std::exception& e) {
        return Err<Value>(ErrorKind::HandlerFailure, "handler '" + name + "' threw: " + std::string(e.what()));
    } catch (...) {
        return Err<Value>(ErrorKind::HandlerFailure, "handler '" + name + "' threw a non-standard exception");
    }
}

Result<NotificationPtr> Dispatcher::dispatch(
    const EventPtr& event,
    const std::string& ns,
    const Args& args
) {
    if (!event) {
        return Err<NotificationPtr>(ErrorKind::DispatchFormat, "Dispatcher::dispatch: null event");
    }

    std::string event_code = event->match_code();
    if (event_code.empty()) {
        return Err<NotificationPtr>(ErrorKind::DispatchFormat,
            "Dispatcher::dispatch: event " + std::to_string(event->id()) + " has neither code nor name");
    }
    if (ns.empty()) {
        return Err<NotificationPtr>(ErrorKind::DispatchFormat, "Dispatcher::dispatch: empty namespace");
    }
    if (_disposed.load()) {
        return Err<NotificationPtr>(ErrorKind::Internal, "Dispatcher::dispatch: dispatcher disposed");
    }

    auto start = _clock->now();

    // Snapshot taken under the registry lock; handlers run without it
    auto matches = _registry->find(ns, event_code);
    std::stable_sort(matches.begin(), matches.end(),
        [](const SubscriptionPtr& a, const SubscriptionPtr& b) { return a->priority() > b->priority(); });

    ydebug("Dispatcher: dispatching '{}' to '{}' ({} handlers)", event_code, ns, matches.size());

    Content content;
    std::vector<HandlerError> errors;

    for (const auto& sub : matches) {
        auto res = _invoke(*sub, *event, args);
        if (res) {
            content.set(sub->handler().name(), std::move(*res));
            continue;
        }

        Error error("Dispatcher::dispatch: '" + event_code + "' in '" + ns +
                    "' subscription " + sub->code(), res.error());
        _error_log.add(error, ns);
        errors.push_back(HandlerError{
            sub->code(),
            sub->handler().name(),
            ns,
            res.error().root_message(),
            std::move(error),
        });
    }

    auto end = _clock->now();
    event->set_last_notified(end);

    auto notification = std::make_shared<const Notification>(
        _id_generator->next_id(), event, ns, start, end, std::move(content), std::move(errors));

    if (notification->has_errors()) {
        ywarn("Dispatcher: '{}' in '{}' finished with {} failed handler(s)",
              event_code, ns, notification->errors().size());
    }
    return notification;
}

} // namespace ydispatch
