#pragma once

#include "result.hpp"
#include "object.hpp"
#include "subscription.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace ydispatch {

// Registry - concurrent store of live subscriptions
//
// Three indices are kept in step under one lock:
//   code               -> subscription
//   namespace          -> subscriptions in registration order
//   (namespace, event) -> subscriptions in registration order
// Namespace-wide subscriptions live in the (namespace, ANY_EVENT) bucket.
//
// Queries return copies so callers never hold the lock while using results.
class Registry : public Object {
public:
    static Result<std::shared_ptr<Registry>> create();

    // Stores the subscription and returns it stamped with its registration sequence
    Result<SubscriptionPtr> add(const SubscriptionPtr& subscription);

    Result<SubscriptionPtr> remove_by_code(const std::string& code);
    size_t remove_by_handler(const Handler& handler, const std::optional<std::string>& ns = std::nullopt);
    size_t remove_by_namespace(const std::string& ns);
    size_t remove_by_event(const std::string& event_code);
    size_t remove_all();

    // Subscriptions bound to event_code in ns plus the namespace-wide ones,
    // in registration order
    std::vector<SubscriptionPtr> find(const std::string& ns, const std::string& event_code) const;

    Result<SubscriptionPtr> find_by_code(const std::string& code) const;
    std::vector<SubscriptionPtr> find_by_handler(const Handler& handler) const;
    std::vector<SubscriptionPtr> find_by_namespace(const std::string& ns) const;
    std::vector<SubscriptionPtr> find_by_event(const std::string& event_code) const;

    size_t size() const;
    std::vector<std::string> namespaces() const;

    Result<void> dispose() override;

private:
    Registry() = default;

    using EventKey = std::pair<std::string, std::string>;

    // Event-code slot used for namespace-wide subscriptions; real codes are never empty
    static inline const std::string ANY_EVENT{};

    static EventKey _event_key(const SubscriptionPtr& s) {
        return {s->ns(), s->namespace_wide() ? ANY_EVENT : *s->event_code()};
    }

    // Caller holds the unique lock
    void _erase_locked(const SubscriptionPtr& subscription);
    size_t _erase_all_locked(const std::vector<SubscriptionPtr>& victims);

    mutable std::shared_mutex _mutex;
    uint64_t _next_sequence = 0;

    std::unordered_map<std::string, SubscriptionPtr> _by_code;
    std::map<std::string, std::vector<SubscriptionPtr>> _by_namespace;
    std::map<EventKey, std::vector<SubscriptionPtr>> _by_event;
};

using RegistryPtr = std::shared_ptr<Registry>;

} // namespace ydispatch
