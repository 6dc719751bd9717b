#include "registry.hpp"
#include <algorithm>
#include <iterator>
#include <mutex>
#include <ytrace/ytrace.hpp>

namespace ydispatch {

namespace {

bool by_sequence(const SubscriptionPtr& a, const SubscriptionPtr& b) {
    return a->sequence() < b->sequence();
}

void erase_from(std::vector<SubscriptionPtr>& list, const std::string& code) {
    list.erase(std::remove_if(list.begin(), list.end(),
        [&](const SubscriptionPtr& s) { return s->code() == code; }), list.end());
}

} // namespace

Result<std::shared_ptr<Registry>> Registry::create() {
    auto registry = std::shared_ptr<Registry>(new Registry());
    if (auto res = registry->init(); !res) {
        return Err<std::shared_ptr<Registry>>("Registry::create: init failed", res);
    }
    return registry;
}

Result<void> Registry::dispose() {
    remove_all();
    return Ok();
}

Result<SubscriptionPtr> Registry::add(const SubscriptionPtr& subscription) {
    if (!subscription) {
        return Err<SubscriptionPtr>(ErrorKind::Internal, "Registry::add: null subscription");
    }

    std::unique_lock lock(_mutex);

    if (_by_code.count(subscription->code())) {
        return Err<SubscriptionPtr>(ErrorKind::DuplicateSubscriptionCode,
            "Registry::add: code '" + subscription->code() + "' already registered");
    }

    auto stored = subscription->with_sequence(_next_sequence++);
    _by_code.emplace(stored->code(), stored);
    _by_namespace[stored->ns()].push_back(stored);
    _by_event[_event_key(stored)].push_back(stored);

    ydebug("Registry: added {} ({} live)", stored->to_string(), _by_code.size());
    return stored;
}

void Registry::_erase_locked(const SubscriptionPtr& subscription) {
    const auto& code = subscription->code();
    _by_code.erase(code);

    if (auto it = _by_namespace.find(subscription->ns()); it != _by_namespace.end()) {
        erase_from(it->second, code);
        if (it->second.empty()) {
            _by_namespace.erase(it);
        }
    }

    if (auto it = _by_event.find(_event_key(subscription)); it != _by_event.end()) {
        erase_from(it->second, code);
        if (it->second.empty()) {
            _by_event.erase(it);
        }
    }
}

size_t Registry::_erase_all_locked(const std::vector<SubscriptionPtr>& victims) {
    for (const auto& s : victims) {
        _erase_locked(s);
    }
    return victims.size();
}

Result<SubscriptionPtr> Registry::remove_by_code(const std::string& code) {
    std::unique_lock lock(_mutex);

    auto it = _by_code.find(code);
    if (it == _by_code.end()) {
        return Err<SubscriptionPtr>(ErrorKind::SubscriptionLookup,
            "Registry::remove_by_code: no subscription with code '" + code + "'");
    }

    auto removed = it->second;
    _erase_locked(removed);
    ydebug("Registry: removed {}", removed->to_string());
    return removed;
}

size_t Registry::remove_by_handler(const Handler& handler, const std::optional<std::string>& ns) {
    std::unique_lock lock(_mutex);

    std::vector<SubscriptionPtr> victims;
    for (const auto& [code, s] : _by_code) {
        if (s->handler() == handler && (!ns || s->ns() == *ns)) {
            victims.push_back(s);
        }
    }
    return _erase_all_locked(victims);
}

size_t Registry::remove_by_namespace(const std::string& ns) {
    std::unique_lock lock(_mutex);

    auto it = _by_namespace.find(ns);
    if (it == _by_namespace.end()) {
        return 0;
    }
    // Copy: erasing empties and drops the namespace entry
    auto victims = it->second;
    return _erase_all_locked(victims);
}

size_t Registry::remove_by_event(const std::string& event_code) {
    if (event_code.empty()) {
        return 0;
    }

    std::unique_lock lock(_mutex);

    std::vector<SubscriptionPtr> victims;
    for (const auto& [key, list] : _by_event) {
        if (key.second == event_code) {
            victims.insert(victims.end(), list.begin(), list.end());
        }
    }
    return _erase_all_locked(victims);
}

size_t Registry::remove_all() {
    std::unique_lock lock(_mutex);
    size_t count = _by_code.size();
    _by_code.clear();
    _by_namespace.clear();
    _by_event.clear();
    return count;
}

std::vector<SubscriptionPtr> Registry::find(const std::string& ns, const std::string& event_code) const {
    std::shared_lock lock(_mutex);

    std::vector<SubscriptionPtr> filtered;
    if (!event_code.empty()) {
        if (auto it = _by_event.find({ns, event_code}); it != _by_event.end()) {
            filtered = it->second;
        }
    }

    std::vector<SubscriptionPtr> wide;
    if (auto it = _by_event.find({ns, ANY_EVENT}); it != _by_event.end()) {
        wide = it->second;
    }
    lock.unlock();

    // Both buckets are already in registration order
    std::vector<SubscriptionPtr> out;
    out.reserve(filtered.size() + wide.size());
    std::merge(filtered.begin(), filtered.end(), wide.begin(), wide.end(),
               std::back_inserter(out), by_sequence);
    return out;
}

Result<SubscriptionPtr> Registry::find_by_code(const std::string& code) const {
    std::shared_lock lock(_mutex);

    auto it = _by_code.find(code);
    if (it == _by_code.end()) {
        return Err<SubscriptionPtr>(ErrorKind::SubscriptionLookup,
            "Registry::find_by_code: no subscription with code '" + code + "'");
    }
    return it->second;
}

std::vector<SubscriptionPtr> Registry::find_by_handler(const Handler& handler) const {
    std::vector<SubscriptionPtr> out;
    {
        std::shared_lock lock(_mutex);
        for (const auto& [code, s] : _by_code) {
            if (s->handler() == handler) {
                out.push_back(s);
            }
        }
    }
    std::sort(out.begin(), out.end(), by_sequence);
    return out;
}

std::vector<SubscriptionPtr> Registry::find_by_namespace(const std::string& ns) const {
    std::shared_lock lock(_mutex);

    auto it = _by_namespace.find(ns);
    if (it == _by_namespace.end()) {
        return {};
    }
    return it->second;
}

std::vector<SubscriptionPtr> Registry::find_by_event(const std::string& event_code) const {
    std::vector<SubscriptionPtr> out;
    {
        std::shared_lock lock(_mutex);
        for (const auto& [key, list] : _by_event) {
            if (!event_code.empty() && key.second == event_code) {
                out.insert(out.end(), list.begin(), list.end());
            }
        }
    }
    std::sort(out.begin(), out.end(), by_sequence);
    return out;
}

size_t Registry::size() const {
    std::shared_lock lock(_mutex);
    return _by_code.size();
}

std::vector<std::string> Registry::namespaces() const {
    std::shared_lock lock(_mutex);

    std::vector<std::string> out;
    out.reserve(_by_namespace.size());
    for (const auto& [ns, _] : _by_namespace) {
        out.push_back(ns);
    }
    return out;
}

} // namespace ydispatch
