#pragma once

#include "result.hpp"
#include "types.hpp"
#include "clock.hpp"
#include "event.hpp"
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ydispatch {

enum class NotificationStatus { Success, Failure };

inline const char* status_name(NotificationStatus status) {
    return status == NotificationStatus::Success ? "SUCCESS" : "FAILURE";
}

// One failed handler invocation
struct HandlerError {
    std::string subscription_code;
    std::string handler;
    std::string ns;
    std::string message;
    Error error;
};

// Handler name -> result, in first-insertion order. Setting an existing key
// replaces its value in place, so the later result wins.
class Content {
public:
    void set(const std::string& key, Value value);

    bool contains(const std::string& key) const;
    std::optional<Value> get(const std::string& key) const;

    size_t size() const { return _entries.size(); }
    bool empty() const { return _entries.empty(); }

    const std::vector<std::pair<std::string, Value>>& entries() const { return _entries; }

private:
    std::vector<std::pair<std::string, Value>> _entries;
};

class Notification;
using NotificationPtr = std::shared_ptr<const Notification>;

// Immutable outcome of one dispatch. The status is derived from the errors,
// so a notification is FAILURE exactly when it carries at least one error.
class Notification {
public:
    Notification(
        uint64_t id,
        EventPtr event,
        std::string ns,
        Clock::time_point start,
        Clock::time_point end,
        Content content,
        std::vector<HandlerError> errors
    );

    uint64_t id() const { return _id; }
    const EventPtr& event() const { return _event; }
    const std::string& ns() const { return _ns; }
    Clock::time_point start() const { return _start; }
    Clock::time_point end() const { return _end; }
    Clock::duration duration() const { return _end > _start ? _end - _start : Clock::duration::zero(); }
    NotificationStatus status() const { return _status; }

    const Content& content() const { return _content; }
    const std::vector<HandlerError>& errors() const { return _errors; }

    bool has_errors() const { return !_errors.empty(); }

    // Result of the single handler that ran; AmbiguousResult otherwise
    Result<Value> get_one_and_only_result() const;

    std::vector<std::string> get_function_names() const;
    std::vector<Value> get_function_results() const;

    bool contains(const std::string& handler_name) const { return _content.contains(handler_name); }
    std::optional<Value> get(const std::string& handler_name) const { return _content.get(handler_name); }

    template<typename T>
    std::optional<T> get_as(const std::string& handler_name) const {
        auto v = _content.get(handler_name);
        if (!v) return std::nullopt;
        return ydispatch::get_as<T>(*v);
    }

    // Fails with the collected handler errors, if any
    Result<void> handle() const;

    std::string to_string() const;

private:
    uint64_t _id;
    EventPtr _event;
    std::string _ns;
    Clock::time_point _start;
    Clock::time_point _end;
    NotificationStatus _status;
    Content _content;
    std::vector<HandlerError> _errors;
};

} // namespace ydispatch
