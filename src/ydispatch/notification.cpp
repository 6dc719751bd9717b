#include "notification.hpp"
#include <algorithm>
#include <chrono>

namespace ydispatch {

//-----------------------------------------------------------------------------
// Content
//-----------------------------------------------------------------------------

void Content::set(const std::string& key, Value value) {
    auto it = std::find_if(_entries.begin(), _entries.end(),
        [&](const auto& entry) { return entry.first == key; });
    if (it != _entries.end()) {
        it->second = std::move(value);
        return;
    }
    _entries.emplace_back(key, std::move(value));
}

bool Content::contains(const std::string& key) const {
    return std::any_of(_entries.begin(), _entries.end(),
        [&](const auto& entry) { return entry.first == key; });
}

std::optional<Value> Content::get(const std::string& key) const {
    for (const auto& [name, value] : _entries) {
        if (name == key) {
            return value;
        }
    }
    return std::nullopt;
}

//-----------------------------------------------------------------------------
// Notification
//-----------------------------------------------------------------------------

Notification::Notification(
    uint64_t id,
    EventPtr event,
    std::string ns,
    Clock::time_point start,
    Clock::time_point end,
    Content content,
    std::vector<HandlerError> errors
)
    : _id(id),
      _event(std::move(event)),
      _ns(std::move(ns)),
      _start(start),
      _end(end),
      _status(errors.empty() ? NotificationStatus::Success : NotificationStatus::Failure),
      _content(std::move(content)),
      _errors(std::move(errors)) {}

Result<Value> Notification::get_one_and_only_result() const {
    if (_content.size() != 1) {
        return Err<Value>(ErrorKind::AmbiguousResult,
            "Notification::get_one_and_only_result: expected exactly one result, got " +
            std::to_string(_content.size()));
    }
    return _content.entries().front().second;
}

std::vector<std::string> Notification::get_function_names() const {
    std::vector<std::string> names;
    names.reserve(_content.size());
    for (const auto& [name, _] : _content.entries()) {
        names.push_back(name);
    }
    return names;
}

std::vector<Value> Notification::get_function_results() const {
    std::vector<Value> results;
    results.reserve(_content.size());
    for (const auto& [_, value] : _content.entries()) {
        results.push_back(value);
    }
    return results;
}

Result<void> Notification::handle() const {
    if (_errors.empty()) {
        return Ok();
    }

    std::string msg = "Notification::handle: " + std::to_string(_errors.size()) + " handler(s) failed:";
    for (const auto& e : _errors) {
        msg += " " + e.handler + " (" + e.message + ");";
    }
    return Err<void>(ErrorKind::HandlerFailure, msg);
}

std::string Notification::to_string() const {
    using namespace std::chrono;
    auto us = duration_cast<microseconds>(this->duration()).count();

    std::string out = "Notification(id=" + std::to_string(_id) +
        ", event=" + (_event ? _event->code() : std::string("null")) +
        ", namespace=" + _ns +
        ", status=" + status_name(_status) +
        ", duration_us=" + std::to_string(us) +
        ", content={";
    bool first = true;
    for (const auto& [name, value] : _content.entries()) {
        if (!first) out += ", ";
        first = false;
        out += name + ": " + value_to_string(value);
    }
    out += "}, errors=" + std::to_string(_errors.size()) + ")";
    return out;
}

} // namespace ydispatch
