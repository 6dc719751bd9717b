#pragma once

#include "result.hpp"
#include "types.hpp"
#include "clock.hpp"
#include "id_generator.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ydispatch {

// Mutable payload of an Event. Owned separately from the event so the
// identity fields stay immutable while handlers read and write data.
class EventData {
public:
    EventData() = default;
    explicit EventData(Dict values) : _values(std::move(values)) {}

    std::optional<Value> get(const std::string& key) const;

    template<typename T>
    std::optional<T> get_as(const std::string& key) const {
        std::lock_guard<std::mutex> lock(_mutex);
        auto it = _values.find(key);
        if (it == _values.end()) return std::nullopt;
        return ydispatch::get_as<T>(it->second);
    }

    void set(const std::string& key, Value value);
    bool erase(const std::string& key);
    void clear();

    bool contains(const std::string& key) const;
    std::vector<std::string> keys() const;
    size_t size() const;
    bool empty() const;

    // Copy of the current payload
    Dict snapshot() const;

private:
    mutable std::mutex _mutex;
    Dict _values;
};

class Event;
using EventPtr = std::shared_ptr<const Event>;

// What happened: immutable identity plus a mutable payload
class Event {
public:
    // For external factories that assign identity themselves
    Event(uint64_t id, std::string uuid, std::string name, std::string code, Dict data = {});

    // Factory: id and uuid come from the generator, an empty code is derived from the name
    static Result<EventPtr> create(
        const std::string& name,
        Dict data = {},
        const std::string& code = "",
        IdGeneratorPtr id_generator = default_id_generator()
    );

    uint64_t id() const { return _id; }
    const std::string& uuid() const { return _uuid; }
    const std::string& name() const { return _name; }
    const std::string& code() const { return _code; }

    // Explicit code, or one derived from the name when the code is empty
    std::string match_code() const { return _code.empty() ? code_from_name(_name) : _code; }

    EventData& data() const { return *_data; }

    // Payload shortcuts
    bool contains(const std::string& key) const { return _data->contains(key); }
    std::optional<Value> get(const std::string& key) const { return _data->get(key); }
    void set(const std::string& key, Value value) const { _data->set(key, std::move(value)); }
    void clear() const { _data->clear(); }
    bool is_empty() const { return _data->empty(); }

    // Stamped by the dispatcher at the end of each dispatch
    std::optional<Clock::time_point> last_notified() const;
    void set_last_notified(Clock::time_point when) const;

    // Identity comparison: events are equal when their ids are
    bool operator==(const Event& other) const { return _id == other._id; }
    int compare_to(const Event& other) const;

    std::string to_string() const;

    // Derive a matchable code from a human label: trimmed, lower-case,
    // runs of non-alphanumerics collapsed to '_'
    static std::string code_from_name(const std::string& name);

private:
    const uint64_t _id;
    const std::string _uuid;
    const std::string _name;
    const std::string _code;
    std::shared_ptr<EventData> _data;

    mutable std::mutex _notified_mutex;
    mutable std::optional<Clock::time_point> _last_notified;
};

} // namespace ydispatch
