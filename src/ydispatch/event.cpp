#include "event.hpp"
#include <cctype>

namespace ydispatch {

//-----------------------------------------------------------------------------
// EventData
//-----------------------------------------------------------------------------

std::optional<Value> EventData::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _values.find(key);
    if (it == _values.end()) {
        return std::nullopt;
    }
    return it->second;
}

void EventData::set(const std::string& key, Value value) {
    std::lock_guard<std::mutex> lock(_mutex);
    _values[key] = std::move(value);
}

bool EventData::erase(const std::string& key) {
    std::lock_guard<std::mutex> lock(_mutex);
    return _values.erase(key) > 0;
}

void EventData::clear() {
    std::lock_guard<std::mutex> lock(_mutex);
    _values.clear();
}

bool EventData::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _values.count(key) > 0;
}

std::vector<std::string> EventData::keys() const {
    std::lock_guard<std::mutex> lock(_mutex);
    std::vector<std::string> out;
    out.reserve(_values.size());
    for (const auto& [key, _] : _values) {
        out.push_back(key);
    }
    return out;
}

size_t EventData::size() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _values.size();
}

bool EventData::empty() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _values.empty();
}

Dict EventData::snapshot() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _values;
}

//-----------------------------------------------------------------------------
// Event
//-----------------------------------------------------------------------------

Event::Event(uint64_t id, std::string uuid, std::string name, std::string code, Dict data)
    : _id(id),
      _uuid(std::move(uuid)),
      _name(std::move(name)),
      _code(std::move(code)),
      _data(std::make_shared<EventData>(std::move(data))) {}

Result<EventPtr> Event::create(
    const std::string& name,
    Dict data,
    const std::string& code,
    IdGeneratorPtr id_generator
) {
    if (!id_generator) {
        return Err<EventPtr>(ErrorKind::Configuration, "Event::create: no id generator");
    }

    std::string event_code = code.empty() ? code_from_name(name) : code;
    if (event_code.empty()) {
        return Err<EventPtr>(ErrorKind::Configuration,
            "Event::create: event needs a name or a code, got name '" + name + "'");
    }

    return std::make_shared<const Event>(
        id_generator->next_id(),
        id_generator->next_code(),
        name,
        std::move(event_code),
        std::move(data)
    );
}

std::optional<Clock::time_point> Event::last_notified() const {
    std::lock_guard<std::mutex> lock(_notified_mutex);
    return _last_notified;
}

void Event::set_last_notified(Clock::time_point when) const {
    std::lock_guard<std::mutex> lock(_notified_mutex);
    _last_notified = when;
}

int Event::compare_to(const Event& other) const {
    if (_id < other._id) return -1;
    if (_id > other._id) return 1;
    return 0;
}

std::string Event::to_string() const {
    return "Event(id=" + std::to_string(_id) +
           ", uuid=" + _uuid +
           ", name=" + _name +
           ", code=" + _code +
           ", data=" + dict_to_string(_data->snapshot()) + ")";
}

std::string Event::code_from_name(const std::string& name) {
    std::string out;
    bool pending_sep = false;
    for (unsigned char c : name) {
        if (std::isalnum(c)) {
            if (pending_sep && !out.empty()) {
                out.push_back('_');
            }
            pending_sep = false;
            out.push_back(static_cast<char>(std::tolower(c)));
        } else {
            pending_sep = true;
        }
    }
    return out;
}

} // namespace ydispatch
