#include "types.hpp"
#include <cstdint>
#include <sstream>

namespace ydispatch {

std::string value_to_string(const Value& v) {
    if (!v.has_value()) {
        return "null";
    }
    if (auto s = get_as<std::string>(v)) {
        return "\"" + *s + "\"";
    }
    if (auto s = get_as<const char*>(v)) {
        return "\"" + std::string(*s) + "\"";
    }
    if (auto b = get_as<bool>(v)) {
        return *b ? "true" : "false";
    }
    if (auto i = get_as<int>(v)) {
        return std::to_string(*i);
    }
    if (auto i = get_as<int64_t>(v)) {
        return std::to_string(*i);
    }
    if (auto i = get_as<uint64_t>(v)) {
        return std::to_string(*i);
    }
    if (auto d = get_as<double>(v)) {
        std::ostringstream oss;
        oss << *d;
        return oss.str();
    }
    if (auto d = get_as<Dict>(v)) {
        return dict_to_string(*d);
    }
    if (auto l = get_as<List>(v)) {
        std::string out = "[";
        for (size_t i = 0; i < l->size(); ++i) {
            if (i) out += ", ";
            out += value_to_string((*l)[i]);
        }
        return out + "]";
    }
    return std::string("<") + v.type().name() + ">";
}

std::string dict_to_string(const Dict& d) {
    std::string out = "{";
    bool first = true;
    for (const auto& [key, value] : d) {
        if (!first) out += ", ";
        first = false;
        out += key;
        out += ": ";
        out += value_to_string(value);
    }
    return out + "}";
}

} // namespace ydispatch
