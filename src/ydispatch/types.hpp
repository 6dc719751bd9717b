#pragma once

#include "result.hpp"
#include <string>
#include <vector>
#include <map>
#include <any>
#include <optional>

namespace ydispatch {

// Value type for dynamic data
using Value = std::any;
using Dict = std::map<std::string, Value>;
using List = std::vector<Value>;

// Helper to get value from std::any
template<typename T>
std::optional<T> get_as(const Value& v) {
    if (auto p = std::any_cast<T>(&v)) {
        return *p;
    }
    return std::nullopt;
}

// Extra arguments forwarded to every handler of one dispatch
struct Args {
    List positional;
    Dict keyword;

    // Keyword lookup with typed fallback
    template<typename T>
    std::optional<T> kw(const std::string& key) const {
        auto it = keyword.find(key);
        if (it == keyword.end()) return std::nullopt;
        return get_as<T>(it->second);
    }
};

// Namespace used when none is given
inline constexpr const char* GLOBAL_NAMESPACE = "global";

// Best-effort rendering for logs and to_string() output
std::string value_to_string(const Value& v);
std::string dict_to_string(const Dict& d);

} // namespace ydispatch
