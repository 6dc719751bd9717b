#pragma once

#include "result.hpp"
#include "types.hpp"
#include <functional>
#include <memory>
#include <string>
#include <type_traits>

namespace ydispatch {

class Event;

// Named callable invoked for each matching subscription.
//
// Identity is the callable box: copies of a Handler compare equal and
// remove each other's subscriptions, two separately created handlers never
// do, even when they wrap the same function.
class Handler {
public:
    using Callback = std::function<Result<Value>(const Event&, const Args&)>;

    // Name used when none is given
    static constexpr const char* ANONYMOUS = "<lambda>";

    Handler() = default;

    static Result<Handler> create(const std::string& name, Callback fn);

    // Adapts any callable taking (const Event&) or (const Event&, const Args&)
    // and returning void, Result<Value> or anything storable in a Value.
    template<typename F>
    static Result<Handler> from(const std::string& name, F&& fn);

    const std::string& name() const { return _name; }
    bool valid() const { return _fn && static_cast<bool>(*_fn); }
    const void* identity() const { return _fn.get(); }

    // May throw whatever the wrapped callable throws
    Result<Value> operator()(const Event& event, const Args& args) const;

    bool operator==(const Handler& other) const { return _fn == other._fn; }

private:
    Handler(std::string name, std::shared_ptr<const Callback> fn)
        : _name(std::move(name)), _fn(std::move(fn)) {}

    std::string _name;
    std::shared_ptr<const Callback> _fn;
};

template<typename F>
Result<Handler> Handler::from(const std::string& name, F&& fn) {
    using Fn = std::decay_t<F>;
    constexpr bool takes_args = std::is_invocable_v<Fn&, const Event&, const Args&>;
    static_assert(takes_args || std::is_invocable_v<Fn&, const Event&>,
        "handler must be callable with (const Event&) or (const Event&, const Args&)");

    Callback cb = [f = Fn(std::forward<F>(fn))](const Event& event, const Args& args) mutable -> Result<Value> {
        auto call = [&]() -> decltype(auto) {
            if constexpr (takes_args) {
                return f(event, args);
            } else {
                return f(event);
            }
        };
        using R = decltype(call());
        if constexpr (std::is_void_v<R>) {
            call();
            return Value{};
        } else if constexpr (std::is_same_v<std::decay_t<R>, Result<Value>>) {
            return call();
        } else {
            return Value(call());
        }
    };
    return create(name, std::move(cb));
}

} // namespace ydispatch
