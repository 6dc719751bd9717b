#include "handler.hpp"

namespace ydispatch {

Result<Handler> Handler::create(const std::string& name, Callback fn) {
    if (!fn) {
        return Err<Handler>(ErrorKind::InvalidHandler,
            "Handler::create: '" + (name.empty() ? std::string(ANONYMOUS) : name) + "' is not callable");
    }
    return Handler(name.empty() ? std::string(ANONYMOUS) : name,
                   std::make_shared<const Callback>(std::move(fn)));
}

Result<Value> Handler::operator()(const Event& event, const Args& args) const {
    if (!valid()) {
        return Err<Value>(ErrorKind::InvalidHandler, "Handler: '" + _name + "' is not callable");
    }
    return (*_fn)(event, args);
}

} // namespace ydispatch
