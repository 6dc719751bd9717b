#pragma once

#include <expected>
#include <source_location>
#include <string>
#include <memory>

namespace ydispatch {

// Error taxonomy surfaced by the dispatcher API
enum class ErrorKind {
    Configuration,
    InvalidHandler,
    DuplicateSubscriptionCode,
    SubscriptionLookup,
    DispatchFormat,
    AmbiguousResult,
    HandlerFailure,
    Internal
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Configuration: return "ConfigurationError";
        case ErrorKind::InvalidHandler: return "InvalidHandler";
        case ErrorKind::DuplicateSubscriptionCode: return "DuplicateSubscriptionCode";
        case ErrorKind::SubscriptionLookup: return "SubscriptionLookupError";
        case ErrorKind::DispatchFormat: return "DispatchFormatError";
        case ErrorKind::AmbiguousResult: return "AmbiguousResultError";
        case ErrorKind::HandlerFailure: return "HandlerFailure";
        case ErrorKind::Internal: return "InternalError";
    }
    return "UnknownError";
}

// Error with a kind, chaining and source location
class Error {
public:
    explicit Error(std::string msg, std::source_location loc = std::source_location::current())
        : _msg(std::move(msg)), _loc(loc) {}

    Error(ErrorKind kind, std::string msg, std::source_location loc = std::source_location::current())
        : _kind(kind), _msg(std::move(msg)), _loc(loc) {}

    // Wrapping keeps the kind of the cause so callers can still branch on it
    Error(std::string msg, Error prev_error, std::source_location loc = std::source_location::current())
        : _kind(prev_error.kind()), _msg(std::move(msg)),
          _prev_error(std::make_unique<Error>(std::move(prev_error))), _loc(loc) {}

    // Wrapping under a new kind
    Error(ErrorKind kind, std::string msg, Error prev_error, std::source_location loc = std::source_location::current())
        : _kind(kind), _msg(std::move(msg)),
          _prev_error(std::make_unique<Error>(std::move(prev_error))), _loc(loc) {}

    Error(const Error& other)
        : _kind(other._kind), _msg(other._msg), _loc(other._loc) {
        if (other._prev_error) _prev_error = std::make_unique<Error>(*other._prev_error);
    }

    Error& operator=(const Error& other) {
        if (this != &other) {
            _kind = other._kind;
            _msg = other._msg;
            _loc = other._loc;
            _prev_error = other._prev_error ? std::make_unique<Error>(*other._prev_error) : nullptr;
        }
        return *this;
    }

    Error(Error&&) = default;
    Error& operator=(Error&&) = default;

    [[nodiscard]] ErrorKind kind() const { return _kind; }
    [[nodiscard]] const std::string& message() const { return _msg; }
    [[nodiscard]] const Error* prev_error() const { return _prev_error.get(); }
    [[nodiscard]] const std::source_location& location() const { return _loc; }

    // Innermost message in the chain
    [[nodiscard]] const std::string& root_message() const {
        return _prev_error ? _prev_error->root_message() : _msg;
    }

    [[nodiscard]] std::string to_string() const {
        std::string result = _msg;
        result += " [";
        result += _loc.file_name();
        result += ":";
        result += std::to_string(_loc.line());
        result += "]";
        if (_prev_error) {
            result += " <- ";
            result += _prev_error->to_string();
        }
        return result;
    }

private:
    ErrorKind _kind = ErrorKind::Internal;
    std::string _msg;
    std::unique_ptr<Error> _prev_error;
    std::source_location _loc;
};

template<typename T>
using Result = std::expected<T, Error>;

template<typename T>
[[nodiscard]] inline Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

[[nodiscard]] inline Result<void> Ok() {
    return Result<void>();
}

template<typename T = void>
[[nodiscard]] inline std::unexpected<Error> Err(std::string msg, std::source_location loc = std::source_location::current()) {
    return std::unexpected(Error(std::move(msg), loc));
}

template<typename T = void>
[[nodiscard]] inline std::unexpected<Error> Err(ErrorKind kind, std::string msg, std::source_location loc = std::source_location::current()) {
    return std::unexpected(Error(kind, std::move(msg), loc));
}

template<typename T, typename U>
[[nodiscard]] inline std::unexpected<Error> Err(std::string msg, const Result<U>& prev, std::source_location loc = std::source_location::current()) {
    if (!prev.has_value()) {
        return std::unexpected(Error(std::move(msg), prev.error(), loc));
    }
    return std::unexpected(Error(std::move(msg), loc));
}

template<typename T, typename U>
[[nodiscard]] inline std::unexpected<Error> Err(ErrorKind kind, std::string msg, const Result<U>& prev, std::source_location loc = std::source_location::current()) {
    if (!prev.has_value()) {
        return std::unexpected(Error(kind, std::move(msg), prev.error(), loc));
    }
    return std::unexpected(Error(kind, std::move(msg), loc));
}

// Get error message from result
template<typename T>
[[nodiscard]] inline std::string error_msg(const Result<T>& res) {
    return res.has_value() ? "" : res.error().to_string();
}

// Kind of a failed result, Internal when the result holds a value
template<typename T>
[[nodiscard]] inline ErrorKind error_kind(const Result<T>& res) {
    return res.has_value() ? ErrorKind::Internal : res.error().kind();
}

} // namespace ydispatch
