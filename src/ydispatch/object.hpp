#pragma once

#include "result.hpp"
#include "id_generator.hpp"
#include <string>

namespace ydispatch {

// Base class for long-lived ydispatch objects with lifecycle management
class Object {
public:
    Object() : uid_(generate_uuid()) {}
    virtual ~Object() = default;

    Object(const Object&) = delete;
    Object& operator=(const Object&) = delete;

    // Unique identifier
    const std::string& uid() const { return uid_; }

    // Lifecycle - override in subclasses
    virtual Result<void> init() { return Ok(); }
    virtual Result<void> dispose() { return Ok(); }

protected:
    std::string uid_;
};

} // namespace ydispatch
