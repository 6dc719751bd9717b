#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

namespace ydispatch {

// Source of process-unique identifiers for events, subscriptions and
// notifications. Implementations must be safe to call from any thread and
// must never repeat a value for the lifetime of the generator.
class IdGenerator {
public:
    virtual ~IdGenerator() = default;

    virtual uint64_t next_id() = 0;
    virtual std::string next_code() = 0;
};

using IdGeneratorPtr = std::shared_ptr<IdGenerator>;

// Random 36-character UUIDv4 string
std::string generate_uuid();

// Counter ids, UUIDv4 codes
class DefaultIdGenerator : public IdGenerator {
public:
    uint64_t next_id() override { return _next.fetch_add(1, std::memory_order_relaxed); }
    std::string next_code() override { return generate_uuid(); }

private:
    std::atomic<uint64_t> _next{1};
};

// Process-wide generator used when no generator is injected
IdGeneratorPtr default_id_generator();

} // namespace ydispatch
