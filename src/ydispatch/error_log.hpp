#pragma once

#include "result.hpp"
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <spdlog/spdlog.h>

namespace ydispatch {

// Bounded ring of recent handler failures, shared by all threads
// dispatching through one Dispatcher. Every entry is also written to spdlog.
class ErrorLog {
public:
    struct Entry {
        Error error;
        std::string ns;
        spdlog::level::level_enum level;
        std::string timestamp;
    };

    explicit ErrorLog(size_t max_size = 1000, spdlog::level::level_enum level = spdlog::level::warn)
        : _max_size(max_size ? max_size : 1), _level(level) {}

    void add(Error error, const std::string& ns);

    // Newest last
    [[nodiscard]] std::deque<Entry> entries() const;
    [[nodiscard]] size_t size() const;
    [[nodiscard]] size_t max_size() const;

    spdlog::level::level_enum level() const { return _level; }

private:
    mutable std::mutex _mutex;
    std::deque<Entry> _entries;
    size_t _max_size;
    spdlog::level::level_enum _level;
};

// "HH:MM:SS.mmm" local time
std::string format_timestamp_now();

} // namespace ydispatch
