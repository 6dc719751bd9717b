#pragma once

#include "config.hpp"
#include "error_log.hpp"
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/base_sink.h>

namespace ydispatch {

struct LogEntry {
    std::string message;
    std::string logger_name;
    spdlog::level::level_enum level;
    std::string timestamp;
};

// Bounded, thread-safe buffer of log lines
class LogBuffer {
public:
    explicit LogBuffer(size_t max_size = 1000) : _max_size(max_size ? max_size : 1) {}

    void add(LogEntry entry) {
        std::lock_guard<std::mutex> lock(_mutex);
        _entries.push_back(std::move(entry));
        while (_entries.size() > _max_size) {
            _entries.pop_front();
        }
    }

    [[nodiscard]] std::deque<LogEntry> entries() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _entries;
    }

    [[nodiscard]] size_t size() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _entries.size();
    }

    // Number of buffered lines containing needle
    [[nodiscard]] size_t count_containing(const std::string& needle) const {
        std::lock_guard<std::mutex> lock(_mutex);
        size_t n = 0;
        for (const auto& e : _entries) {
            if (e.message.find(needle) != std::string::npos) ++n;
        }
        return n;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(_mutex);
        _entries.clear();
    }

private:
    mutable std::mutex _mutex;
    std::deque<LogEntry> _entries;
    size_t _max_size;
};

// spdlog sink that copies every message into a LogBuffer
template<typename Mutex>
class CaptureSink : public spdlog::sinks::base_sink<Mutex> {
public:
    explicit CaptureSink(std::shared_ptr<LogBuffer> buffer) : _buffer(std::move(buffer)) {}

    const std::shared_ptr<LogBuffer>& buffer() const { return _buffer; }

protected:
    void sink_it_(const spdlog::details::log_msg& msg) override;
    void flush_() override {}

private:
    std::shared_ptr<LogBuffer> _buffer;
};

using CaptureSinkMt = CaptureSink<std::mutex>;

// Applies level and pattern from the config to the default logger
void configure_logging(const Config& config);

// Attaches a capture sink to the default logger and returns its buffer
std::shared_ptr<LogBuffer> attach_capture_sink(size_t max_size = 1000);

// Removes every capture sink previously attached to the default logger
void detach_capture_sinks();

template<typename Mutex>
void CaptureSink<Mutex>::sink_it_(const spdlog::details::log_msg& msg) {
    LogEntry entry;
    entry.message = std::string(msg.payload.data(), msg.payload.size());
    entry.logger_name = std::string(msg.logger_name.data(), msg.logger_name.size());
    entry.level = msg.level;
    entry.timestamp = format_timestamp_now();
    _buffer->add(std::move(entry));
}

} // namespace ydispatch
