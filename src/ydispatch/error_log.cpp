#include "error_log.hpp"
#include <chrono>
#include <ctime>

namespace ydispatch {

std::string format_timestamp_now() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t);
#else
    localtime_r(&time_t, &tm_buf);
#endif

    char timestamp[32];
    std::strftime(timestamp, sizeof(timestamp), "%H:%M:%S", &tm_buf);

    std::string ms_str = std::to_string(ms.count());
    while (ms_str.size() < 3) ms_str = "0" + ms_str;
    return std::string(timestamp) + "." + ms_str;
}

void ErrorLog::add(Error error, const std::string& ns) {
    spdlog::log(_level, "[{}] {}: {}", ns, error_kind_name(error.kind()), error.to_string());

    std::lock_guard<std::mutex> lock(_mutex);
    _entries.push_back({std::move(error), ns, _level, format_timestamp_now()});
    while (_entries.size() > _max_size) {
        _entries.pop_front();
    }
}

std::deque<ErrorLog::Entry> ErrorLog::entries() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _entries;
}

size_t ErrorLog::size() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _entries.size();
}

size_t ErrorLog::max_size() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _max_size;
}

} // namespace ydispatch
