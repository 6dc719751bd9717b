#include "logging.hpp"
#include <algorithm>

namespace ydispatch {

void configure_logging(const Config& config) {
    spdlog::set_level(config.log_level);
    spdlog::set_pattern(config.log_pattern);
}

std::shared_ptr<LogBuffer> attach_capture_sink(size_t max_size) {
    auto buffer = std::make_shared<LogBuffer>(max_size);
    auto sink = std::make_shared<CaptureSinkMt>(buffer);
    spdlog::default_logger()->sinks().push_back(sink);
    return buffer;
}

void detach_capture_sinks() {
    auto& sinks = spdlog::default_logger()->sinks();
    sinks.erase(std::remove_if(sinks.begin(), sinks.end(),
        [](const spdlog::sink_ptr& s) { return std::dynamic_pointer_cast<CaptureSinkMt>(s) != nullptr; }),
        sinks.end());
}

} // namespace ydispatch
