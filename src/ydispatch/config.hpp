#pragma once

#include "result.hpp"
#include <cstddef>
#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>

namespace YAML {
class Node;
}

namespace ydispatch {

// Dispatcher and logging settings, loadable from YAML:
//
//   dispatcher:
//     default-namespace: global
//     error-log-size: 1000
//     handler-error-level: warn
//   logging:
//     level: info
//     pattern: "[%H:%M:%S.%e] [%l] %v"
//
// Missing keys keep their defaults.
struct Config {
    std::string default_namespace = "global";
    size_t error_log_size = 1000;
    spdlog::level::level_enum handler_error_level = spdlog::level::warn;

    spdlog::level::level_enum log_level = spdlog::level::info;
    std::string log_pattern = "[%H:%M:%S.%e] [%l] %v";

    static Result<Config> load_file(const std::filesystem::path& path);
    static Result<Config> load_string(const std::string& yaml);
    static Result<Config> from_yaml(const YAML::Node& root);
};

// Accepts spdlog level names: trace, debug, info, warn/warning, error/err, critical, off
Result<spdlog::level::level_enum> parse_level(const std::string& name);

} // namespace ydispatch
