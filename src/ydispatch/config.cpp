#include "config.hpp"
#include <yaml-cpp/yaml.h>

namespace ydispatch {

Result<spdlog::level::level_enum> parse_level(const std::string& name) {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error" || name == "err") return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off") return spdlog::level::off;
    return Err<spdlog::level::level_enum>(ErrorKind::Configuration, "unknown log level '" + name + "'");
}

Result<Config> Config::load_file(const std::filesystem::path& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        return Err<Config>(ErrorKind::Configuration,
            "Config::load_file: " + path.string() + ": " + std::string(e.what()));
    }

    auto res = from_yaml(root);
    if (!res) {
        return Err<Config>("Config::load_file: invalid config in " + path.string(), res);
    }
    return res;
}

Result<Config> Config::load_string(const std::string& yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml);
    } catch (const YAML::Exception& e) {
        return Err<Config>(ErrorKind::Configuration, "Config::load_string: YAML parse error: " + std::string(e.what()));
    }
    return from_yaml(root);
}

Result<Config> Config::from_yaml(const YAML::Node& root) {
    Config config;

    if (!root || root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        return Err<Config>(ErrorKind::Configuration, "Config: top level must be a mapping");
    }

    try {
        if (auto dispatcher = root["dispatcher"]) {
            if (auto ns = dispatcher["default-namespace"]) {
                config.default_namespace = ns.as<std::string>();
                if (config.default_namespace.empty()) {
                    return Err<Config>(ErrorKind::Configuration, "Config: dispatcher.default-namespace is empty");
                }
            }
            if (auto size = dispatcher["error-log-size"]) {
                auto n = size.as<long long>();
                if (n <= 0) {
                    return Err<Config>(ErrorKind::Configuration,
                        "Config: dispatcher.error-log-size must be positive, got " + std::to_string(n));
                }
                config.error_log_size = static_cast<size_t>(n);
            }
            if (auto level = dispatcher["handler-error-level"]) {
                auto res = parse_level(level.as<std::string>());
                if (!res) {
                    return Err<Config>("Config: dispatcher.handler-error-level", res);
                }
                config.handler_error_level = *res;
            }
        }

        if (auto logging = root["logging"]) {
            if (auto level = logging["level"]) {
                auto res = parse_level(level.as<std::string>());
                if (!res) {
                    return Err<Config>("Config: logging.level", res);
                }
                config.log_level = *res;
            }
            if (auto pattern = logging["pattern"]) {
                config.log_pattern = pattern.as<std::string>();
            }
        }
    } catch (const YAML::Exception& e) {
        return Err<Config>(ErrorKind::Configuration, "Config: bad value: " + std::string(e.what()));
    }

    return config;
}

} // namespace ydispatch
