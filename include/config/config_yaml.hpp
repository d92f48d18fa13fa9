#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace gp::config;

inline spdlog::level::level_enum levelOr(const Node& node, const spdlog::level::level_enum def) {
    if (!node) return def;
    return spdlog::level::from_str(node.as<std::string>());
}

template<>
struct convert<HttpServerConfig> {
    static bool decode(const Node& node, HttpServerConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.host = node["host"].as<std::string>("0.0.0.0");
        rhs.port = node["port"].as<uint16_t>(5000);
        rhs.threads = node["threads"].as<unsigned int>(1);
        rhs.max_body_size_bytes = node["max_body_size_mb"].as<uintmax_t>(10) * 1024 * 1024;
        return true;
    }
};

template<>
struct convert<DatabaseConfig> {
    static bool decode(const Node& node, DatabaseConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.enabled = node["enabled"].as<bool>(true);
        rhs.uri = node["uri"].as<std::string>("");
        rhs.host = node["host"].as<std::string>("localhost");
        rhs.port = node["port"].as<uint16_t>(5432);
        rhs.name = node["name"].as<std::string>("gitping");
        rhs.user = node["user"].as<std::string>("gitping");
        rhs.password = node["password"].as<std::string>("");
        rhs.pool_size = node["pool_size"].as<unsigned int>(4);
        return true;
    }
};

template<>
struct convert<ApiConfig> {
    static bool decode(const Node& node, ApiConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.default_limit = node["default_limit"].as<unsigned int>(50);
        rhs.max_limit = node["max_limit"].as<unsigned int>(100);
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.gitping = levelOr(node["gitping"], spdlog::level::info);
        rhs.http    = levelOr(node["http"], spdlog::level::warn);
        rhs.db      = levelOr(node["db"], spdlog::level::err);
        rhs.webhook = levelOr(node["webhook"], spdlog::level::info);
        rhs.api     = levelOr(node["api"], spdlog::level::info);
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = levelOr(node["console_log_level"], spdlog::level::info);
        rhs.file_log_level = levelOr(node["file_log_level"], spdlog::level::warn);
        if (node["subsystem_levels"])
            convert<SubsystemLogLevelsConfig>::decode(node["subsystem_levels"], rhs.subsystem_levels);
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("/var/log/gitping");
        if (node["levels"]) convert<LogLevelsConfig>::decode(node["levels"], rhs.levels);
        return true;
    }
};

}
