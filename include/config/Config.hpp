#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>

namespace gp::config {

constexpr static uintmax_t MAX_BODY_SIZE_BYTES = 10 * 1024 * 1024; // 10MB

struct HttpServerConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 5000;
    unsigned int threads = 1;
    uintmax_t max_body_size_bytes = MAX_BODY_SIZE_BYTES;
};

struct DatabaseConfig {
    bool enabled = true;
    std::string uri{};           // takes precedence over the discrete fields below when set
    std::string host = "localhost";
    uint16_t port = 5432;
    std::string name = "gitping";
    std::string user = "gitping";
    std::string password{};
    unsigned int pool_size = 4;

    [[nodiscard]] std::string connectionString() const;
};

struct ApiConfig {
    unsigned int default_limit = 50;
    unsigned int max_limit = 100;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum gitping = spdlog::level::info;   // startup/shutdown
    spdlog::level::level_enum http    = spdlog::level::warn;   // 5xx, malformed requests
    spdlog::level::level_enum db      = spdlog::level::err;    // unreachable store, failed tx
    spdlog::level::level_enum webhook = spdlog::level::info;   // one line per received delivery
    spdlog::level::level_enum api     = spdlog::level::info;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::warn;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir = "/var/log/gitping";
    LogLevelsConfig levels;
};

struct Config {
    HttpServerConfig http_server;
    DatabaseConfig database;
    ApiConfig api;
    LoggingConfig logging;
};

inline const std::filesystem::path DEFAULT_CONFIG_PATH = "/etc/gitping/config.yaml";

// Missing file yields the defaults; a malformed file throws YAML::Exception.
Config loadConfig(const std::filesystem::path& path);

// Points a libpq URI (or keyword/value string) at another database; query parameters are kept.
std::string withDatabaseName(const std::string& conn, const std::string& name);

// PORT, DATABASE_URI and DATABASE_NAME override whatever the file said.
// DATABASE_NAME also retargets a configured uri. Throws on a PORT outside 1-65535.
void applyEnvOverrides(Config& cfg);

} // namespace gp::config
