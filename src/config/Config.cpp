#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace gp::config {

static std::string escapeUriComponent(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (const unsigned char c : in) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') out += static_cast<char>(c);
        else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }
    }
    return out;
}

std::string DatabaseConfig::connectionString() const {
    if (!uri.empty()) return uri;

    std::string auth = escapeUriComponent(user);
    if (!password.empty()) auth += ":" + escapeUriComponent(password);
    return "postgresql://" + auth + "@" + host + ":" + std::to_string(port) + "/" + name;
}

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    if (!std::filesystem::exists(path)) return cfg;

    const YAML::Node root = YAML::LoadFile(path.string());

    if (auto node = root["http_server"]) YAML::convert<HttpServerConfig>::decode(node, cfg.http_server);
    if (auto node = root["database"]) YAML::convert<DatabaseConfig>::decode(node, cfg.database);
    if (auto node = root["api"]) YAML::convert<ApiConfig>::decode(node, cfg.api);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    return cfg;
}

std::string withDatabaseName(const std::string& conn, const std::string& name) {
    const auto scheme = conn.find("://");
    if (scheme == std::string::npos) return conn + " dbname=" + name;

    const auto query = conn.find('?', scheme + 3);
    const auto authorityEnd = std::min(conn.find('/', scheme + 3), query);
    const auto tail = query == std::string::npos ? std::string{} : conn.substr(query);
    return conn.substr(0, authorityEnd) + "/" + escapeUriComponent(name) + tail;
}

static uint16_t parsePort(const std::string& value) {
    std::size_t consumed = 0;
    const auto port = std::stoul(value, &consumed);
    if (consumed != value.size()) throw std::invalid_argument("PORT is not a number: " + value);
    if (port == 0 || port > std::numeric_limits<uint16_t>::max())
        throw std::out_of_range("PORT must be between 1 and 65535, got " + value);
    return static_cast<uint16_t>(port);
}

void applyEnvOverrides(Config& cfg) {
    if (const char* port = std::getenv("PORT"); port && *port) cfg.http_server.port = parsePort(port);
    if (const char* uri = std::getenv("DATABASE_URI"); uri && *uri) cfg.database.uri = uri;
    if (const char* name = std::getenv("DATABASE_NAME"); name && *name) {
        cfg.database.name = name;
        if (!cfg.database.uri.empty()) cfg.database.uri = withDatabaseName(cfg.database.uri, name);
    }
}

} // namespace gp::config
