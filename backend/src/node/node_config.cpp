#include "node/node_config.h"

#include <array>
#include <fstream>

using json = nlohmann::json;

NodeConfig NodeConfig::from_json(const json& config) {
    if (!config.contains("node") || !config["node"].is_object()) {
        throw ConfigError("config has no \"node\" object");
    }
    const json& node = config["node"];
    NodeConfig out;

    try {
        out.username      = node.value("username", out.username);
        out.host_address  = node.value("host_address", out.host_address);
        out.downloads_dir = node.value("downloads_dir", out.downloads_dir);
        out.auto_accept   = node.value("auto_accept", out.auto_accept);
        out.log_level     = node.value("log_level", out.log_level);

        auto port = node.value("port", static_cast<int64_t>(out.port));
        if (port < 0 || port > 65535) {
            throw ConfigError("port out of range: " + std::to_string(port));
        }
        out.port = static_cast<uint16_t>(port);

        auto chunk = node.value("chunk_size", static_cast<int64_t>(out.chunk_size));
        if (chunk <= 0) {
            throw ConfigError("chunk_size must be positive");
        }
        out.chunk_size = static_cast<std::size_t>(chunk);

        out.send_timeout_ms = node.value("send_timeout_ms", out.send_timeout_ms);
        if (out.send_timeout_ms < 0) {
            throw ConfigError("send_timeout_ms must not be negative");
        }

        std::string role = node.value("role", std::string("client"));
        if (role == "host") {
            out.role = Role::Host;
        } else if (role == "client") {
            out.role = Role::Client;
        } else {
            throw ConfigError("unknown role: " + role);
        }
    } catch (const json::exception& e) {
        throw ConfigError(std::string("invalid config value: ") + e.what());
    }

    static const std::array<const char*, 7> levels = {
        "trace", "debug", "info", "warn", "error", "critical", "off"};
    bool known = false;
    for (const char* level : levels) {
        if (out.log_level == level) known = true;
    }
    if (!known) {
        throw ConfigError("unknown log_level: " + out.log_level);
    }
    return out;
}

NodeConfig NodeConfig::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + path);
    }
    json config;
    try {
        config = json::parse(file);
    } catch (const json::parse_error& e) {
        throw ConfigError("Cannot parse " + path + ": " + e.what());
    }
    return from_json(config);
}
