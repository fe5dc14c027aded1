#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Settings for one node, read from the "node" object of config.json.
 */
struct NodeConfig {
    enum class Role { Host, Client };

    std::string username;
    Role role = Role::Client;
    std::string host_address = "127.0.0.1";
    uint16_t port = 65432;
    std::string downloads_dir = "downloads";
    std::size_t chunk_size = 4096;
    /// Longest a single blocked write may wait before the peer is dropped; 0 disables.
    int64_t send_timeout_ms = 10000;
    bool auto_accept = false;
    std::string log_level = "info";

    /// Throws ConfigError for values of the wrong type or out of range.
    static NodeConfig from_json(const nlohmann::json& config);

    /// Throws ConfigError if the file cannot be read or parsed.
    static NodeConfig load(const std::string& path);
};
