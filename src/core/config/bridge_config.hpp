#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/bridge_errors.hpp"

namespace sqlbridge::core::config {

struct ServerLaunch {
    std::string runtime = "node";  // empty: execute the script directly
    std::filesystem::path script;
    std::vector<std::string> args;
    std::filesystem::path working_directory;  // empty: directory of the script
};

struct ConnectionConfig {
    std::string server = "localhost";
    std::string database;
    std::string user;
    std::string password;
    std::uint16_t port = 1433;
    bool encrypt = true;
    bool trust_server_certificate = true;
};

struct Timeouts {
    std::uint32_t request_ms = 15000;
    std::uint32_t startup_grace_ms = 2000;
    std::uint32_t shutdown_grace_ms = 5000;
};

struct ClientIdentity {
    std::string name = "sqlbridge";
    std::string version = "1.0.0";
    std::string protocol_version = "2024-11-05";
};

// Ordered: the analyzer keeps entity matches in this order.
using EntityTable = std::vector<std::pair<std::string, std::vector<std::string>>>;

struct BridgeConfig {
    ServerLaunch server;
    ConnectionConfig connection;
    Timeouts timeouts;
    ClientIdentity client;
    std::filesystem::path artifact_directory = std::filesystem::temp_directory_path();
    EntityTable entities;  // empty: analyzer default table
};

core::errors::Result<BridgeConfig> load_config_file(const std::filesystem::path& path);
core::errors::Result<BridgeConfig> parse_config(const nlohmann::json& document);

core::errors::Result<BridgeConfig> validate_config(BridgeConfig config);

// Payload of the temporary file handed to the server via --config.
nlohmann::json connection_payload(const ConnectionConfig& connection);

// Variables layered on top of the parent environment for the server process.
std::map<std::string, std::string> server_environment(const ConnectionConfig& connection);

std::string database_url(const ConnectionConfig& connection);

}  // namespace sqlbridge::core::config
