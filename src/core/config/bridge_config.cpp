#include "core/config/bridge_config.hpp"

#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <system_error>

namespace sqlbridge::core::config {

using core::errors::BridgeError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

BridgeError config_error(const std::string& message) {
    return BridgeError{ErrorCategory::Input, message, "invalid_config"};
}

std::string bool_text(const bool value) {
    return value ? "true" : "false";
}

core::errors::Result<std::string> read_string(const json& object, const char* key,
                                              const std::string& fallback) {
    if (!object.contains(key)) {
        return fallback;
    }
    if (!object.at(key).is_string()) {
        return config_error(std::string("Expected a string for '") + key + "'");
    }
    return object.at(key).get<std::string>();
}

core::errors::Result<std::uint32_t> read_millis(const json& object, const char* key,
                                                const std::uint32_t fallback) {
    if (!object.contains(key)) {
        return fallback;
    }
    const auto& value = object.at(key);
    if (!value.is_number_integer() || value.get<std::int64_t>() < 0 ||
        value.get<std::int64_t>() > std::numeric_limits<std::uint32_t>::max()) {
        return config_error(std::string("Expected a non-negative integer for '") + key +
                            "'");
    }
    return value.get<std::uint32_t>();
}

core::errors::Result<bool> read_flag(const json& object, const char* key,
                                     const bool fallback) {
    if (!object.contains(key)) {
        return fallback;
    }
    if (!object.at(key).is_boolean()) {
        return config_error(std::string("Expected a boolean for '") + key + "'");
    }
    return object.at(key).get<bool>();
}

}  // namespace

core::errors::Result<BridgeConfig> load_config_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return BridgeError{ErrorCategory::Input,
                           "Config file does not exist: " + path.string(),
                           "config_not_found"};
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        return BridgeError{ErrorCategory::Input,
                           "Failed to open config file: " + path.string(),
                           "config_not_found"};
    }

    json document;
    try {
        in >> document;
    } catch (const json::parse_error& e) {
        return BridgeError{ErrorCategory::Input,
                           "Malformed JSON in config file " + path.string() + ": " +
                               e.what(),
                           "invalid_config"};
    }

    auto parsed = parse_config(document);
    if (core::errors::is_error(parsed)) {
        auto err = core::errors::get_error(parsed);
        err.message = path.string() + ": " + err.message;
        return err;
    }

    // Relative script paths are resolved against the config file location.
    auto config = core::errors::get_value(parsed);
    if (!config.server.script.empty() && config.server.script.is_relative()) {
        config.server.script = path.parent_path() / config.server.script;
    }
    return config;
}

core::errors::Result<BridgeConfig> parse_config(const json& document) {
    if (!document.is_object()) {
        return config_error("Config root must be a JSON object");
    }

    BridgeConfig config;

    if (document.contains("server")) {
        const auto& server = document.at("server");
        if (!server.is_object()) {
            return config_error("'server' must be an object");
        }
        auto runtime = read_string(server, "runtime", config.server.runtime);
        if (core::errors::is_error(runtime)) return core::errors::get_error(runtime);
        auto script = read_string(server, "script", "");
        if (core::errors::is_error(script)) return core::errors::get_error(script);
        auto cwd = read_string(server, "working_directory", "");
        if (core::errors::is_error(cwd)) return core::errors::get_error(cwd);

        config.server.runtime = core::errors::get_value(runtime);
        config.server.script = core::errors::get_value(script);
        config.server.working_directory = core::errors::get_value(cwd);

        if (server.contains("args")) {
            const auto& args = server.at("args");
            if (!args.is_array()) {
                return config_error("'server.args' must be an array of strings");
            }
            for (const auto& arg : args) {
                if (!arg.is_string()) {
                    return config_error("'server.args' must be an array of strings");
                }
                config.server.args.push_back(arg.get<std::string>());
            }
        }
    }

    if (document.contains("connection")) {
        const auto& connection = document.at("connection");
        if (!connection.is_object()) {
            return config_error("'connection' must be an object");
        }
        auto host = read_string(connection, "server", config.connection.server);
        if (core::errors::is_error(host)) return core::errors::get_error(host);
        auto database = read_string(connection, "database", "");
        if (core::errors::is_error(database)) return core::errors::get_error(database);
        auto user = read_string(connection, "user", "");
        if (core::errors::is_error(user)) return core::errors::get_error(user);
        auto password = read_string(connection, "password", "");
        if (core::errors::is_error(password)) return core::errors::get_error(password);

        config.connection.server = core::errors::get_value(host);
        config.connection.database = core::errors::get_value(database);
        config.connection.user = core::errors::get_value(user);
        config.connection.password = core::errors::get_value(password);

        if (connection.contains("port")) {
            const auto& port = connection.at("port");
            if (!port.is_number_integer() || port.get<std::int64_t>() < 1 ||
                port.get<std::int64_t>() > std::numeric_limits<std::uint16_t>::max()) {
                return config_error("'connection.port' must be between 1 and 65535");
            }
            config.connection.port = port.get<std::uint16_t>();
        }

        if (connection.contains("options")) {
            const auto& options = connection.at("options");
            if (!options.is_object()) {
                return config_error("'connection.options' must be an object");
            }
            auto encrypt = read_flag(options, "encrypt", config.connection.encrypt);
            if (core::errors::is_error(encrypt)) return core::errors::get_error(encrypt);
            auto trust = read_flag(options, "trustServerCertificate",
                                   config.connection.trust_server_certificate);
            if (core::errors::is_error(trust)) return core::errors::get_error(trust);
            config.connection.encrypt = core::errors::get_value(encrypt);
            config.connection.trust_server_certificate = core::errors::get_value(trust);
        }
    }

    if (document.contains("timeouts")) {
        const auto& timeouts = document.at("timeouts");
        if (!timeouts.is_object()) {
            return config_error("'timeouts' must be an object");
        }
        auto request = read_millis(timeouts, "request_ms", config.timeouts.request_ms);
        if (core::errors::is_error(request)) return core::errors::get_error(request);
        auto grace = read_millis(timeouts, "startup_grace_ms",
                                 config.timeouts.startup_grace_ms);
        if (core::errors::is_error(grace)) return core::errors::get_error(grace);
        auto shutdown = read_millis(timeouts, "shutdown_grace_ms",
                                    config.timeouts.shutdown_grace_ms);
        if (core::errors::is_error(shutdown)) return core::errors::get_error(shutdown);

        config.timeouts.request_ms = core::errors::get_value(request);
        config.timeouts.startup_grace_ms = core::errors::get_value(grace);
        config.timeouts.shutdown_grace_ms = core::errors::get_value(shutdown);
    }

    if (document.contains("client")) {
        const auto& client = document.at("client");
        if (!client.is_object()) {
            return config_error("'client' must be an object");
        }
        auto name = read_string(client, "name", config.client.name);
        if (core::errors::is_error(name)) return core::errors::get_error(name);
        auto version = read_string(client, "version", config.client.version);
        if (core::errors::is_error(version)) return core::errors::get_error(version);
        auto protocol = read_string(client, "protocol_version",
                                    config.client.protocol_version);
        if (core::errors::is_error(protocol)) return core::errors::get_error(protocol);

        config.client.name = core::errors::get_value(name);
        config.client.version = core::errors::get_value(version);
        config.client.protocol_version = core::errors::get_value(protocol);
    }

    if (document.contains("artifact_directory")) {
        auto dir = read_string(document, "artifact_directory", "");
        if (core::errors::is_error(dir)) return core::errors::get_error(dir);
        config.artifact_directory = core::errors::get_value(dir);
    }

    if (document.contains("entities")) {
        const auto& entities = document.at("entities");
        if (!entities.is_array()) {
            return config_error("'entities' must be an array");
        }
        for (const auto& entity : entities) {
            if (!entity.is_object() || !entity.contains("name") ||
                !entity.at("name").is_string() || !entity.contains("synonyms") ||
                !entity.at("synonyms").is_array()) {
                return config_error(
                    "Each entity needs a string 'name' and a 'synonyms' array");
            }
            std::vector<std::string> synonyms;
            for (const auto& synonym : entity.at("synonyms")) {
                if (!synonym.is_string() || synonym.get<std::string>().empty()) {
                    return config_error("Entity synonyms must be non-empty strings");
                }
                synonyms.push_back(synonym.get<std::string>());
            }
            config.entities.emplace_back(entity.at("name").get<std::string>(),
                                         std::move(synonyms));
        }
    }

    return config;
}

core::errors::Result<BridgeConfig> validate_config(BridgeConfig config) {
    if (config.server.script.empty()) {
        return BridgeError{ErrorCategory::Input, "No MCP server script configured.",
                           "missing_server",
                           "Pass --server <path> or set server.script in the config file."};
    }
    if (config.timeouts.request_ms == 0) {
        return BridgeError{ErrorCategory::Input, "Request timeout must be positive.",
                           "invalid_timeout"};
    }
    // The child may run in another directory, so the script path must not be relative.
    std::error_code ec;
    const auto script = std::filesystem::absolute(config.server.script, ec);
    if (ec) {
        return BridgeError{ErrorCategory::Input,
                           "Unable to resolve server script: " + config.server.script.string(),
                           "invalid_server_path"};
    }
    config.server.script = script.lexically_normal();
    // The connection block is serialized into the config artifact.
    try {
        (void)connection_payload(config.connection).dump();
    } catch (const json::type_error&) {
        return BridgeError{ErrorCategory::Input,
                           "Connection settings must be valid UTF-8 text.",
                           "invalid_encoding"};
    }
    if (config.server.working_directory.empty()) {
        config.server.working_directory = config.server.script.parent_path();
    }
    return config;
}

json connection_payload(const ConnectionConfig& connection) {
    json payload;
    payload["server"] = connection.server;
    payload["database"] = connection.database;
    payload["user"] = connection.user;
    payload["password"] = connection.password;
    payload["port"] = connection.port;
    payload["options"] = {{"encrypt", connection.encrypt},
                          {"trustServerCertificate", connection.trust_server_certificate}};
    return payload;
}

std::string database_url(const ConnectionConfig& connection) {
    std::ostringstream out;
    out << "Server=" << connection.server << ";Database=" << connection.database
        << ";User Id=" << connection.user << ";Password=" << connection.password
        << ";TrustServerCertificate=true;Encrypt=true;";
    return out.str();
}

std::map<std::string, std::string> server_environment(
    const ConnectionConfig& connection) {
    const std::string port = std::to_string(connection.port);
    return {
        {"MSSQL_SERVER", connection.server},
        {"MSSQL_USER", connection.user},
        {"MSSQL_PASSWORD", connection.password},
        {"MSSQL_DATABASE", connection.database},
        {"MSSQL_PORT", port},
        {"MSSQL_ENCRYPT", bool_text(connection.encrypt)},
        {"MSSQL_TRUST_SERVER_CERTIFICATE", bool_text(connection.trust_server_certificate)},
        {"DB_SERVER", connection.server},
        {"DB_USER", connection.user},
        {"DB_PASSWORD", connection.password},
        {"DB_DATABASE", connection.database},
        {"DB_PORT", port},
        {"DATABASE_URL", database_url(connection)},
    };
}

}  // namespace sqlbridge::core::config
