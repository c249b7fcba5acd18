#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace sqlbridge::protocol {

    inline constexpr const char* kJsonRpcVersion = "2.0";

    // Standard JSON-RPC error codes used on the wire
    inline constexpr int kMethodNotFound = -32601;
    inline constexpr int kInternalError = -32603;

    struct RpcError {
        int code = 0;
        std::string message;
        nlohmann::json data;  // null when absent
    };

    // {jsonrpc, id, method, params}
    struct Request {
        std::int64_t id = 0;
        std::string method;
        nlohmann::json params = nlohmann::json::object();
    };

    // {jsonrpc, id, result} or {jsonrpc, id, error}
    struct Response {
        std::int64_t id = 0;
        nlohmann::json result;
        std::optional<RpcError> error;
    };

    // {jsonrpc, method, params}, no id
    struct Notification {
        std::string method;
        nlohmann::json params = nlohmann::json::object();
    };

    // One line on the wire is exactly ONE of these, or opaque output.
    using ProtocolMessage = std::variant<Request, Response, Notification>;

    // std::nullopt means the line is not protocol data (log output, partial
    // JSON, non-object JSON, non-integer ids). Never throws.
    std::optional<ProtocolMessage> parse_message(const std::string& line);

    nlohmann::json to_json(const Request& request);
    nlohmann::json to_json(const Response& response);
    nlohmann::json to_json(const Notification& notification);

    // Single-line encodings without the trailing terminator.
    std::string serialize(const ProtocolMessage& message);

    // For logs and console output. Invalid UTF-8 in strings is replaced by
    // U+FFFD instead of throwing.
    std::string display_json(const nlohmann::json& value, int indent = -1);

} // namespace sqlbridge::protocol
