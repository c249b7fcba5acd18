#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace sqlbridge::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Spawn,           // The server executable could not be launched
        EarlyExit,       // The server died inside the startup grace window
        Timeout,         // A request received no response before its deadline
        Remote,          // The server answered with a JSON-RPC error object
        SessionClosed,   // The session was shut down or the server went away
        NoSuitableTool,  // No discovered tool satisfies a capability
        Input,           // Bad CLI flag, config file or API misuse
        Internal         // OS / IO failure on our side
    };

    // The standardized error payload
    struct BridgeError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";
        std::optional<std::int64_t> request_id;  // Timeout / Remote / SessionClosed
        std::optional<int> remote_code;          // JSON-RPC error.code for Remote
    };

    // 2. Propagation strategy: a Result holds either a value of type T or a BridgeError.
    template <typename T>
    using Result = std::variant<T, BridgeError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<BridgeError>(result);
    }

    template <typename T>
    const BridgeError& get_error(const Result<T>& result) {
        return std::get<BridgeError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    template <typename T>
    T& get_value(Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Spawn: return "spawn";
            case ErrorCategory::EarlyExit: return "early_exit";
            case ErrorCategory::Timeout: return "timeout";
            case ErrorCategory::Remote: return "remote";
            case ErrorCategory::SessionClosed: return "session_closed";
            case ErrorCategory::NoSuitableTool: return "no_suitable_tool";
            case ErrorCategory::Input: return "input";
            case ErrorCategory::Internal: return "internal";
            default: return "unknown";
        }
    }

    // 3. Constructors for the taxonomy, so codes stay stable across modules
    inline BridgeError spawn_error(const std::string& message) {
        return BridgeError{ErrorCategory::Spawn, message, "spawn_failed"};
    }

    inline BridgeError early_exit_error(const int exit_code) {
        return BridgeError{ErrorCategory::EarlyExit,
                           "Server process exited during startup with code " +
                               std::to_string(exit_code),
                           "early_exit",
                           "Check the server path, runtime and connection settings."};
    }

    inline BridgeError timeout_error(const std::int64_t id) {
        BridgeError error{ErrorCategory::Timeout,
                          "Request timeout for message ID: " + std::to_string(id),
                          "request_timeout"};
        error.request_id = id;
        return error;
    }

    inline BridgeError remote_error(const std::int64_t id, const int code,
                                    const std::string& message) {
        BridgeError error{ErrorCategory::Remote, message, "remote_error"};
        error.request_id = id;
        error.remote_code = code;
        return error;
    }

    inline BridgeError session_closed_error(const std::string& reason) {
        return BridgeError{ErrorCategory::SessionClosed, reason, "session_closed"};
    }

    inline BridgeError no_suitable_tool_error(const std::string& capability) {
        return BridgeError{ErrorCategory::NoSuitableTool,
                           "No tool found for capability: " + capability,
                           "no_suitable_tool",
                           "Type 'tools' to see what the server offers."};
    }

} // namespace sqlbridge::core::errors
