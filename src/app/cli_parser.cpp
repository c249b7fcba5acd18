#include "cli_parser.hpp"
#include <charconv>
#include <cstdint>
#include <limits>
#include <optional>
#include <system_error>
#include <utility>
#include <vector>

namespace sqlbridge::app::cli {

    using namespace sqlbridge::core::errors;
    using sqlbridge::core::config::BridgeConfig;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> query;
        std::optional<std::string> config_file;
        std::optional<std::string> server;
        std::optional<std::string> runtime;
        std::optional<std::string> host;
        std::optional<std::string> database;
        std::optional<std::string> user;
        std::optional<std::string> password;
        std::optional<std::string> port;
        std::optional<std::string> timeout_ms;
        bool verbose = false;
    };

    namespace {

        std::optional<Command> parse_command(const std::string& text) {
            if (text == "chat") return Command::Chat;
            if (text == "ask") return Command::Ask;
            if (text == "analyze") return Command::Analyze;
            if (text == "tools") return Command::Tools;
            return std::nullopt;
        }

        // Exception-free integer parsing
        Result<std::uint32_t> parse_bounded(const std::string& flag, const std::string& text,
                                            const std::uint32_t min, const std::uint32_t max) {
            std::uint32_t value = 0;
            const char* begin = text.data();
            const char* end = text.data() + text.size();
            auto [ptr, ec] = std::from_chars(begin, end, value);
            if (ec != std::errc() || ptr != end) {
                return BridgeError{ErrorCategory::Input, "Invalid number for " + flag, "invalid_integer", "Provide a positive integer."};
            }
            if (value < min || value > max) {
                return BridgeError{ErrorCategory::Input, flag + " out of bounds", "bounds_error",
                                   "Must be between " + std::to_string(min) + " and " + std::to_string(max) + "."};
            }
            return value;
        }

    }  // namespace

    std::string to_string(const Command command) {
        switch (command) {
            case Command::Chat: return "chat";
            case Command::Ask: return "ask";
            case Command::Analyze: return "analyze";
            case Command::Tools: return "tools";
            default: return "unknown";
        }
    }

    std::string usage() {
        return "Usage: sqlbridge_cli <chat|ask|analyze|tools> [options]\n"
               "  --query <text>        question for ask / analyze\n"
               "  --config <file>       JSON configuration file\n"
               "  --server <path>       MCP server script\n"
               "  --runtime <program>   interpreter for the script (default: node, '' to exec directly)\n"
               "  --host <name>         database server\n"
               "  --database <name>\n"
               "  --user <name>\n"
               "  --password <secret>\n"
               "  --port <n>            database port (default: 1433)\n"
               "  --timeout-ms <n>      per-request timeout (default: 15000)\n"
               "  --verbose             debug logging\n";
    }

    Result<CliOptions> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return BridgeError{ErrorCategory::Input, "No command provided.", "missing_command", usage()};
        }

        const std::string command_text = argv[1];
        const auto command = parse_command(command_text);
        if (!command) {
            return BridgeError{ErrorCategory::Input, "Unknown command: " + command_text, "unknown_command",
                               "Supported commands: chat, ask, analyze, tools."};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        const std::vector<std::pair<std::string, std::optional<std::string>*>> valued = {
            {"--query", &raw.query},       {"--config", &raw.config_file},
            {"--server", &raw.server},     {"--runtime", &raw.runtime},
            {"--host", &raw.host},         {"--database", &raw.database},
            {"--user", &raw.user},         {"--password", &raw.password},
            {"--port", &raw.port},         {"--timeout-ms", &raw.timeout_ms}};

        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--verbose") {
                raw.verbose = true;
                continue;
            }
            bool matched = false;
            for (const auto& [flag, target] : valued) {
                if (args[i] != flag) {
                    continue;
                }
                if (i + 1 >= args.size()) {
                    return BridgeError{ErrorCategory::Input, "Missing value for " + flag, "missing_value"};
                }
                *target = args[++i];
                matched = true;
                break;
            }
            if (!matched) {
                return BridgeError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument"};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        CliOptions options;
        options.command = *command;
        options.verbose = raw.verbose;

        if (options.command == Command::Ask || options.command == Command::Analyze) {
            if (!raw.query || raw.query->empty()) {
                return BridgeError{ErrorCategory::Input, "The " + command_text + " command requires --query", "missing_required_flag"};
            }
            options.query = raw.query;
        } else if (raw.query) {
            return BridgeError{ErrorCategory::Input, "--query is only valid with ask or analyze", "conflicting_flags"};
        }

        BridgeConfig config;
        if (raw.config_file) {
            auto loaded = sqlbridge::core::config::load_config_file(*raw.config_file);
            if (is_error(loaded)) return get_error(loaded);
            config = get_value(loaded);
        }

        if (raw.server) config.server.script = *raw.server;
        if (raw.runtime) config.server.runtime = *raw.runtime;
        if (raw.host) config.connection.server = *raw.host;
        if (raw.database) config.connection.database = *raw.database;
        if (raw.user) config.connection.user = *raw.user;
        if (raw.password) config.connection.password = *raw.password;

        if (raw.port) {
            auto port = parse_bounded("--port", *raw.port, 1, std::numeric_limits<std::uint16_t>::max());
            if (is_error(port)) return get_error(port);
            config.connection.port = static_cast<std::uint16_t>(get_value(port));
        }
        if (raw.timeout_ms) {
            auto timeout = parse_bounded("--timeout-ms", *raw.timeout_ms, 1, 3600000);
            if (is_error(timeout)) return get_error(timeout);
            config.timeouts.request_ms = get_value(timeout);
        }

        // Offline analysis never starts the server.
        if (options.command != Command::Analyze) {
            auto validated = sqlbridge::core::config::validate_config(std::move(config));
            if (is_error(validated)) return get_error(validated);
            config = get_value(validated);
        }
        options.config = std::move(config);

        return options;
    }

} // namespace sqlbridge::app::cli
