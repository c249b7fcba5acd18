#pragma once
#include <optional>
#include <string>
#include "core/config/bridge_config.hpp"
#include "core/errors/bridge_errors.hpp"

namespace sqlbridge::app::cli {

    enum class Command {
        Chat,     // interactive shell
        Ask,      // one query, then exit
        Analyze,  // intent analysis only, no server
        Tools     // list discovered tools, then exit
    };

    std::string to_string(Command command);

    struct CliOptions {
        Command command = Command::Chat;
        std::optional<std::string> query;
        core::config::BridgeConfig config;  // file values with flag overrides applied
        bool verbose = false;
    };

    sqlbridge::core::errors::Result<CliOptions> parse_and_validate(int argc, char* argv[]);

    std::string usage();
}
