#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "app/cli_parser.hpp"
#include "core/errors/bridge_errors.hpp"
#include "support/scripted_transport.hpp"

namespace {

using sqlbridge::app::cli::CliOptions;
using sqlbridge::app::cli::Command;
using sqlbridge::app::cli::parse_and_validate;
using sqlbridge::core::errors::ErrorCategory;
using sqlbridge::core::errors::get_error;
using sqlbridge::core::errors::get_value;
using sqlbridge::core::errors::is_error;
using sqlbridge::testing::TempDirectory;

sqlbridge::core::errors::Result<CliOptions> parse_tokens(
    const std::vector<std::string>& tokens) {
    std::vector<std::string> owned_args;
    owned_args.reserve(tokens.size() + 1);
    owned_args.emplace_back("sqlbridge_cli");
    for (const auto& token : tokens) {
        owned_args.push_back(token);
    }

    std::vector<char*> argv;
    argv.reserve(owned_args.size());
    for (auto& arg : owned_args) {
        argv.push_back(arg.data());
    }

    return parse_and_validate(static_cast<int>(argv.size()), argv.data());
}

TEST(CliParserTest, FailsWhenCommandMissing) {
    auto result = parse_tokens({});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(result).code, "missing_command");
    EXPECT_NE(get_error(result).hint.find("Usage:"), std::string::npos);
}

TEST(CliParserTest, FailsWhenCommandUnknown) {
    auto result = parse_tokens({"status"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_command");
}

TEST(CliParserTest, FailsWhenAskHasNoQuery) {
    auto result = parse_tokens({"ask", "--server", "/opt/mcp/index.js"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_required_flag");
}

TEST(CliParserTest, FailsWhenQueryGivenToChat) {
    auto result = parse_tokens({"chat", "--query", "list tables"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "conflicting_flags");
}

TEST(CliParserTest, FailsWhenFlagValueMissing) {
    auto result = parse_tokens({"tools", "--server"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_value");
}

TEST(CliParserTest, FailsOnUnknownArgument) {
    auto result = parse_tokens({"tools", "--server", "/opt/mcp/index.js", "--fast"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_argument");
}

TEST(CliParserTest, FailsWhenPortNotNumeric) {
    auto result = parse_tokens({"tools", "--server", "/opt/mcp/index.js", "--port", "14x3"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_integer");
}

TEST(CliParserTest, FailsWhenPortOutOfBounds) {
    auto result = parse_tokens({"tools", "--server", "/opt/mcp/index.js", "--port", "70000"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "bounds_error");
}

TEST(CliParserTest, FailsWhenTimeoutIsZero) {
    auto result =
        parse_tokens({"tools", "--server", "/opt/mcp/index.js", "--timeout-ms", "0"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "bounds_error");
}

TEST(CliParserTest, FailsWhenServerMissing) {
    auto result = parse_tokens({"chat"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_server");
}

TEST(CliParserTest, AnalyzeNeedsNoServer) {
    auto result = parse_tokens({"analyze", "--query", "how many tickets are open?"});
    ASSERT_FALSE(is_error(result));
    const auto& options = get_value(result);
    EXPECT_EQ(options.command, Command::Analyze);
    EXPECT_EQ(options.query.value_or(""), "how many tickets are open?");
}

TEST(CliParserTest, ParsesAskWithConnectionFlags) {
    auto result = parse_tokens({"ask", "--query", "list tables", "--server",
                                "/opt/mcp/index.js", "--host", "db.internal", "--database",
                                "sales", "--user", "reader", "--password", "secret",
                                "--port", "1444", "--timeout-ms", "2500", "--verbose"});
    ASSERT_FALSE(is_error(result));

    const auto& options = get_value(result);
    EXPECT_EQ(options.command, Command::Ask);
    EXPECT_TRUE(options.verbose);
    EXPECT_EQ(options.config.server.script.string(), "/opt/mcp/index.js");
    EXPECT_EQ(options.config.server.runtime, "node");
    EXPECT_EQ(options.config.server.working_directory.string(), "/opt/mcp");
    EXPECT_EQ(options.config.connection.server, "db.internal");
    EXPECT_EQ(options.config.connection.database, "sales");
    EXPECT_EQ(options.config.connection.user, "reader");
    EXPECT_EQ(options.config.connection.password, "secret");
    EXPECT_EQ(options.config.connection.port, 1444);
    EXPECT_EQ(options.config.timeouts.request_ms, 2500u);
}

TEST(CliParserTest, FlagsOverrideConfigFile) {
    TempDirectory dir;
    const auto config_path = dir.root() / "bridge.json";
    {
        std::ofstream out(config_path);
        out << R"({"server": {"script": "server/index.js", "runtime": "nodejs"},
                   "connection": {"server": "file-host", "database": "file-db"}})";
    }

    auto result = parse_tokens({"tools", "--config", config_path.string(), "--database",
                                "flag-db", "--runtime", ""});
    ASSERT_FALSE(is_error(result));

    const auto& config = get_value(result).config;
    EXPECT_EQ(config.server.script.string(), (dir.root() / "server" / "index.js").string());
    EXPECT_EQ(config.server.runtime, "");
    EXPECT_EQ(config.connection.server, "file-host");
    EXPECT_EQ(config.connection.database, "flag-db");
}

TEST(CliParserTest, MissingConfigFileIsReported) {
    auto result = parse_tokens({"chat", "--config", "/nonexistent/bridge.json"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "config_not_found");
}

}  // namespace
