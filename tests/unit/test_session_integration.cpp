#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/bridge_config.hpp"
#include "core/errors/bridge_errors.hpp"
#include "runtime/query_runner.hpp"
#include "session/protocol_session.hpp"
#include "support/scripted_transport.hpp"

#ifndef SQLBRIDGE_FAKE_SERVER_PATH
#error "SQLBRIDGE_FAKE_SERVER_PATH must point at the fake_mcp_server binary"
#endif

namespace {

using namespace std::chrono_literals;
using nlohmann::json;
using sqlbridge::core::config::BridgeConfig;
using sqlbridge::core::errors::ErrorCategory;
using sqlbridge::core::errors::get_error;
using sqlbridge::core::errors::get_value;
using sqlbridge::core::errors::is_error;
using sqlbridge::runtime::QueryRunner;
using sqlbridge::session::ProtocolSession;
using sqlbridge::session::SessionState;
using sqlbridge::testing::TempDirectory;

BridgeConfig fake_server(const std::string& mode, const TempDirectory& dir) {
    BridgeConfig config;
    config.server.runtime = "";
    config.server.script = SQLBRIDGE_FAKE_SERVER_PATH;
    config.server.args = {"--mode", mode};
    config.connection.server = "db-host";
    config.connection.database = "sales";
    config.connection.user = "reader";
    config.connection.password = "secret";
    config.connection.port = 1455;
    config.timeouts.request_ms = 3000;
    config.timeouts.startup_grace_ms = 100;
    config.timeouts.shutdown_grace_ms = 1000;
    config.artifact_directory = dir.root();
    return config;
}

std::unique_ptr<ProtocolSession> launch_ready(const BridgeConfig& config) {
    auto launched = ProtocolSession::launch(config);
    if (is_error(launched)) {
        ADD_FAILURE() << "launch failed: " << get_error(launched).message;
        return nullptr;
    }
    auto session = std::move(get_value(launched));
    auto initialized = session->initialize();
    if (is_error(initialized)) {
        ADD_FAILURE() << "initialize failed: " << get_error(initialized).message;
        return nullptr;
    }
    return session;
}

bool directory_is_empty(const std::filesystem::path& dir) {
    return std::filesystem::directory_iterator(dir) == std::filesystem::directory_iterator();
}

TEST(SessionIntegrationTest, LaunchHandshakeCallAndTeardown) {
    TempDirectory dir;
    auto session = launch_ready(fake_server("normal", dir));
    ASSERT_NE(session, nullptr);

    EXPECT_EQ(session->state(), SessionState::Ready);
    EXPECT_EQ(session->tools().size(), 4u);
    EXPECT_TRUE(session->has_tool("inspect"));
    EXPECT_EQ(session->server_info().at("serverInfo").at("name"), "fake-mcp-server");
    EXPECT_EQ(session->process_alive().value_or(false), true);

    const auto artifact = session->artifact_path();
    ASSERT_FALSE(artifact.empty());
    EXPECT_TRUE(std::filesystem::exists(artifact));

    auto inspected = session->call_tool("inspect", json::object());
    ASSERT_FALSE(is_error(inspected));
    const auto report = json::parse(get_value(inspected).first_text().value_or("{}"));
    EXPECT_EQ(report.at("config").at("server"), "db-host");
    EXPECT_EQ(report.at("config").at("database"), "sales");
    EXPECT_EQ(report.at("config").at("port"), 1455);
    EXPECT_EQ(report.at("env").at("MSSQL_SERVER"), "db-host");
    EXPECT_EQ(report.at("env").at("MSSQL_DATABASE"), "sales");
    EXPECT_EQ(report.at("env").at("DB_PORT"), "1455");
    EXPECT_EQ(report.at("env").at("DATABASE_URL"),
              "Server=db-host;Database=sales;User Id=reader;Password=secret;"
              "TrustServerCertificate=true;Encrypt=true;");

    session->close();
    EXPECT_EQ(session->state(), SessionState::Closed);
    EXPECT_EQ(session->process_alive().value_or(true), false);
    EXPECT_FALSE(std::filesystem::exists(artifact));
}

TEST(SessionIntegrationTest, ServerTrafficDoesNotDisturbQueries) {
    TempDirectory dir;
    auto session = launch_ready(fake_server("normal", dir));
    ASSERT_NE(session, nullptr);
    const QueryRunner runner(*session);

    // The server sends a log line, a notification and a ping after the handshake.
    auto first = runner.run("show top 2 customers");
    ASSERT_FALSE(is_error(first));
    EXPECT_EQ(get_value(first).invocation.tool_name, "read_data");
    const std::string text = get_value(first).result.first_text().value_or("");
    EXPECT_EQ(text.rfind("read_data ", 0), 0u);
    EXPECT_NE(text.find("SELECT * FROM customers LIMIT 2"), std::string::npos);

    auto second = runner.run("list tables");
    ASSERT_FALSE(is_error(second));
    EXPECT_EQ(get_value(second).result.first_text().value_or(""), "list_tables {}");
    EXPECT_EQ(session->pending_requests(), 0u);
}

TEST(SessionIntegrationTest, RemoteErrorLeavesSessionReady) {
    TempDirectory dir;
    auto session = launch_ready(fake_server("normal", dir));
    ASSERT_NE(session, nullptr);

    auto failed = session->call_tool("read_data", json{{"query", "SELECT * FROM missing_table"}});
    ASSERT_TRUE(is_error(failed));
    EXPECT_EQ(get_error(failed).category, ErrorCategory::Remote);
    EXPECT_EQ(get_error(failed).remote_code.value_or(0), -32000);
    EXPECT_EQ(session->state(), SessionState::Ready);

    auto next = session->call_tool("list_tables", json::object());
    EXPECT_FALSE(is_error(next));
}

TEST(SessionIntegrationTest, EarlyExitCarriesServerDiagnostics) {
    TempDirectory dir;
    auto config = fake_server("exit-early", dir);
    config.timeouts.startup_grace_ms = 2000;

    auto launched = ProtocolSession::launch(config);
    ASSERT_TRUE(is_error(launched));
    const auto& error = get_error(launched);
    EXPECT_EQ(error.category, ErrorCategory::EarlyExit);
    EXPECT_NE(error.hint.find("config.server is required"), std::string::npos);
    EXPECT_TRUE(directory_is_empty(dir.root()));
}

TEST(SessionIntegrationTest, MissingServerIsSpawnError) {
    TempDirectory dir;
    auto config = fake_server("normal", dir);
    config.server.script = dir.root() / "no-such-server";

    auto launched = ProtocolSession::launch(config);
    ASSERT_TRUE(is_error(launched));
    EXPECT_EQ(get_error(launched).category, ErrorCategory::Spawn);
    EXPECT_TRUE(directory_is_empty(dir.root()));
}

TEST(SessionIntegrationTest, SilentServerTimesOut) {
    TempDirectory dir;
    auto config = fake_server("silent", dir);
    config.timeouts.request_ms = 300;
    auto launched = ProtocolSession::launch(config);
    ASSERT_FALSE(is_error(launched));
    auto session = std::move(get_value(launched));

    auto result = session->initialize();
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Timeout);
    EXPECT_EQ(get_error(result).message, "Request timeout for message ID: 1");
    EXPECT_EQ(session->pending_requests(), 0u);
    session->close();
}

TEST(SessionIntegrationTest, ConfigurationErrorBecomesHint) {
    TempDirectory dir;
    auto config = fake_server("config-error", dir);
    config.timeouts.request_ms = 500;
    auto launched = ProtocolSession::launch(config);
    ASSERT_FALSE(is_error(launched));
    auto session = std::move(get_value(launched));

    auto result = session->initialize();
    ASSERT_TRUE(is_error(result));
    EXPECT_NE(get_error(result).hint.find("config.server is required"), std::string::npos);
    session->close();
}

TEST(SessionIntegrationTest, CrashDuringCallClosesSession) {
    TempDirectory dir;
    auto session = launch_ready(fake_server("crash-on-call", dir));
    ASSERT_NE(session, nullptr);

    auto result = session->call_tool("list_tables", json::object());
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::SessionClosed);
    EXPECT_EQ(session->state(), SessionState::Closed);

    auto after = session->call_tool("list_tables", json::object());
    ASSERT_TRUE(is_error(after));
    EXPECT_EQ(get_error(after).category, ErrorCategory::SessionClosed);
}

TEST(SessionIntegrationTest, FallbackDiscoveryAggregatesTools) {
    TempDirectory dir;
    auto session = launch_ready(fake_server("empty-tools", dir));
    ASSERT_NE(session, nullptr);
    ASSERT_EQ(session->tools().size(), 2u);
    EXPECT_EQ(session->tools()[0].name, "read_data");
    EXPECT_EQ(session->tools()[0].description, "Run a query");
    EXPECT_EQ(session->tools()[1].name, "list_tables");
}

TEST(SessionIntegrationTest, NoToolsStillReachesReady) {
    TempDirectory dir;
    auto session = launch_ready(fake_server("no-tools", dir));
    ASSERT_NE(session, nullptr);
    EXPECT_EQ(session->state(), SessionState::Ready);
    EXPECT_TRUE(session->tools().empty());

    const QueryRunner runner(*session);
    auto result = runner.run("list tables");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::NoSuitableTool);
}

TEST(SessionIntegrationTest, TermIgnoringServerStopsOnClose) {
    TempDirectory dir;
    auto config = fake_server("ignore-term", dir);
    config.timeouts.shutdown_grace_ms = 200;
    auto session = launch_ready(config);
    ASSERT_NE(session, nullptr);

    const auto started = std::chrono::steady_clock::now();
    session->close();
    EXPECT_LT(std::chrono::steady_clock::now() - started, 3s);
    EXPECT_EQ(session->process_alive().value_or(true), false);
}

TEST(SessionIntegrationTest, InterruptUnblocksPendingRequest) {
    TempDirectory dir;
    auto config = fake_server("silent", dir);
    config.timeouts.request_ms = 10000;
    auto launched = ProtocolSession::launch(config);
    ASSERT_FALSE(is_error(launched));
    auto session = std::move(get_value(launched));

    std::thread interrupter([&session] {
        std::this_thread::sleep_for(200ms);
        session->interrupt();
    });
    const auto started = std::chrono::steady_clock::now();
    auto result = session->initialize();
    interrupter.join();

    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::SessionClosed);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
    EXPECT_EQ(session->state(), SessionState::Closed);
    session->close();
}

}  // namespace
