#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <gtest/gtest.h>
#include "core/errors/bridge_errors.hpp"
#include "process/line_transport.hpp"
#include "process/process_supervisor.hpp"
#include "process/stream_pump.hpp"

namespace {

using namespace std::chrono_literals;
using sqlbridge::core::errors::ErrorCategory;
using sqlbridge::core::errors::get_error;
using sqlbridge::core::errors::get_value;
using sqlbridge::core::errors::is_error;
using sqlbridge::process::LaunchSpec;
using sqlbridge::process::LineChannel;
using sqlbridge::process::ProcessSupervisor;
using sqlbridge::process::StreamKind;
using sqlbridge::process::StreamPump;

LaunchSpec shell(const std::string& script) {
    LaunchSpec launch;
    launch.executable = "/bin/sh";
    launch.args = {"-c", script};
    launch.startup_grace = 150ms;
    return launch;
}

std::string next_stdout_line(LineChannel& channel) {
    const auto deadline = std::chrono::steady_clock::now() + 3s;
    while (auto event = channel.pop_until(deadline)) {
        if (event->stream == StreamKind::Stdout && !event->closed) {
            return event->line;
        }
    }
    return "";
}

TEST(ProcessSupervisorTest, MissingExecutableIsSpawnError) {
    const ProcessSupervisor supervisor;
    LaunchSpec launch;
    launch.executable = "/nonexistent/sqlbridge-server";
    auto result = supervisor.start(launch);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Spawn);
    EXPECT_EQ(get_error(result).code, "spawn_failed");
}

TEST(ProcessSupervisorTest, UnknownCommandOnPathIsSpawnError) {
    const ProcessSupervisor supervisor;
    LaunchSpec launch;
    launch.executable = "sqlbridge-command-that-does-not-exist";
    auto result = supervisor.start(launch);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Spawn);
}

TEST(ProcessSupervisorTest, BadWorkingDirectoryIsSpawnError) {
    const ProcessSupervisor supervisor;
    auto launch = shell("exit 0");
    launch.working_directory = "/nonexistent/sqlbridge-dir";
    auto result = supervisor.start(launch);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Spawn);
    EXPECT_NE(get_error(result).message.find("working directory"), std::string::npos);
}

TEST(ProcessSupervisorTest, ExitDuringGraceIsEarlyExitWithStderrHint) {
    const ProcessSupervisor supervisor;
    auto launch = shell("echo 'Error: config.server is required' >&2; exit 3");
    launch.startup_grace = 1000ms;
    auto result = supervisor.start(launch);
    ASSERT_TRUE(is_error(result));
    const auto& error = get_error(result);
    EXPECT_EQ(error.category, ErrorCategory::EarlyExit);
    EXPECT_EQ(error.message, "Server process exited during startup with code 3");
    EXPECT_NE(error.hint.find("config.server is required"), std::string::npos);
}

TEST(ProcessSupervisorTest, LinesRoundTripThroughChild) {
    const ProcessSupervisor supervisor;
    LaunchSpec launch;
    launch.executable = "cat";
    launch.startup_grace = 100ms;
    auto result = supervisor.start(launch);
    ASSERT_FALSE(is_error(result));
    auto handle = std::move(get_value(result));
    EXPECT_TRUE(handle->is_running());

    auto channel = std::make_shared<LineChannel>();
    StreamPump pump(handle->stdout_fd(), StreamKind::Stdout, channel);
    pump.start();

    auto written = handle->write_line("{\"jsonrpc\":\"2.0\",\"method\":\"ping\"}");
    ASSERT_FALSE(is_error(written));
    EXPECT_EQ(get_value(written), 34u);
    EXPECT_EQ(next_stdout_line(*channel), "{\"jsonrpc\":\"2.0\",\"method\":\"ping\"}");

    handle->terminate(1000ms);
    pump.stop();
    EXPECT_FALSE(handle->is_running());
    ASSERT_TRUE(handle->exit_code().has_value());
}

TEST(ProcessSupervisorTest, EnvironmentIsLayeredOverParent) {
    const ProcessSupervisor supervisor;
    auto launch = shell("echo \"$SQLBRIDGE_TEST_VALUE|${PATH:+has-path}\"; sleep 5");
    launch.env = {{"SQLBRIDGE_TEST_VALUE", "layered"}};
    auto result = supervisor.start(launch);
    ASSERT_FALSE(is_error(result));
    auto handle = std::move(get_value(result));

    auto channel = std::make_shared<LineChannel>();
    StreamPump pump(handle->stdout_fd(), StreamKind::Stdout, channel);
    pump.start();
    EXPECT_EQ(next_stdout_line(*channel), "layered|has-path");

    handle->terminate(1000ms);
    pump.stop();
}

TEST(ProcessSupervisorTest, WorkingDirectoryIsApplied) {
    const ProcessSupervisor supervisor;
    auto launch = shell("pwd; sleep 5");
    launch.working_directory = "/";
    auto result = supervisor.start(launch);
    ASSERT_FALSE(is_error(result));
    auto handle = std::move(get_value(result));

    auto channel = std::make_shared<LineChannel>();
    StreamPump pump(handle->stdout_fd(), StreamKind::Stdout, channel);
    pump.start();
    EXPECT_EQ(next_stdout_line(*channel), "/");

    handle->terminate(1000ms);
    pump.stop();
}

TEST(ProcessSupervisorTest, TerminateIsIdempotentAcrossThreads) {
    const ProcessSupervisor supervisor;
    auto result = supervisor.start(shell("sleep 30"));
    ASSERT_FALSE(is_error(result));
    auto handle = std::move(get_value(result));

    std::thread other([&handle] { handle->terminate(2000ms); });
    handle->terminate(2000ms);
    other.join();
    handle->terminate(2000ms);

    EXPECT_FALSE(handle->is_running());
    ASSERT_TRUE(handle->exit_code().has_value());
    EXPECT_EQ(*handle->exit_code(), 128 + 15);
}

TEST(ProcessSupervisorTest, StubbornChildIsKilledAfterGrace) {
    const ProcessSupervisor supervisor;
    auto result = supervisor.start(shell("trap '' TERM; while :; do sleep 1; done"));
    ASSERT_FALSE(is_error(result));
    auto handle = std::move(get_value(result));

    const auto started = std::chrono::steady_clock::now();
    supervisor.terminate(*handle, 300ms);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 3s);
    EXPECT_FALSE(handle->is_running());
    ASSERT_TRUE(handle->exit_code().has_value());
    EXPECT_EQ(*handle->exit_code(), 128 + 9);
}

TEST(ProcessSupervisorTest, WriteAfterTerminateReportsClosedInput) {
    const ProcessSupervisor supervisor;
    auto result = supervisor.start(shell("sleep 30"));
    ASSERT_FALSE(is_error(result));
    auto handle = std::move(get_value(result));
    handle->terminate(1000ms);

    auto written = handle->write_line("{}");
    ASSERT_TRUE(is_error(written));
    EXPECT_EQ(get_error(written).category, ErrorCategory::SessionClosed);
    EXPECT_EQ(get_error(written).message, "Server input is closed.");
}

TEST(ProcessSupervisorTest, TracksClosedStreams) {
    const ProcessSupervisor supervisor;
    auto result = supervisor.start(shell("sleep 30"));
    ASSERT_FALSE(is_error(result));
    auto handle = std::move(get_value(result));
    EXPECT_FALSE(handle->stream_closed(StreamKind::Stdout));
    handle->mark_stream_closed(StreamKind::Stdout);
    EXPECT_TRUE(handle->stream_closed(StreamKind::Stdout));
    EXPECT_FALSE(handle->stream_closed(StreamKind::Stderr));
    handle->terminate(1000ms);
}

}  // namespace
