#include "session/protocol_session.hpp"

#include <algorithm>
#include <utility>
#include "core/logging/logger.hpp"

namespace sqlbridge::session {

using core::errors::BridgeError;
using core::errors::ErrorCategory;
using nlohmann::json;

std::string to_string(const SessionState state) {
    switch (state) {
        case SessionState::Uninitialized:
            return "uninitialized";
        case SessionState::Handshaking:
            return "handshaking";
        case SessionState::Ready:
            return "ready";
        case SessionState::Closed:
            return "closed";
        default:
            return "unknown";
    }
}

ProtocolSession::ProtocolSession(std::shared_ptr<process::LineWriter> writer,
                                 std::shared_ptr<process::LineChannel> channel,
                                 SessionOptions options)
    : options_(std::move(options)),
      channel_(channel),
      correlator_(std::move(writer), std::move(channel), options_.request_timeout) {}

ProtocolSession::~ProtocolSession() {
    close();
}

core::errors::Result<std::unique_ptr<ProtocolSession>> ProtocolSession::launch(
    const core::config::BridgeConfig& config) {
    auto validated = core::config::validate_config(config);
    if (core::errors::is_error(validated)) {
        return core::errors::get_error(validated);
    }
    const auto& cfg = core::errors::get_value(validated);

    auto written = ConfigArtifact::write(cfg.artifact_directory,
                                         core::config::connection_payload(cfg.connection));
    if (core::errors::is_error(written)) {
        return core::errors::get_error(written);
    }
    ConfigArtifact artifact = std::move(core::errors::get_value(written));

    process::LaunchSpec command;
    if (cfg.server.runtime.empty()) {
        command.executable = cfg.server.script.string();
    } else {
        command.executable = cfg.server.runtime;
        command.args.push_back(cfg.server.script.string());
    }
    command.args.push_back("--config");
    command.args.push_back(artifact.path().string());
    command.args.insert(command.args.end(), cfg.server.args.begin(), cfg.server.args.end());
    command.env = core::config::server_environment(cfg.connection);
    command.working_directory = cfg.server.working_directory;
    command.startup_grace = std::chrono::milliseconds(cfg.timeouts.startup_grace_ms);

    LOG_INFO("Starting MCP server: server=" + cfg.connection.server +
             ", database=" + cfg.connection.database + ", user=" + cfg.connection.user +
             ", script=" + cfg.server.script.string());

    const process::ProcessSupervisor supervisor;
    auto started = supervisor.start(command);
    if (core::errors::is_error(started)) {
        auto error = core::errors::get_error(started);
        LOG_ERROR("Failed to start MCP server: " + error.message);
        return error;
    }
    std::shared_ptr<process::ProcessHandle> handle = std::move(core::errors::get_value(started));
    LOG_INFO("MCP server started with pid " + std::to_string(handle->pid()));

    SessionOptions options;
    options.client = cfg.client;
    options.request_timeout = std::chrono::milliseconds(cfg.timeouts.request_ms);
    options.shutdown_grace = std::chrono::milliseconds(cfg.timeouts.shutdown_grace_ms);

    auto channel = std::make_shared<process::LineChannel>();
    auto session = std::make_unique<ProtocolSession>(handle, channel, std::move(options));
    session->process_ = handle;
    session->artifact_path_ = artifact.path();
    session->artifact_.emplace(std::move(artifact));

    const std::weak_ptr<process::ProcessHandle> weak = handle;
    const auto on_closed = [weak](const process::StreamKind stream) {
        if (auto process = weak.lock()) {
            process->mark_stream_closed(stream);
        }
    };
    session->stdout_pump_ = std::make_unique<process::StreamPump>(
        handle->stdout_fd(), process::StreamKind::Stdout, channel, on_closed);
    session->stderr_pump_ = std::make_unique<process::StreamPump>(
        handle->stderr_fd(), process::StreamKind::Stderr, channel, on_closed);
    session->stdout_pump_->start();
    session->stderr_pump_->start();

    return session;
}

core::errors::Result<json> ProtocolSession::initialize() {
    if (state_ != SessionState::Uninitialized) {
        return BridgeError{ErrorCategory::Input,
                           "Cannot initialize a session in state " + to_string(state_),
                           "invalid_state_transition"};
    }
    transition(SessionState::Handshaking);

    const json params = {
        {"protocolVersion", options_.client.protocol_version},
        {"capabilities",
         {{"roots", {{"listChanged", true}}}, {"sampling", json::object()}}},
        {"clientInfo", {{"name", options_.client.name}, {"version", options_.client.version}}}};

    auto response = correlator_.call("initialize", params);
    if (core::errors::is_error(response)) {
        auto error = core::errors::get_error(response);
        const auto& diagnostics = correlator_.configuration_errors();
        if (!diagnostics.empty()) {
            error.hint = "Server reported a configuration error: " + diagnostics.back();
        }
        LOG_ERROR("Failed to initialize MCP protocol: " + error.message);
        sync_with_transport();
        return error;
    }
    server_info_ = core::errors::get_value(response);

    std::string server_name = "unknown server";
    if (server_info_.is_object() && server_info_.contains("serverInfo") &&
        server_info_["serverInfo"].is_object()) {
        server_name = server_info_["serverInfo"].value("name", server_name);
    }
    LOG_INFO("MCP protocol initialized with " + server_name);

    auto notified = correlator_.notify(protocol::Notification{"notifications/initialized",
                                                              json::object()});
    if (core::errors::is_error(notified)) {
        LOG_WARN("Failed to send initialized notification: " +
                 core::errors::get_error(notified).message);
    }

    auto discovered = discover_tools();
    if (core::errors::is_error(discovered)) {
        sync_with_transport();
        return core::errors::get_error(discovered);
    }
    tools_ = std::move(core::errors::get_value(discovered));
    transition(SessionState::Ready);

    LOG_INFO("Available tools: " + std::to_string(tools_.size()));
    for (const auto& tool : tools_) {
        LOG_INFO("  " + tool.name + ": " + tool.description);
    }
    return server_info_;
}

core::errors::Result<std::vector<protocol::ToolDescriptor>> ProtocolSession::discover_tools() {
    std::vector<protocol::ToolDescriptor> tools;

    LOG_INFO("Discovering available tools...");
    auto canonical = correlator_.call(kDiscoveryMethod, json::object());
    if (core::errors::is_error(canonical)) {
        const auto& error = core::errors::get_error(canonical);
        if (error.category == ErrorCategory::SessionClosed) {
            return error;
        }
        LOG_WARN("Error discovering tools via " + std::string(kDiscoveryMethod) + ": " +
                 error.message);
    } else {
        protocol::merge_tools(tools,
                              protocol::parse_tool_list(core::errors::get_value(canonical)));
    }
    if (!tools.empty()) {
        return tools;
    }

    LOG_INFO("No tools discovered, trying alternative discovery methods");
    for (const auto& method : options_.fallback_discovery_methods) {
        auto answer = correlator_.call(method, json::object());
        if (core::errors::is_error(answer)) {
            const auto& error = core::errors::get_error(answer);
            if (error.category == ErrorCategory::SessionClosed) {
                return error;
            }
            LOG_INFO("Method " + method + " failed: " + error.message);
            continue;
        }
        const auto added = protocol::merge_tools(
            tools, protocol::parse_tool_list(core::errors::get_value(answer)));
        LOG_INFO("Method " + method + " returned " + std::to_string(added) + " new tool(s)");
    }

    if (tools.empty()) {
        LOG_WARN("No tools discovered; continuing with an empty tool set");
    }
    return tools;
}

core::errors::Result<protocol::ToolCallResult> ProtocolSession::call_tool(
    const std::string& name, const json& arguments) {
    sync_with_transport();
    if (state_ == SessionState::Closed) {
        return core::errors::session_closed_error("Session is closed.");
    }
    if (state_ != SessionState::Ready) {
        return BridgeError{ErrorCategory::Input,
                           "Session is not ready (state: " + to_string(state_) + ")",
                           "session_not_ready"};
    }

    LOG_DEBUG("Calling tool " + name + " with " + protocol::display_json(arguments));
    auto response =
        correlator_.call("tools/call", json{{"name", name}, {"arguments", arguments}});
    if (core::errors::is_error(response)) {
        sync_with_transport();
        return core::errors::get_error(response);
    }
    return protocol::make_tool_call_result(core::errors::get_value(response));
}

void ProtocolSession::close() {
    if (torn_down_) {
        return;
    }
    torn_down_ = true;

    if (state_ != SessionState::Closed) {
        transition(SessionState::Closed);
    }
    if (!correlator_.closed()) {
        correlator_.cancel_all(core::errors::session_closed_error("Session closed."));
    }

    if (process_) {
        LOG_INFO("Stopping MCP server");
        process_->terminate(options_.shutdown_grace);
    }
    if (stdout_pump_) {
        stdout_pump_->stop();
    }
    if (stderr_pump_) {
        stderr_pump_->stop();
    }
    artifact_.reset();
}

void ProtocolSession::interrupt() {
    if (process_) {
        process_->terminate(options_.shutdown_grace);
    }
}

bool ProtocolSession::has_tool(const std::string& name) const {
    return std::any_of(tools_.begin(), tools_.end(),
                       [&name](const protocol::ToolDescriptor& tool) {
                           return tool.name == name;
                       });
}

std::optional<bool> ProtocolSession::process_alive() const {
    if (!process_) {
        return std::nullopt;
    }
    return process_->is_running();
}

void ProtocolSession::transition(const SessionState next) {
    LOG_DEBUG("Session state " + to_string(state_) + " -> " + to_string(next));
    state_ = next;
}

// The correlator closes itself when the server's stdout ends.
void ProtocolSession::sync_with_transport() {
    if (correlator_.closed() && state_ != SessionState::Closed) {
        LOG_WARN("Server connection lost");
        transition(SessionState::Closed);
    }
}

}  // namespace sqlbridge::session
