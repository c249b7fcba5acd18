#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/config/bridge_config.hpp"
#include "core/errors/bridge_errors.hpp"
#include "process/line_transport.hpp"
#include "process/process_supervisor.hpp"
#include "process/stream_pump.hpp"
#include "protocol/tool_contract.hpp"
#include "session/config_artifact.hpp"
#include "session/request_correlator.hpp"

namespace sqlbridge::session {

enum class SessionState {
    Uninitialized,
    Handshaking,
    Ready,
    Closed
};

std::string to_string(SessionState state);

struct SessionOptions {
    core::config::ClientIdentity client;
    std::chrono::milliseconds request_timeout{15000};
    std::chrono::milliseconds shutdown_grace{5000};
    // Tried in order when tools/list yields nothing.
    std::vector<std::string> fallback_discovery_methods = {"list_tools", "get_tools",
                                                           "capabilities"};
};

// One per agent instance: the child, its pumps, the correlator and the
// discovered tools. All methods except interrupt() belong to one thread.
class ProtocolSession {
public:
    static constexpr const char* kDiscoveryMethod = "tools/list";

    // Runs over an already-connected transport; owns no process.
    ProtocolSession(std::shared_ptr<process::LineWriter> writer,
                    std::shared_ptr<process::LineChannel> channel,
                    SessionOptions options = {});
    ~ProtocolSession();

    ProtocolSession(const ProtocolSession&) = delete;
    ProtocolSession& operator=(const ProtocolSession&) = delete;

    // Writes the config artifact, spawns the server and starts both pumps.
    // The returned session is Uninitialized; call initialize() next.
    static core::errors::Result<std::unique_ptr<ProtocolSession>> launch(
        const core::config::BridgeConfig& config);

    // Handshake plus tool discovery. Uninitialized -> Handshaking -> Ready.
    core::errors::Result<nlohmann::json> initialize();

    core::errors::Result<protocol::ToolCallResult> call_tool(
        const std::string& name, const nlohmann::json& arguments);

    // Fails pending requests, stops the server, removes the artifact. Idempotent.
    void close();

    // Stops the server from any thread; the owning thread then sees the
    // stream close and fails whatever is pending.
    void interrupt();

    SessionState state() const { return state_; }
    const std::vector<protocol::ToolDescriptor>& tools() const { return tools_; }
    bool has_tool(const std::string& name) const;
    const nlohmann::json& server_info() const { return server_info_; }
    std::size_t pending_requests() const { return correlator_.pending_count(); }
    std::optional<bool> process_alive() const;
    const std::filesystem::path& artifact_path() const { return artifact_path_; }

    RequestCorrelator& correlator() { return correlator_; }

private:
    core::errors::Result<std::vector<protocol::ToolDescriptor>> discover_tools();
    void transition(SessionState next);
    void sync_with_transport();

    SessionOptions options_;
    std::shared_ptr<process::LineChannel> channel_;
    RequestCorrelator correlator_;
    SessionState state_ = SessionState::Uninitialized;
    std::vector<protocol::ToolDescriptor> tools_;
    nlohmann::json server_info_ = nlohmann::json::object();
    bool torn_down_ = false;

    // Only set by launch()
    std::shared_ptr<process::ProcessHandle> process_;
    std::unique_ptr<process::StreamPump> stdout_pump_;
    std::unique_ptr<process::StreamPump> stderr_pump_;
    std::optional<ConfigArtifact> artifact_;
    std::filesystem::path artifact_path_;
};

}  // namespace sqlbridge::session
