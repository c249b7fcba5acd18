#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/bridge_errors.hpp"
#include "process/line_transport.hpp"
#include "protocol/json_rpc.hpp"

namespace sqlbridge::session {

// Caller-side view of one request. Filled exactly once by the correlator.
class PendingCompletion {
public:
    struct Slot {
        std::optional<core::errors::Result<nlohmann::json>> outcome;
    };

    std::int64_t id() const { return id_; }
    bool ready() const { return slot_->outcome.has_value(); }
    // nullptr until ready
    const core::errors::Result<nlohmann::json>* outcome() const {
        return slot_->outcome ? &*slot_->outcome : nullptr;
    }

private:
    friend class RequestCorrelator;
    PendingCompletion(std::int64_t id, std::shared_ptr<Slot> slot)
        : id_(id), slot_(std::move(slot)) {}

    std::int64_t id_;
    std::shared_ptr<Slot> slot_;
};

// Requests the server may send us. Anything else is answered with -32601.
enum class InboundMethod {
    Ping,
    RootsList,
    Unsupported
};

InboundMethod parse_inbound_method(const std::string& method);
std::string to_string(InboundMethod method);

using InboundHandler =
    std::function<core::errors::Result<nlohmann::json>(const protocol::Request&)>;

class NotificationSink {
public:
    virtual ~NotificationSink() = default;
    virtual void on_notification(const protocol::Notification& notification) = 0;
};

class LoggingNotificationSink : public NotificationSink {
public:
    void on_notification(const protocol::Notification& notification) override;
};

// Owns the pending-request table. Single-threaded: every method must be called
// from the same (cooperative) thread; pump threads only touch the channel.
class RequestCorrelator {
public:
    using Clock = std::chrono::steady_clock;
    static constexpr std::chrono::milliseconds kDefaultTimeout{15000};

    RequestCorrelator(std::shared_ptr<process::LineWriter> writer,
                      std::shared_ptr<process::LineChannel> channel,
                      std::chrono::milliseconds request_timeout = kDefaultTimeout);

    // Id the next generated request will carry. Explicit ids below it are refused.
    std::int64_t next_id() const { return next_id_; }

    core::errors::Result<PendingCompletion> send(const protocol::Request& request);
    core::errors::Result<PendingCompletion> send(const std::string& method,
                                                 const nlohmann::json& params);
    core::errors::Result<std::size_t> notify(const protocol::Notification& notification);

    // Runs the event loop until `completion` resolves, fails or times out.
    core::errors::Result<nlohmann::json> wait(const PendingCompletion& completion);

    // send + wait
    core::errors::Result<nlohmann::json> call(const std::string& method,
                                              const nlohmann::json& params);

    void on_line(const std::string& line);
    void on_diagnostic(const std::string& line);

    // Dispatches queued events without blocking.
    std::size_t drain();
    // Dispatches events until `duration` elapses.
    void pump_for(Clock::duration duration);

    std::size_t expire_overdue(Clock::time_point now);

    // Fails every pending request with `reason`; later sends fail the same way.
    void cancel_all(const core::errors::BridgeError& reason);

    bool closed() const { return closed_; }
    std::size_t pending_count() const { return pending_.size(); }
    bool is_pending(std::int64_t id) const { return pending_.count(id) != 0; }
    std::chrono::milliseconds request_timeout() const { return request_timeout_; }
    const std::vector<std::string>& configuration_errors() const {
        return configuration_errors_;
    }

    void set_notification_sink(std::shared_ptr<NotificationSink> sink);
    void register_inbound_handler(InboundMethod method, InboundHandler handler);

private:
    struct PendingRequest {
        std::int64_t id = 0;
        std::string method;
        Clock::time_point created_at;
        Clock::time_point deadline;
        std::shared_ptr<PendingCompletion::Slot> slot;
    };

    void handle_event(const process::StreamEvent& event);
    void handle_response(const protocol::Response& response);
    void answer_inbound(const protocol::Request& request);
    void resolve(std::int64_t id, core::errors::Result<nlohmann::json> outcome);
    std::optional<Clock::time_point> earliest_deadline() const;

    std::shared_ptr<process::LineWriter> writer_;
    std::shared_ptr<process::LineChannel> channel_;
    std::chrono::milliseconds request_timeout_;
    std::int64_t next_id_ = 1;
    std::unordered_map<std::int64_t, PendingRequest> pending_;
    bool closed_ = false;
    core::errors::BridgeError close_reason_{core::errors::ErrorCategory::SessionClosed,
                                            "Session is closed.", "session_closed"};
    std::shared_ptr<NotificationSink> notification_sink_;
    std::map<InboundMethod, InboundHandler> inbound_handlers_;
    std::vector<std::string> configuration_errors_;
};

}  // namespace sqlbridge::session
