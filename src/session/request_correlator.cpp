#include "session/request_correlator.hpp"

#include <algorithm>
#include <utility>
#include "core/logging/logger.hpp"
#include "process/stream_pump.hpp"

namespace sqlbridge::session {

using core::errors::BridgeError;
using core::errors::ErrorCategory;
using nlohmann::json;
using protocol::Notification;
using protocol::Request;
using protocol::Response;

InboundMethod parse_inbound_method(const std::string& method) {
    if (method == "ping") {
        return InboundMethod::Ping;
    }
    if (method == "roots/list") {
        return InboundMethod::RootsList;
    }
    return InboundMethod::Unsupported;
}

std::string to_string(const InboundMethod method) {
    switch (method) {
        case InboundMethod::Ping:
            return "ping";
        case InboundMethod::RootsList:
            return "roots/list";
        case InboundMethod::Unsupported:
            return "unsupported";
        default:
            return "unknown";
    }
}

void LoggingNotificationSink::on_notification(const Notification& notification) {
    LOG_INFO("Server notification: " + notification.method + " " +
             protocol::display_json(notification.params));
}

RequestCorrelator::RequestCorrelator(std::shared_ptr<process::LineWriter> writer,
                                     std::shared_ptr<process::LineChannel> channel,
                                     const std::chrono::milliseconds request_timeout)
    : writer_(std::move(writer)),
      channel_(std::move(channel)),
      request_timeout_(request_timeout),
      notification_sink_(std::make_shared<LoggingNotificationSink>()) {
    inbound_handlers_[InboundMethod::Ping] = [](const Request&) -> core::errors::Result<json> {
        return json::object();
    };
    inbound_handlers_[InboundMethod::RootsList] =
        [](const Request&) -> core::errors::Result<json> {
        return json{{"roots", json::array()}};
    };
}

void RequestCorrelator::set_notification_sink(std::shared_ptr<NotificationSink> sink) {
    if (sink) {
        notification_sink_ = std::move(sink);
    }
}

void RequestCorrelator::register_inbound_handler(const InboundMethod method,
                                                 InboundHandler handler) {
    if (method == InboundMethod::Unsupported) {
        return;
    }
    inbound_handlers_[method] = std::move(handler);
}

core::errors::Result<PendingCompletion> RequestCorrelator::send(const Request& request) {
    if (closed_) {
        return close_reason_;
    }
    if (pending_.count(request.id) != 0) {
        BridgeError error{ErrorCategory::Internal,
                          "Request id already pending: " + std::to_string(request.id),
                          "duplicate_request_id"};
        error.request_id = request.id;
        return error;
    }
    // Ids are never reused, so a late response for a settled request cannot
    // resolve a newer one.
    if (request.id < next_id_) {
        BridgeError error{ErrorCategory::Internal,
                          "Request id already used: " + std::to_string(request.id),
                          "stale_request_id"};
        error.request_id = request.id;
        return error;
    }

    std::string line;
    try {
        line = protocol::to_json(request).dump();
    } catch (const json::type_error& e) {
        return BridgeError{ErrorCategory::Input,
                           "Request parameters cannot be encoded: " + std::string(e.what()),
                           "unencodable_request"};
    }

    LOG_DEBUG("Sending request: " + line);
    auto written = writer_->write_line(line);
    if (core::errors::is_error(written)) {
        auto error = core::errors::get_error(written);
        error.request_id = request.id;
        return error;
    }

    const auto now = Clock::now();
    PendingRequest pending;
    pending.id = request.id;
    pending.method = request.method;
    pending.created_at = now;
    pending.deadline = now + request_timeout_;
    pending.slot = std::make_shared<PendingCompletion::Slot>();
    auto slot = pending.slot;
    pending_.emplace(request.id, std::move(pending));
    next_id_ = std::max(next_id_, request.id + 1);

    return PendingCompletion(request.id, std::move(slot));
}

core::errors::Result<PendingCompletion> RequestCorrelator::send(const std::string& method,
                                                                const json& params) {
    return send(Request{next_id_, method, params});
}

core::errors::Result<std::size_t> RequestCorrelator::notify(
    const Notification& notification) {
    if (closed_) {
        return close_reason_;
    }
    std::string line;
    try {
        line = protocol::to_json(notification).dump();
    } catch (const json::type_error& e) {
        return BridgeError{ErrorCategory::Input,
                           "Notification parameters cannot be encoded: " + std::string(e.what()),
                           "unencodable_notification"};
    }
    LOG_DEBUG("Sending notification: " + line);
    return writer_->write_line(line);
}

core::errors::Result<json> RequestCorrelator::wait(const PendingCompletion& completion) {
    while (!completion.ready()) {
        if (pending_.count(completion.id()) == 0) {
            return BridgeError{ErrorCategory::Internal,
                               "Request " + std::to_string(completion.id()) +
                                   " is not tracked by this correlator",
                               "unknown_completion"};
        }
        const auto deadline = earliest_deadline();
        auto event = channel_->pop_until(*deadline);
        if (event) {
            handle_event(*event);
        }
        expire_overdue(Clock::now());
    }
    return *completion.outcome();
}

core::errors::Result<json> RequestCorrelator::call(const std::string& method,
                                                   const json& params) {
    auto sent = send(method, params);
    if (core::errors::is_error(sent)) {
        return core::errors::get_error(sent);
    }
    return wait(core::errors::get_value(sent));
}

std::size_t RequestCorrelator::drain() {
    std::size_t handled = 0;
    while (auto event = channel_->try_pop()) {
        handle_event(*event);
        ++handled;
    }
    expire_overdue(Clock::now());
    return handled;
}

void RequestCorrelator::pump_for(const Clock::duration duration) {
    const auto until = Clock::now() + duration;
    while (auto event = channel_->pop_until(until)) {
        handle_event(*event);
        expire_overdue(Clock::now());
    }
    expire_overdue(Clock::now());
}

void RequestCorrelator::handle_event(const process::StreamEvent& event) {
    if (event.stream == process::StreamKind::Stderr) {
        if (!event.closed) {
            on_diagnostic(event.line);
        }
        return;
    }

    if (event.closed) {
        LOG_WARN("Server stdout closed; failing " + std::to_string(pending_.size()) +
                 " pending request(s)");
        cancel_all(core::errors::session_closed_error("Server process exited."));
        return;
    }
    on_line(event.line);
}

void RequestCorrelator::on_line(const std::string& line) {
    const auto message = protocol::parse_message(line);
    if (!message) {
        LOG_DEBUG("Non-JSON output from server: " + line);
        return;
    }

    if (const auto* response = std::get_if<Response>(&*message)) {
        handle_response(*response);
    } else if (const auto* notification = std::get_if<Notification>(&*message)) {
        notification_sink_->on_notification(*notification);
    } else if (const auto* request = std::get_if<Request>(&*message)) {
        answer_inbound(*request);
    }
}

void RequestCorrelator::on_diagnostic(const std::string& line) {
    LOG_WARN("Server stderr: " + line);
    if (process::is_configuration_error(line)) {
        LOG_ERROR("Server configuration error: " + line);
        configuration_errors_.push_back(line);
    }
}

void RequestCorrelator::handle_response(const Response& response) {
    if (pending_.count(response.id) == 0) {
        LOG_WARN("Dropping response for unknown or settled request id " +
                 std::to_string(response.id));
        return;
    }

    if (response.error) {
        LOG_DEBUG("Request " + std::to_string(response.id) + " failed remotely: " +
                  response.error->message);
        resolve(response.id, core::errors::remote_error(response.id, response.error->code,
                                                        response.error->message));
        return;
    }
    resolve(response.id, response.result);
}

void RequestCorrelator::answer_inbound(const Request& request) {
    const InboundMethod method = parse_inbound_method(request.method);
    const auto handler = inbound_handlers_.find(method);

    Response response;
    response.id = request.id;
    if (handler == inbound_handlers_.end()) {
        LOG_WARN("Unsupported server request: " + request.method);
        response.error = protocol::RpcError{protocol::kMethodNotFound,
                                            "Method not found: " + request.method,
                                            nullptr};
    } else {
        auto handled = handler->second(request);
        if (core::errors::is_error(handled)) {
            response.error = protocol::RpcError{protocol::kInternalError,
                                                core::errors::get_error(handled).message,
                                                nullptr};
        } else {
            response.result = core::errors::get_value(handled);
        }
    }

    auto written = writer_->write_line(protocol::to_json(response).dump());
    if (core::errors::is_error(written)) {
        LOG_WARN("Failed to answer server request " + request.method + ": " +
                 core::errors::get_error(written).message);
    }
}

void RequestCorrelator::resolve(const std::int64_t id, core::errors::Result<json> outcome) {
    auto it = pending_.find(id);
    if (it == pending_.end()) {
        return;
    }
    it->second.slot->outcome = std::move(outcome);
    pending_.erase(it);
}

std::size_t RequestCorrelator::expire_overdue(const Clock::time_point now) {
    std::vector<std::int64_t> overdue;
    for (const auto& [id, pending] : pending_) {
        if (pending.deadline <= now) {
            overdue.push_back(id);
        }
    }
    for (const auto id : overdue) {
        LOG_WARN("Request timeout for message ID: " + std::to_string(id) + " (" +
                 pending_.at(id).method + ")");
        resolve(id, core::errors::timeout_error(id));
    }
    return overdue.size();
}

void RequestCorrelator::cancel_all(const BridgeError& reason) {
    closed_ = true;
    close_reason_ = reason;
    for (auto& [id, pending] : pending_) {
        auto error = reason;
        error.request_id = id;
        pending.slot->outcome = std::move(error);
    }
    pending_.clear();
}

std::optional<RequestCorrelator::Clock::time_point> RequestCorrelator::earliest_deadline()
    const {
    std::optional<Clock::time_point> earliest;
    for (const auto& [id, pending] : pending_) {
        if (!earliest || pending.deadline < *earliest) {
            earliest = pending.deadline;
        }
    }
    return earliest;
}

}  // namespace sqlbridge::session
