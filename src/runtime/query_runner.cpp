#include "runtime/query_runner.hpp"

#include <sstream>
#include <utility>
#include "core/logging/logger.hpp"

namespace sqlbridge::runtime {

using core::errors::BridgeError;
using core::errors::ErrorCategory;

QueryRunner::QueryRunner(session::ProtocolSession& session, analysis::IntentAnalyzer analyzer,
                         dispatch::QueryDispatcher dispatcher)
    : session_(session), analyzer_(std::move(analyzer)), dispatcher_(std::move(dispatcher)) {}

core::errors::Result<QueryOutcome> QueryRunner::run(const std::string& text) const {
    if (session_.tools().empty()) {
        return BridgeError{ErrorCategory::NoSuitableTool,
                           "No tools available. Please check the MCP server connection.",
                           "no_tools_available"};
    }

    QueryOutcome outcome;
    outcome.intent = analyzer_.analyze(text);
    LOG_INFO("Query analysis: " + protocol::display_json(protocol::to_json(outcome.intent)));

    auto dispatched = dispatcher_.dispatch(outcome.intent, session_.tools());
    if (core::errors::is_error(dispatched)) {
        return core::errors::get_error(dispatched);
    }
    outcome.invocation = std::move(core::errors::get_value(dispatched));
    LOG_INFO("Calling " + outcome.invocation.tool_name + " for " +
             outcome.invocation.capability);

    auto called = session_.call_tool(outcome.invocation.tool_name, outcome.invocation.arguments);
    if (core::errors::is_error(called)) {
        return core::errors::get_error(called);
    }
    outcome.result = std::move(core::errors::get_value(called));
    return outcome;
}

std::string render_outcome(const QueryOutcome& outcome) {
    std::ostringstream out;
    out << "Analysis: " << protocol::display_json(protocol::to_json(outcome.intent)) << "\n";
    out << "Tool: " << outcome.invocation.tool_name << " "
        << protocol::display_json(outcome.invocation.arguments) << "\n";
    if (outcome.result.is_error) {
        out << "Tool reported an error:\n";
    }
    out << protocol::render_tool_result(outcome.result);
    return out.str();
}

}  // namespace sqlbridge::runtime
