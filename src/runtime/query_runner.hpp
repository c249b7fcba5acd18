#pragma once

#include <string>
#include "analysis/intent_analyzer.hpp"
#include "core/errors/bridge_errors.hpp"
#include "dispatch/query_dispatcher.hpp"
#include "protocol/intent_contract.hpp"
#include "protocol/json_rpc.hpp"
#include "protocol/tool_contract.hpp"
#include "session/protocol_session.hpp"

namespace sqlbridge::runtime {

struct QueryOutcome {
    protocol::AnalyzedIntent intent;
    protocol::ToolInvocation invocation;
    protocol::ToolCallResult result;
};

// analyze -> dispatch -> tools/call against a Ready session.
class QueryRunner {
public:
    explicit QueryRunner(session::ProtocolSession& session,
                         analysis::IntentAnalyzer analyzer = analysis::IntentAnalyzer{},
                         dispatch::QueryDispatcher dispatcher = dispatch::QueryDispatcher{});

    core::errors::Result<QueryOutcome> run(const std::string& text) const;

    const analysis::IntentAnalyzer& analyzer() const { return analyzer_; }

private:
    session::ProtocolSession& session_;
    analysis::IntentAnalyzer analyzer_;
    dispatch::QueryDispatcher dispatcher_;
};

// Analysis summary, chosen tool and rendered result, as shown to the user.
std::string render_outcome(const QueryOutcome& outcome);

}  // namespace sqlbridge::runtime
