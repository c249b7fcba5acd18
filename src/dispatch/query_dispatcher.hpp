#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/bridge_errors.hpp"
#include "protocol/intent_contract.hpp"
#include "protocol/tool_contract.hpp"

namespace sqlbridge::dispatch {

enum class Capability {
    ListTables,
    DescribeTable,
    ReadData
};

std::string to_string(Capability capability);

// Acceptable concrete tool names per capability, most preferred first.
using CandidateTable = std::map<Capability, std::vector<std::string>>;

class QueryDispatcher {
public:
    static const CandidateTable& default_candidates();

    explicit QueryDispatcher(CandidateTable candidates = default_candidates());

    // Picks one discovered tool and its arguments. Never names a tool that is
    // not in `tools`.
    core::errors::Result<protocol::ToolInvocation> dispatch(
        const protocol::AnalyzedIntent& intent,
        const std::vector<protocol::ToolDescriptor>& tools) const;

    core::errors::Result<std::string> resolve_tool(
        Capability capability, const std::vector<protocol::ToolDescriptor>& tools) const;

private:
    core::errors::Result<protocol::ToolInvocation> invocation(
        Capability capability, const std::vector<protocol::ToolDescriptor>& tools,
        nlohmann::json arguments) const;

    CandidateTable candidates_;
};

// Doubles embedded single quotes.
std::string escape_sql_literal(const std::string& value);

// Explicit where clause, location, then status, joined with AND.
std::optional<std::string> compile_where_clause(const protocol::Conditions& conditions);

std::string build_select_query(const std::string& table,
                               const std::optional<std::string>& where_clause,
                               const std::optional<int>& limit);
std::string build_count_query(const std::string& table,
                              const std::optional<std::string>& where_clause);

}  // namespace sqlbridge::dispatch
