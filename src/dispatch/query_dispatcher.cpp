#include "dispatch/query_dispatcher.hpp"

#include <algorithm>
#include <utility>
#include "core/logging/logger.hpp"

namespace sqlbridge::dispatch {

using nlohmann::json;
using protocol::AnalyzedIntent;
using protocol::ToolDescriptor;
using protocol::ToolInvocation;
using protocol::Verb;

namespace {

// A clause holding a top-level OR must be wrapped before it is ANDed.
std::string conjoin(const std::vector<std::pair<std::string, bool>>& clauses) {
    std::string out;
    for (const auto& [clause, disjunctive] : clauses) {
        if (!out.empty()) {
            out += " AND ";
        }
        if (disjunctive && clauses.size() > 1) {
            out += "(" + clause + ")";
        } else {
            out += clause;
        }
    }
    return out;
}

}  // namespace

std::string to_string(const Capability capability) {
    switch (capability) {
        case Capability::ListTables:
            return "list-tables";
        case Capability::DescribeTable:
            return "describe-table";
        case Capability::ReadData:
            return "read-data";
        default:
            return "unknown";
    }
}

std::string escape_sql_literal(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (const char c : value) {
        out.push_back(c);
        if (c == '\'') {
            out.push_back('\'');
        }
    }
    return out;
}

std::optional<std::string> compile_where_clause(const protocol::Conditions& conditions) {
    std::vector<std::pair<std::string, bool>> clauses;
    if (conditions.where_clause && !conditions.where_clause->empty()) {
        // Caller-supplied text: may contain OR, so treat it as disjunctive.
        clauses.emplace_back(*conditions.where_clause, true);
    }
    if (conditions.location) {
        const std::string location = escape_sql_literal(*conditions.location);
        clauses.emplace_back("city LIKE '%" + location + "%' OR state LIKE '%" + location + "%'",
                             true);
    }
    if (conditions.status) {
        clauses.emplace_back("status = '" + escape_sql_literal(*conditions.status) + "'", false);
    }
    if (clauses.empty()) {
        return std::nullopt;
    }
    return conjoin(clauses);
}

std::string build_select_query(const std::string& table,
                               const std::optional<std::string>& where_clause,
                               const std::optional<int>& limit) {
    std::string query = "SELECT * FROM " + table;
    if (where_clause) {
        query += " WHERE " + *where_clause;
    }
    if (limit) {
        query += " LIMIT " + std::to_string(*limit);
    }
    return query;
}

std::string build_count_query(const std::string& table,
                              const std::optional<std::string>& where_clause) {
    std::string query = "SELECT COUNT(*) as total_count FROM " + table;
    if (where_clause) {
        query += " WHERE " + *where_clause;
    }
    return query;
}

const CandidateTable& QueryDispatcher::default_candidates() {
    static const CandidateTable candidates = {
        {Capability::ListTables, {"list_tables", "list_table", "show_tables", "get_tables"}},
        {Capability::DescribeTable,
         {"describe_table", "table_schema", "show_columns", "get_schema"}},
        {Capability::ReadData, {"read_data", "query_table", "select_data", "query"}}};
    return candidates;
}

QueryDispatcher::QueryDispatcher(CandidateTable candidates)
    : candidates_(std::move(candidates)) {}

core::errors::Result<std::string> QueryDispatcher::resolve_tool(
    const Capability capability, const std::vector<ToolDescriptor>& tools) const {
    const auto entry = candidates_.find(capability);
    if (entry != candidates_.end()) {
        for (const auto& name : entry->second) {
            const bool present =
                std::any_of(tools.begin(), tools.end(),
                            [&name](const ToolDescriptor& tool) { return tool.name == name; });
            if (present) {
                return name;
            }
        }
    }

    std::string available;
    for (const auto& tool : tools) {
        available += (available.empty() ? "" : ", ") + tool.name;
    }
    LOG_WARN("No tool for " + to_string(capability) + "; available tools: [" + available + "]");
    return core::errors::no_suitable_tool_error(to_string(capability));
}

core::errors::Result<ToolInvocation> QueryDispatcher::invocation(
    const Capability capability, const std::vector<ToolDescriptor>& tools,
    json arguments) const {
    auto resolved = resolve_tool(capability, tools);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    return ToolInvocation{to_string(capability), core::errors::get_value(resolved),
                          std::move(arguments)};
}

core::errors::Result<ToolInvocation> QueryDispatcher::dispatch(
    const AnalyzedIntent& intent, const std::vector<ToolDescriptor>& tools) const {
    const std::string* table = intent.primary_entity();
    if (table == nullptr) {
        LOG_DEBUG("No target entity; listing tables");
        return invocation(Capability::ListTables, tools, json::object());
    }

    const auto where_clause = compile_where_clause(intent.conditions);
    switch (intent.verb) {
        case Verb::Select: {
            json arguments = {
                {"query", build_select_query(*table, where_clause, intent.conditions.limit)}};
            if (where_clause) {
                arguments["where_clause"] = *where_clause;
            }
            if (intent.conditions.limit) {
                arguments["limit"] = *intent.conditions.limit;
            }
            return invocation(Capability::ReadData, tools, std::move(arguments));
        }
        case Verb::Count: {
            json arguments = {{"query", build_count_query(*table, where_clause)}};
            if (where_clause) {
                arguments["where_clause"] = *where_clause;
            }
            return invocation(Capability::ReadData, tools, std::move(arguments));
        }
        case Verb::Describe:
            return invocation(Capability::DescribeTable, tools, json{{"table_name", *table}});
        case Verb::Insert:
        case Verb::Update:
        case Verb::Delete:
        default:
            LOG_DEBUG(protocol::to_string(intent.verb) + " is not dispatched; listing tables");
            return invocation(Capability::ListTables, tools, json::object());
    }
}

}  // namespace sqlbridge::dispatch
