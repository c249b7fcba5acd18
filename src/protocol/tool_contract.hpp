#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace sqlbridge::protocol {

    // A tool the server advertised during discovery
    struct ToolDescriptor {
        std::string name;
        std::string description;
        nlohmann::json input_schema = nlohmann::json::object();
    };

    // How the dispatcher asks the session to do something
    struct ToolInvocation {
        std::string capability;  // e.g. "list-tables"
        std::string tool_name;   // e.g. "list_tables"
        nlohmann::json arguments = nlohmann::json::object();
    };

    // How the server replies: {content: [{type:"text", text:...}, ...]}
    struct ToolCallResult {
        nlohmann::json raw;  // the whole `result` object
        bool is_error = false;

        const nlohmann::json* content() const;
        std::optional<std::string> first_text() const;
    };

    // Accepts `{tools: [...]}` or a bare array. Entries without a string name
    // are skipped.
    std::vector<ToolDescriptor> parse_tool_list(const nlohmann::json& result);

    ToolCallResult make_tool_call_result(const nlohmann::json& result);

    // Appends `incoming` to `known`, skipping names already present.
    // Returns how many descriptors were added.
    std::size_t merge_tools(std::vector<ToolDescriptor>& known,
                            const std::vector<ToolDescriptor>& incoming);

    // Multi-line rendering used by the shell and one-shot mode.
    std::string render_tool_result(const ToolCallResult& result);

} // namespace sqlbridge::protocol
