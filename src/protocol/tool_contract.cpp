#include "protocol/tool_contract.hpp"

#include <algorithm>
#include <sstream>
#include "protocol/json_rpc.hpp"

namespace sqlbridge::protocol {

using nlohmann::json;

namespace {

std::optional<ToolDescriptor> parse_tool(const json& entry) {
    if (!entry.is_object() || !entry.contains("name") || !entry.at("name").is_string()) {
        return std::nullopt;
    }
    ToolDescriptor tool;
    tool.name = entry.at("name").get<std::string>();
    if (tool.name.empty()) {
        return std::nullopt;
    }
    if (entry.contains("description") && entry.at("description").is_string()) {
        tool.description = entry.at("description").get<std::string>();
    }
    if (entry.contains("inputSchema") && entry.at("inputSchema").is_object()) {
        tool.input_schema = entry.at("inputSchema");
    } else if (entry.contains("input_schema") && entry.at("input_schema").is_object()) {
        tool.input_schema = entry.at("input_schema");
    }
    return tool;
}

bool is_text_item(const json& item) {
    return item.is_object() && item.contains("type") && item.at("type") == "text" &&
           item.contains("text") && item.at("text").is_string();
}

}  // namespace

const json* ToolCallResult::content() const {
    if (!raw.is_object() || !raw.contains("content")) {
        return nullptr;
    }
    return &raw.at("content");
}

std::optional<std::string> ToolCallResult::first_text() const {
    const json* items = content();
    if (items == nullptr) {
        return std::nullopt;
    }
    if (items->is_string()) {
        return items->get<std::string>();
    }
    if (!items->is_array()) {
        return std::nullopt;
    }
    for (const auto& item : *items) {
        if (is_text_item(item)) {
            return item.at("text").get<std::string>();
        }
    }
    return std::nullopt;
}

std::vector<ToolDescriptor> parse_tool_list(const json& result) {
    const json* entries = nullptr;
    if (result.is_object() && result.contains("tools") && result.at("tools").is_array()) {
        entries = &result.at("tools");
    } else if (result.is_array()) {
        entries = &result;
    }

    std::vector<ToolDescriptor> tools;
    if (entries == nullptr) {
        return tools;
    }
    for (const auto& entry : *entries) {
        auto tool = parse_tool(entry);
        if (tool) {
            tools.push_back(std::move(*tool));
        }
    }
    return tools;
}

ToolCallResult make_tool_call_result(const json& result) {
    ToolCallResult call_result;
    call_result.raw = result;
    if (result.is_object() && result.contains("isError") && result.at("isError").is_boolean()) {
        call_result.is_error = result.at("isError").get<bool>();
    }
    return call_result;
}

std::size_t merge_tools(std::vector<ToolDescriptor>& known,
                        const std::vector<ToolDescriptor>& incoming) {
    std::size_t added = 0;
    for (const auto& tool : incoming) {
        const bool present =
            std::any_of(known.begin(), known.end(),
                        [&tool](const ToolDescriptor& t) { return t.name == tool.name; });
        if (!present) {
            known.push_back(tool);
            ++added;
        }
    }
    return added;
}

std::string render_tool_result(const ToolCallResult& result) {
    std::ostringstream out;
    const json* items = result.content();
    if (items == nullptr) {
        out << "No results returned\n";
        out << "Full response: " << display_json(result.raw, 2) << "\n";
        return out.str();
    }

    if (items->is_array()) {
        for (const auto& item : *items) {
            if (is_text_item(item)) {
                out << item.at("text").get<std::string>() << "\n";
            } else {
                out << display_json(item, 2) << "\n";
            }
        }
    } else if (items->is_string()) {
        out << items->get<std::string>() << "\n";
    } else {
        out << display_json(*items, 2) << "\n";
    }
    return out.str();
}

} // namespace sqlbridge::protocol
