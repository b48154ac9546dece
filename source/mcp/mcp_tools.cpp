#include "mcp/mcp_tools.hpp"
#include "utils/debug_log.hpp"
#include "utils/text_encoding.hpp"

#include <algorithm>

namespace mcp_tools {

// Global tool registry (module-level, not class-based).
static std::vector<ToolDefinition> registered_tools;

void register_tool(const ToolDefinition &definition) {
    auto existing = std::find_if(registered_tools.begin(), registered_tools.end(),
                                 [&](const ToolDefinition &tool) { return tool.name == definition.name; });
    if (existing != registered_tools.end()) {
        *existing = definition;
        return;
    }
    registered_tools.push_back(definition);
}

void clear_registered_tools() {
    registered_tools.clear();
}

json build_tools_list_response() {
    json tools_array = json::array();
    for (const auto &tool : registered_tools) {
        json tool_entry;
        tool_entry["name"] = tool.name;
        tool_entry["description"] = tool.description;
        tool_entry["inputSchema"] = tool.input_schema;
        tools_array.push_back(tool_entry);
    }

    json result;
    result["tools"] = tools_array;
    return result;
}

json dispatch_tool_call(const std::string &tool_name, const json &arguments) {
    for (const auto &tool : registered_tools) {
        if (tool.name == tool_name) {
            debug_log::log(tool_name + " invoked");
            return tool.handler(arguments);
        }
    }

    return build_text_result("Unknown tool: " + tool_name, true);
}

json build_text_result(const std::string &text, bool is_error) {
    json text_content;
    text_content["type"] = "text";
    text_content["text"] = text_encoding::sanitize_utf8(text);

    json result;
    result["content"] = json::array({text_content});
    result["isError"] = is_error;
    return result;
}

const std::vector<ToolDefinition> &get_registered_tools() {
    return registered_tools;
}

} // namespace mcp_tools
