#ifndef GMCPS_MCP_TOOLS_HPP
#define GMCPS_MCP_TOOLS_HPP

// MCP tool registry: registration, listing, and dispatch of tool calls.

#include <nlohmann/json.hpp>
#include <string>
#include <functional>
#include <vector>

namespace mcp_tools {

using json = nlohmann::json;

// A tool handler function: receives the arguments JSON, returns the result JSON
// (content array + isError flag, as MCP defines it).
using ToolHandler = std::function<json(const json &arguments)>;

// Description of a registered tool, matching the MCP tool schema.
struct ToolDefinition {
    std::string name;
    std::string description;
    json input_schema; // JSON Schema object
    ToolHandler handler;
};

// Register a tool. A second registration under the same name replaces the first.
void register_tool(const ToolDefinition &definition);

// Drop every registered tool (tests re-register with fake transports).
void clear_registered_tools();

// Build the response payload for tools/list.
json build_tools_list_response();

// Dispatch a tools/call request. Returns the result payload (content + isError).
json dispatch_tool_call(const std::string &tool_name, const json &arguments);

// Wrap text as a tool result: one text content item plus the isError flag.
json build_text_result(const std::string &text, bool is_error);

// Get all registered tool definitions (for testing or introspection).
const std::vector<ToolDefinition> &get_registered_tools();

} // namespace mcp_tools

#endif // GMCPS_MCP_TOOLS_HPP
