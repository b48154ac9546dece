#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "ghost/connection_diagnostics.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

static json handle_debug_api_connection(const request_dispatcher::ApiContext &context, const json &arguments) {
    (void)arguments;
    return mcp_tools::build_text_result(connection_diagnostics::debug_api_connection(context), false);
}

namespace tool_debug_api_connection {

void register_tool(const request_dispatcher::ApiContext &context) {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();
    // No parameters needed.

    mcp_tools::register_tool({
        "debug_api_connection",
        "Debug the Ghost API connection to help diagnose issues. Requests the site "
        "root and the authenticated admin site endpoint and reports status codes, "
        "URLs, a response snippet and the headers sent.",
        input_schema,
        [&context](const json &arguments) { return handle_debug_api_connection(context, arguments); }
    });
}

} // namespace tool_debug_api_connection
