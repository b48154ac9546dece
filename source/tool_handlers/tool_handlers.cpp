#include "tool_handlers/tool_handlers.hpp"

// Forward declarations of individual tool registration functions.
// Each tool_*.cpp defines its own namespace with a register_tool() function.

namespace tool_create_post { void register_tool(const request_dispatcher::ApiContext &context); }
namespace tool_list_posts { void register_tool(const request_dispatcher::ApiContext &context); }
namespace tool_edit_post { void register_tool(const request_dispatcher::ApiContext &context); }
namespace tool_debug_api_connection { void register_tool(const request_dispatcher::ApiContext &context); }

namespace tool_handlers {

void register_all_tools(const request_dispatcher::ApiContext &context) {
    tool_create_post::register_tool(context);
    tool_list_posts::register_tool(context);
    tool_edit_post::register_tool(context);
    tool_debug_api_connection::register_tool(context);
}

} // namespace tool_handlers
