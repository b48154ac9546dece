#ifndef GMCPS_TOOL_HANDLERS_HPP
#define GMCPS_TOOL_HANDLERS_HPP

// Tool handler registration.
// Each tool_*.cpp file provides a register function that is called during startup.

#include "ghost/request_dispatcher.hpp"

namespace tool_handlers {

// Register all available tool handlers with the MCP tool registry. The
// context must outlive every tool call.
void register_all_tools(const request_dispatcher::ApiContext &context);

} // namespace tool_handlers

#endif // GMCPS_TOOL_HANDLERS_HPP
