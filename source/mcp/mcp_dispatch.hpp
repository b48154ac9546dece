#ifndef GMCPS_MCP_DISPATCH_HPP
#define GMCPS_MCP_DISPATCH_HPP

// MCP JSON-RPC method dispatch.

#include <nlohmann/json.hpp>

namespace mcp_dispatch {

using json = nlohmann::json;

// Dispatch a single JSON-RPC message. Returns the response JSON, or a null
// json value for notifications (which require no response).
json dispatch_message(const json &message);

// Response for input that is not valid JSON at all.
json build_parse_error_response();

} // namespace mcp_dispatch

#endif // GMCPS_MCP_DISPATCH_HPP
