#include "mcp/mcp_dispatch.hpp"
#include "mcp/mcp_tools.hpp"
#include "protocol/json_rpc.hpp"
#include "utils/debug_log.hpp"

#include <string>

// Routes incoming MCP messages to the appropriate handler.

namespace mcp_dispatch {

// Protocol version we support.
static const std::string PROTOCOL_VERSION = "2024-11-05";

// Server info. The name matches what MCP client configs refer to.
static const std::string SERVER_NAME = "ghost";
static const std::string SERVER_VERSION = "0.1.0";
static const std::string SERVER_DESCRIPTION =
    "Ghost MCP server: manages posts on a Ghost site through the Ghost Admin API. "
    "Use it to create, list or edit blog posts (HTML content, draft/published/"
    "scheduled status, tags) and to diagnose API connectivity. Tools: create_post, "
    "list_posts, edit_post, debug_api_connection.";

static json handle_initialize(const json &request_id, const json &params) {
    if (params.contains("protocolVersion") && params["protocolVersion"].is_string()) {
        debug_log::log("Client protocol version: " + params["protocolVersion"].get<std::string>());
    }

    json capabilities;
    capabilities["tools"] = json::object();

    json server_info;
    server_info["name"] = SERVER_NAME;
    server_info["version"] = SERVER_VERSION;
    server_info["description"] = SERVER_DESCRIPTION;

    json result;
    result["protocolVersion"] = PROTOCOL_VERSION;
    result["capabilities"] = capabilities;
    result["serverInfo"] = server_info;

    return json_rpc::build_response(request_id, result);
}

static json handle_tools_list(const json &request_id) {
    return json_rpc::build_response(request_id, mcp_tools::build_tools_list_response());
}

static json handle_tools_call(const json &request_id, const json &params) {
    if (!params.contains("name") || !params["name"].is_string()) {
        return json_rpc::build_error_response(request_id, json_rpc::INVALID_PARAMS,
                                              "Missing or invalid 'name' in tools/call");
    }
    std::string tool_name = params["name"].get<std::string>();

    json arguments = json::object();
    if (params.contains("arguments")) {
        if (params["arguments"].is_object()) {
            arguments = params["arguments"];
        } else if (!params["arguments"].is_null()) {
            return json_rpc::build_error_response(request_id, json_rpc::INVALID_PARAMS,
                                                  "'arguments' must be an object");
        }
    }

    try {
        json tool_result = mcp_tools::dispatch_tool_call(tool_name, arguments);
        return json_rpc::build_response(request_id, tool_result);
    } catch (const json::exception &error) {
        debug_log::log_always("Tool " + tool_name + " failed: " + error.what());
        return json_rpc::build_error_response(request_id, json_rpc::INTERNAL_ERROR,
                                              "Internal error in tool " + tool_name,
                                              json(error.what()));
    }
}

json dispatch_message(const json &message) {
    json_rpc::ParseResult parsed = json_rpc::parse_request(message);
    if (!parsed.success) {
        if (parsed.is_notification) {
            debug_log::log("Ignoring invalid notification: " + parsed.error_message);
            return nullptr;
        }
        return json_rpc::build_error_response(parsed.id, json_rpc::INVALID_REQUEST, parsed.error_message);
    }
    const json_rpc::Request &request = parsed.request;

    // "notifications/initialized" and "notifications/cancelled" are the ones
    // clients send; none of them need an answer.
    if (request.is_notification) {
        debug_log::log("Notification: " + request.method);
        return nullptr;
    }

    if (request.method == "initialize") {
        return handle_initialize(request.id, request.params);
    }
    if (request.method == "ping") {
        return json_rpc::build_response(request.id, json::object());
    }
    if (request.method == "tools/list") {
        return handle_tools_list(request.id);
    }
    if (request.method == "tools/call") {
        return handle_tools_call(request.id, request.params);
    }

    return json_rpc::build_error_response(request.id, json_rpc::METHOD_NOT_FOUND,
                                          "Unknown method: " + request.method);
}

json build_parse_error_response() {
    return json_rpc::build_error_response(nullptr, json_rpc::PARSE_ERROR, "Parse error");
}

} // namespace mcp_dispatch
