#ifndef GMCPS_JSON_RPC_HPP
#define GMCPS_JSON_RPC_HPP

// JSON-RPC 2.0 envelope handling for the MCP transports.
// Incoming messages are checked once and unpacked into a Request; the
// dispatcher never looks at the raw envelope again.

#include <nlohmann/json.hpp>
#include <string>

namespace json_rpc {

using json = nlohmann::json;

constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;

// An unpacked request or notification.
struct Request {
    json id;                 // null for notifications
    std::string method;
    json params;             // always an object; {} when absent
    bool is_notification = false;
};

struct ParseResult {
    bool success = false;
    Request request;
    // Set on failure. id is whatever usable id the message carried, so the
    // error reply can still be correlated.
    std::string error_message;
    json id;
    bool is_notification = false;
};

// Check the envelope ("jsonrpc":"2.0", string method, string/integer/null
// id, object or absent params) and unpack it.
ParseResult parse_request(const json &message);

json build_response(const json &request_id, const json &result_payload);

// error_data is omitted when null.
json build_error_response(const json &request_id, int error_code, const std::string &error_message,
                          const json &error_data = nullptr);

} // namespace json_rpc

#endif // GMCPS_JSON_RPC_HPP
