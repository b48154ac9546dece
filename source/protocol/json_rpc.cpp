#include "protocol/json_rpc.hpp"

namespace json_rpc {

static bool is_valid_id(const json &id) {
    return id.is_string() || id.is_number_integer() || id.is_null();
}

ParseResult parse_request(const json &message) {
    ParseResult result;

    if (!message.is_object()) {
        result.error_message = "Request must be a JSON object";
        return result;
    }

    auto id = message.find("id");
    result.is_notification = (id == message.end());
    if (id != message.end() && is_valid_id(*id)) {
        result.id = *id;
    }

    auto version = message.find("jsonrpc");
    if (version == message.end() || !version->is_string() || version->get<std::string>() != "2.0") {
        result.error_message = "Missing or invalid 'jsonrpc' version (expected \"2.0\")";
        return result;
    }
    auto method = message.find("method");
    if (method == message.end() || !method->is_string()) {
        result.error_message = "Missing or invalid 'method'";
        return result;
    }
    if (id != message.end() && !is_valid_id(*id)) {
        result.error_message = "Invalid 'id' type";
        return result;
    }
    auto params = message.find("params");
    if (params != message.end() && !params->is_object() && !params->is_null()) {
        result.error_message = "'params' must be an object";
        return result;
    }

    result.request.id = result.id;
    result.request.method = method->get<std::string>();
    result.request.params = (params != message.end() && params->is_object()) ? *params : json::object();
    result.request.is_notification = result.is_notification;
    result.success = true;
    return result;
}

json build_response(const json &request_id, const json &result_payload) {
    json response;
    response["jsonrpc"] = "2.0";
    response["id"] = request_id;
    response["result"] = result_payload;
    return response;
}

json build_error_response(const json &request_id, int error_code, const std::string &error_message,
                          const json &error_data) {
    json response;
    response["jsonrpc"] = "2.0";
    response["id"] = request_id;
    response["error"]["code"] = error_code;
    response["error"]["message"] = error_message;
    if (!error_data.is_null()) {
        response["error"]["data"] = error_data;
    }
    return response;
}

} // namespace json_rpc
