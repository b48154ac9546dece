#include "ghost/request_dispatcher.hpp"
#include "ghost/token_signer.hpp"
#include "utils/debug_log.hpp"

namespace request_dispatcher {

using ghost_api::ApiResult;
using ghost_api::ErrorKind;
using ghost_api::make_error;

static std::string status_error_message(int status_code, const std::string &url) {
    std::string category = "Unexpected status";
    if (status_code >= 300 && status_code < 400) {
        category = "Redirect response";
    } else if (status_code >= 400 && status_code < 500) {
        category = "Client error";
    } else if (status_code >= 500 && status_code < 600) {
        category = "Server error";
    }
    return category + " '" + std::to_string(status_code) + "' for url '" + url + "'";
}

std::string admin_url(const server_config::ServerConfig &config, const std::string &endpoint) {
    return config.base_url + "/ghost/api/" + config.api_version + "/admin/" + endpoint;
}

http_transport::HeaderList build_request_headers(const std::string &token, const std::string &api_version) {
    return {
        {"Authorization", "Ghost " + token},
        {"Content-Type", "application/json"},
        {"Accept-Version", api_version},
    };
}

ApiResult dispatch(const ApiContext &context, const std::string &endpoint,
                   const std::string &method, const json *body) {
    ApiResult result;

    std::optional<api_request::HttpMethod> parsed_method = api_request::parse_method(method);
    if (!parsed_method.has_value()) {
        result.error = make_error(ErrorKind::kUnsupportedMethod, "Unsupported method: " + method);
        return result;
    }

    token_signer::TokenResult token = token_signer::issue_token(context.config.admin_api_key,
                                                                context.config.api_version);
    if (!token.success) {
        debug_log::log("Token signing failed: " + token.error.message);
        result.error = token.error;
        return result;
    }

    http_transport::HttpRequest request;
    request.method = api_request::method_name(*parsed_method);
    request.url = admin_url(context.config, endpoint);
    request.headers = build_request_headers(token.token, context.config.api_version);
    if (*parsed_method != api_request::HttpMethod::kGet && body != nullptr) {
        request.body = body->dump(-1, ' ', false, json::error_handler_t::replace);
    }

    debug_log::log("Dispatching " + request.method + " " + request.url);
    http_transport::HttpResponse response = context.transport(request);

    if (!response.success) {
        result.error = make_error(ErrorKind::kTransportError, response.error_detail);
        return result;
    }

    if (!http_transport::is_success_status(response.status_code)) {
        ghost_api::ApiError error = make_error(ErrorKind::kHttpStatusError,
                                               status_error_message(response.status_code, request.url));
        error.status_code = response.status_code;
        error.url = request.url;
        error.request_headers = request.headers;
        error.response_text = response.body;
        result.error = error;
        return result;
    }

    if (response.body.empty()) {
        result.payload = json::object();
        result.success = true;
        return result;
    }

    try {
        result.payload = json::parse(response.body);
    } catch (const json::parse_error &error) {
        result.error = make_error(ErrorKind::kResponseShapeError,
                                  "Invalid JSON in response: " + std::string(error.what()));
        return result;
    }
    if (!result.payload.is_object()) {
        result.payload = json();
        result.error = make_error(ErrorKind::kResponseShapeError, "Expected a JSON object in response");
        return result;
    }

    result.success = true;
    return result;
}

ApiResult dispatch(const ApiContext &context, const api_request::ApiRequest &request) {
    const json *body = request.body.has_value() ? &request.body.value() : nullptr;
    return dispatch(context, api_request::build_endpoint(request), request.method, body);
}

} // namespace request_dispatcher
