#ifndef GMCPS_REQUEST_DISPATCHER_HPP
#define GMCPS_REQUEST_DISPATCHER_HPP

// Request dispatcher: signs, sends and normalises one Ghost Admin API call.
//
// Every call mints a fresh token, performs exactly one HTTP exchange (no
// retries) and folds the outcome into an ApiResult. Nothing is thrown.

#include <nlohmann/json.hpp>
#include <string>

#include "config/server_config.hpp"
#include "ghost/api_request.hpp"
#include "ghost/api_result.hpp"
#include "http/http_transport_abi.hpp"

namespace request_dispatcher {

using json = nlohmann::json;

// What a call needs besides its arguments: the read-only configuration and
// the transport that performs the HTTP exchange.
struct ApiContext {
    const server_config::ServerConfig &config;
    http_transport::Transport transport;
};

// {base_url}/ghost/api/{version}/admin/{endpoint}
std::string admin_url(const server_config::ServerConfig &config, const std::string &endpoint);

// Authorization, Content-Type and Accept-Version, in that order.
http_transport::HeaderList build_request_headers(const std::string &token, const std::string &api_version);

// Dispatch to a relative endpoint ("posts/?source=html"). body may be null;
// it is serialised for POST and PUT only.
ghost_api::ApiResult dispatch(const ApiContext &context, const std::string &endpoint,
                              const std::string &method, const json *body = nullptr);

// Dispatch a structured request.
ghost_api::ApiResult dispatch(const ApiContext &context, const api_request::ApiRequest &request);

} // namespace request_dispatcher

#endif // GMCPS_REQUEST_DISPATCHER_HPP
