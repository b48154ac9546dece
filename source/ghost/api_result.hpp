#ifndef GMCPS_API_RESULT_HPP
#define GMCPS_API_RESULT_HPP

// Result and error types shared by the token signer, the request
// dispatcher and the post operations. Nothing in these layers throws;
// every outcome is one of these structs.

#include <nlohmann/json.hpp>
#include <string>

#include "http/http_transport_abi.hpp"

namespace ghost_api {

using json = nlohmann::json;

enum class ErrorKind {
    kNone,
    kInvalidCredentialFormat, // configured key is not exactly ID:SECRET
    kSigningError,            // secret not hex, or HMAC failed
    kUnsupportedMethod,       // verb outside GET/POST/PUT
    kHttpStatusError,         // remote answered non-2xx
    kTransportError,          // DNS, refused, TLS, timeout
    kResponseShapeError       // body not JSON, or expected fields missing
};

struct ApiError {
    ErrorKind kind = ErrorKind::kNone;
    std::string message;

    // Only filled for kHttpStatusError.
    int status_code = 0;
    std::string url;
    http_transport::HeaderList request_headers;
    std::string response_text;
};

// Outcome of one dispatched call: the decoded JSON body or an error.
struct ApiResult {
    bool success = false;
    json payload;
    ApiError error;
};

ApiError make_error(ErrorKind kind, const std::string &message);

const char *error_kind_name(ErrorKind kind);

// Human readable rendering used in tool output. For HTTP status errors the
// status code, URL, sent headers and response body follow the message
// verbatim as an indented JSON block.
std::string describe_error(const ApiError &error);

} // namespace ghost_api

#endif // GMCPS_API_RESULT_HPP
