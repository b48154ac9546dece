#include "ghost/api_result.hpp"
#include "utils/text_encoding.hpp"

namespace ghost_api {

ApiError make_error(ErrorKind kind, const std::string &message) {
    ApiError error;
    error.kind = kind;
    error.message = message;
    return error;
}

const char *error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::kNone:
        return "None";
    case ErrorKind::kInvalidCredentialFormat:
        return "InvalidCredentialFormat";
    case ErrorKind::kSigningError:
        return "SigningError";
    case ErrorKind::kUnsupportedMethod:
        return "UnsupportedMethod";
    case ErrorKind::kHttpStatusError:
        return "HttpStatusError";
    case ErrorKind::kTransportError:
        return "TransportError";
    case ErrorKind::kResponseShapeError:
        return "ResponseShapeError";
    }
    return "Unknown";
}

std::string describe_error(const ApiError &error) {
    std::string message = text_encoding::sanitize_utf8(error.message);
    if (error.kind != ErrorKind::kHttpStatusError) {
        return message;
    }

    nlohmann::ordered_json headers = nlohmann::ordered_json::object();
    for (const auto &header : error.request_headers) {
        headers[header.first] = text_encoding::sanitize_utf8(header.second);
    }

    nlohmann::ordered_json details;
    details["status_code"] = error.status_code;
    details["url"] = text_encoding::sanitize_utf8(error.url);
    details["headers"] = headers;
    details["response_text"] = text_encoding::sanitize_utf8(error.response_text);
    return message + "\n" + details.dump(2);
}

} // namespace ghost_api
