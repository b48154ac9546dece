#include "ghost/api_request.hpp"
#include "utils/text_encoding.hpp"

namespace api_request {

std::optional<HttpMethod> parse_method(const std::string &method) {
    std::string normalized = text_encoding::to_upper(method);
    if (normalized == "GET") {
        return HttpMethod::kGet;
    }
    if (normalized == "POST") {
        return HttpMethod::kPost;
    }
    if (normalized == "PUT") {
        return HttpMethod::kPut;
    }
    return std::nullopt;
}

const char *method_name(HttpMethod method) {
    switch (method) {
    case HttpMethod::kGet:
        return "GET";
    case HttpMethod::kPost:
        return "POST";
    case HttpMethod::kPut:
        return "PUT";
    }
    return "GET";
}

std::string build_endpoint(const ApiRequest &request) {
    std::string endpoint;
    for (const auto &segment : request.path_segments) {
        endpoint += text_encoding::percent_encode(segment);
        endpoint += '/';
    }

    char separator = '?';
    for (const auto &parameter : request.query) {
        endpoint += separator;
        endpoint += text_encoding::percent_encode(parameter.first);
        endpoint += '=';
        // NQL filters read "status:draft"; keep ':' literal for readability.
        endpoint += text_encoding::percent_encode(parameter.second, ":");
        separator = '&';
    }
    return endpoint;
}

ApiRequest posts_collection(const std::string &method) {
    ApiRequest request;
    request.method = method;
    request.path_segments = {"posts"};
    request.query.emplace_back("source", "html");
    return request;
}

ApiRequest post_by_id(const std::string &method, const std::string &post_id) {
    ApiRequest request;
    request.method = method;
    request.path_segments = {"posts", post_id};
    request.query.emplace_back("source", "html");
    return request;
}

} // namespace api_request
