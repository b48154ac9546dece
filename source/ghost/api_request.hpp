#ifndef GMCPS_API_REQUEST_HPP
#define GMCPS_API_REQUEST_HPP

// Structured Admin API request: the endpoint is kept as path segments and
// query parameters until it is serialised, so ids, filters and limits are
// escaped in one place.

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace api_request {

using json = nlohmann::json;

enum class HttpMethod {
    kGet,
    kPost,
    kPut
};

struct ApiRequest {
    std::string method = "GET";              // validated at dispatch time
    std::vector<std::string> path_segments;  // e.g. {"posts", "<id>"}
    std::vector<std::pair<std::string, std::string>> query; // in order
    std::optional<json> body;                // ignored for GET
};

// Parse a method name case-insensitively. nullopt for anything but
// GET, POST or PUT.
std::optional<HttpMethod> parse_method(const std::string &method);

const char *method_name(HttpMethod method);

// Serialise to the relative endpoint form used under .../admin/, e.g.
// "posts/abc/?source=html". Always ends the path with '/'.
std::string build_endpoint(const ApiRequest &request);

// Builder helpers for the post endpoints.
ApiRequest posts_collection(const std::string &method);
ApiRequest post_by_id(const std::string &method, const std::string &post_id);

} // namespace api_request

#endif // GMCPS_API_REQUEST_HPP
