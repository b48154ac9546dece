#ifndef GMCPS_HTTP_TRANSPORT_ABI_HPP
#define GMCPS_HTTP_TRANSPORT_ABI_HPP

// HTTP transport abstraction interface.
// The request dispatcher only sees these types and a Transport callable,
// so the libwebsockets client can be swapped for a fake in tests.

#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace http_transport {

// Header list in the order headers are sent.
using HeaderList = std::vector<std::pair<std::string, std::string>>;

// Default per-request timeout.
constexpr int kDefaultTimeoutMilliseconds = 30000;

struct HttpRequest {
    std::string method = "GET"; // upper case
    std::string url;            // absolute http:// or https:// URL
    HeaderList headers;
    std::string body;           // sent only for POST/PUT
    int timeout_milliseconds = kDefaultTimeoutMilliseconds;
};

// success is about the exchange, not the status code: a 404 is a
// successful exchange with status_code 404.
struct HttpResponse {
    bool success = false;
    int status_code = 0;
    std::string effective_url;
    std::string body;
    std::string error_detail; // transport failure description when !success
};

// Performs exactly one HTTP exchange. Never throws.
using Transport = std::function<HttpResponse(const HttpRequest &request)>;

// True for 2xx status codes.
inline bool is_success_status(int status_code) {
    return status_code >= 200 && status_code < 300;
}

} // namespace http_transport

#endif // GMCPS_HTTP_TRANSPORT_ABI_HPP
