// Tests for the request dispatcher against a scripted fake transport:
// URL and header construction, method validation, and how each failure
// kind is folded into an ApiResult.

#include "ghost/request_dispatcher.hpp"
#include "test_helpers.hpp"

#include <nlohmann/json.hpp>
#include <string>

using json = nlohmann::json;
using test_helpers::expect;
using test_helpers::expect_equal;

namespace test_request_dispatcher {

static bool test_unsupported_methods_never_reach_network() {
    server_config::ServerConfig config = test_helpers::make_config();
    test_helpers::FakeTransport fake;
    request_dispatcher::ApiContext context{config, fake.transport()};

    bool success = true;
    for (const std::string method : {"DELETE", "patch", "HEAD", "", "OPTIONS"}) {
        ghost_api::ApiResult result = request_dispatcher::dispatch(context, "posts/", method);
        success &= expect(!result.success && result.error.kind == ghost_api::ErrorKind::kUnsupportedMethod,
                          "Method '" + method + "' fails with UnsupportedMethod");
    }
    success &= expect(fake.requests().empty(), "No request was sent for unsupported methods");
    return success;
}

static bool test_invalid_credential_never_reaches_network() {
    server_config::ServerConfig config = test_helpers::make_config("missing-separator");
    test_helpers::FakeTransport fake;
    request_dispatcher::ApiContext context{config, fake.transport()};

    ghost_api::ApiResult result = request_dispatcher::dispatch(context, "posts/?source=html", "GET");
    bool success = expect(result.error.kind == ghost_api::ErrorKind::kInvalidCredentialFormat,
                          "Malformed key fails with InvalidCredentialFormat");
    success &= expect(fake.requests().empty(), "No request was sent with a malformed key");
    return success;
}

static bool test_url_and_headers() {
    server_config::ServerConfig config = test_helpers::make_config();
    test_helpers::FakeTransport fake;
    fake.add_response(test_helpers::make_response(200, "{\"posts\":[]}"));
    request_dispatcher::ApiContext context{config, fake.transport()};

    ghost_api::ApiResult result = request_dispatcher::dispatch(context, "posts/?source=html&limit=3", "get");
    if (!expect(result.success && fake.requests().size() == 1, "GET succeeds with one request")) {
        return false;
    }
    const http_transport::HttpRequest &sent = fake.requests().front();

    bool success = expect_equal(sent.url, "https://blog.example.com/ghost/api/v4/admin/posts/?source=html&limit=3",
                                "URL is {base}/ghost/api/v4/admin/{endpoint}");
    success &= expect_equal(sent.method, "GET", "Method is normalised to upper case");
    success &= expect(test_helpers::starts_with(test_helpers::find_header(sent.headers, "Authorization"), "Ghost ey"),
                      "Authorization carries 'Ghost <jwt>'");
    success &= expect_equal(test_helpers::find_header(sent.headers, "Content-Type"), "application/json",
                            "Content-Type is application/json");
    success &= expect_equal(test_helpers::find_header(sent.headers, "Accept-Version"), "v4",
                            "Accept-Version is the API version");
    success &= expect(sent.body.empty(), "GET sends no body");
    success &= expect(sent.timeout_milliseconds == 30000, "Request timeout is 30 s");
    success &= expect(result.payload.contains("posts"), "Decoded JSON payload is returned");
    return success;
}

static bool test_fresh_token_per_call() {
    server_config::ServerConfig config = test_helpers::make_config();
    test_helpers::FakeTransport fake;
    fake.add_response(test_helpers::make_response(200, "{}"));
    fake.add_response(test_helpers::make_response(200, "{}"));
    request_dispatcher::ApiContext context{config, fake.transport()};

    request_dispatcher::dispatch(context, "site/", "GET");
    request_dispatcher::dispatch(context, "site/", "GET");
    bool success = expect(fake.requests().size() == 2, "Each dispatch performs exactly one request");
    success &= expect(!test_helpers::find_header(fake.requests()[0].headers, "Authorization").empty() &&
                      !test_helpers::find_header(fake.requests()[1].headers, "Authorization").empty(),
                      "Every request is signed");
    return success;
}

static bool test_post_body_is_serialised() {
    server_config::ServerConfig config = test_helpers::make_config();
    test_helpers::FakeTransport fake;
    fake.add_response(test_helpers::make_response(201, "{\"posts\":[{\"id\":\"1\"}]}"));
    request_dispatcher::ApiContext context{config, fake.transport()};

    json body = {{"posts", json::array({{{"title", "Hello"}}})}};
    ghost_api::ApiResult result = request_dispatcher::dispatch(context, "posts/?source=html", "post", &body);

    bool success = expect(result.success, "201 Created counts as success");
    success &= expect(!fake.requests().empty() && json::parse(fake.requests().front().body) == body,
                      "POST body is the JSON payload");
    return success;
}

static bool test_http_status_error_preserved_verbatim() {
    server_config::ServerConfig config = test_helpers::make_config();
    test_helpers::FakeTransport fake;
    std::string error_body = "{\"errors\":[{\"message\":\"Resource not found error, cannot read post.\","
                             "\"type\":\"NotFoundError\"}]}";
    fake.add_response(test_helpers::make_response(404, error_body));
    request_dispatcher::ApiContext context{config, fake.transport()};

    ghost_api::ApiResult result = request_dispatcher::dispatch(context, "posts/nope/?source=html", "GET");
    const ghost_api::ApiError &error = result.error;

    bool success = expect(!result.success && error.kind == ghost_api::ErrorKind::kHttpStatusError,
                          "404 is an HttpStatusError");
    success &= expect(error.status_code == 404, "Status code is kept");
    success &= expect_equal(error.url, "https://blog.example.com/ghost/api/v4/admin/posts/nope/?source=html",
                            "Request URL is kept");
    success &= expect_equal(error.response_text, error_body, "Response body is kept verbatim");
    success &= expect(error.request_headers.size() == 3, "Sent headers are kept");

    std::string described = ghost_api::describe_error(error);
    success &= expect(test_helpers::starts_with(described, "Client error '404' for url"),
                      "Description starts with the status summary");
    json details = json::parse(described.substr(described.find('\n') + 1));
    success &= expect(details["status_code"] == 404 && details["response_text"] == error_body,
                      "Description carries status and untruncated body");
    return success;
}

static bool test_transport_error() {
    server_config::ServerConfig config = test_helpers::make_config();
    test_helpers::FakeTransport fake;
    fake.add_response(test_helpers::make_transport_failure("Request timed out after 30 s"));
    request_dispatcher::ApiContext context{config, fake.transport()};

    ghost_api::ApiResult result = request_dispatcher::dispatch(context, "site/", "GET");
    bool success = expect(result.error.kind == ghost_api::ErrorKind::kTransportError, "Timeout is a TransportError");
    success &= expect_equal(result.error.message, "Request timed out after 30 s", "Transport description is passed on");
    success &= expect(fake.requests().size() == 1, "Failed call is not retried");
    return success;
}

static bool test_invalid_json_body() {
    server_config::ServerConfig config = test_helpers::make_config();
    test_helpers::FakeTransport fake;
    fake.add_response(test_helpers::make_response(200, "<html>maintenance</html>"));
    fake.add_response(test_helpers::make_response(200, "[1,2]"));
    request_dispatcher::ApiContext context{config, fake.transport()};

    ghost_api::ApiResult html = request_dispatcher::dispatch(context, "site/", "GET");
    ghost_api::ApiResult array = request_dispatcher::dispatch(context, "site/", "GET");
    bool success = expect(html.error.kind == ghost_api::ErrorKind::kResponseShapeError,
                          "Non-JSON success body is a ResponseShapeError");
    success &= expect(array.error.kind == ghost_api::ErrorKind::kResponseShapeError,
                      "Non-object JSON body is a ResponseShapeError");
    return success;
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_unsupported_methods_never_reach_network();
    all_passed &= test_invalid_credential_never_reaches_network();
    all_passed &= test_url_and_headers();
    all_passed &= test_fresh_token_per_call();
    all_passed &= test_post_body_is_serialised();
    all_passed &= test_http_status_error_preserved_verbatim();
    all_passed &= test_transport_error();
    all_passed &= test_invalid_json_body();
    return all_passed;
}

} // namespace test_request_dispatcher
