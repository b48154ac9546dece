#include "http/lws/lws_http_client.hpp"
#include "utils/debug_log.hpp"
#include "utils/text_encoding.hpp"

#include <libwebsockets.h>
#include <chrono>
#include <cstring>
#include <string>
#include <vector>

namespace lws_http_client {

using http_transport::HttpRequest;
using http_transport::HttpResponse;

// State of one request/response exchange, reachable from the callback
// through the context user pointer.
struct Exchange {
    const HttpRequest *request = nullptr;
    HttpResponse *response = nullptr;
    bool completed = false;
    bool failed = false;
    bool body_sent = false;
};

static int http_client_callback(struct lws *connection, enum lws_callback_reasons reason,
                                void *user_data, void *incoming_data, size_t incoming_length);

static const struct lws_protocols http_protocols[] = {
    {
        "gmcps-http-client",
        http_client_callback,
        0,    // per-session data size
        0     // rx buffer size (lws default)
    },
    {nullptr, nullptr, 0, 0} // sentinel
};

static bool has_request_body(const HttpRequest &request) {
    return request.method == "POST" || request.method == "PUT";
}

// --- HTTP client callback ---

static int http_client_callback(struct lws *connection, enum lws_callback_reasons reason,
                                void *user_data, void *incoming_data, size_t incoming_length) {
    Exchange *exchange = nullptr;
    if (connection != nullptr) {
        exchange = static_cast<Exchange *>(lws_context_user(lws_get_context(connection)));
    }
    if (exchange == nullptr) {
        return lws_callback_http_dummy(connection, reason, user_data, incoming_data, incoming_length);
    }

    switch (reason) {
    case LWS_CALLBACK_CLIENT_CONNECTION_ERROR: {
        const char *error_message = incoming_data ? static_cast<const char *>(incoming_data) : "unknown";
        exchange->response->error_detail = "Connection error: " + std::string(error_message);
        exchange->failed = true;
        debug_log::log("HTTP client connection error (LWS): " + std::string(error_message));
        break;
    }

    case LWS_CALLBACK_ESTABLISHED_CLIENT_HTTP:
        exchange->response->status_code = static_cast<int>(lws_http_client_http_response(connection));
        debug_log::log("HTTP response status " + std::to_string(exchange->response->status_code));
        break;

    case LWS_CALLBACK_CLIENT_APPEND_HANDSHAKE_HEADER: {
        unsigned char **position = reinterpret_cast<unsigned char **>(incoming_data);
        unsigned char *end = (*position) + incoming_length;
        const HttpRequest &request = *exchange->request;

        for (const auto &header : request.headers) {
            // lws wants the name lower case with a trailing colon.
            std::string name = text_encoding::to_lower(header.first) + ":";
            if (lws_add_http_header_by_name(connection,
                                            reinterpret_cast<const unsigned char *>(name.c_str()),
                                            reinterpret_cast<const unsigned char *>(header.second.data()),
                                            static_cast<int>(header.second.size()),
                                            position, end)) {
                exchange->response->error_detail = "Request headers do not fit: " + header.first;
                exchange->failed = true;
                return -1;
            }
        }

        if (has_request_body(request)) {
            if (lws_add_http_header_content_length(connection, request.body.size(), position, end)) {
                exchange->response->error_detail = "Request headers do not fit: content-length";
                exchange->failed = true;
                return -1;
            }
            if (!request.body.empty()) {
                lws_client_http_body_pending(connection, 1);
                lws_callback_on_writable(connection);
            }
        }
        break;
    }

    case LWS_CALLBACK_CLIENT_HTTP_WRITEABLE: {
        if (exchange->body_sent) {
            break;
        }
        const std::string &body = exchange->request->body;

        // libwebsockets requires LWS_PRE bytes of padding before the data.
        std::vector<unsigned char> send_buffer(LWS_PRE + body.size());
        memcpy(send_buffer.data() + LWS_PRE, body.data(), body.size());

        int bytes_written = lws_write(connection, send_buffer.data() + LWS_PRE, body.size(),
                                      LWS_WRITE_HTTP_FINAL);
        if (bytes_written < static_cast<int>(body.size())) {
            exchange->response->error_detail = "Failed to send request body";
            exchange->failed = true;
            return -1;
        }
        exchange->body_sent = true;
        lws_client_http_body_pending(connection, 0);
        break;
    }

    case LWS_CALLBACK_RECEIVE_CLIENT_HTTP_READ:
        exchange->response->body.append(static_cast<const char *>(incoming_data), incoming_length);
        break;

    case LWS_CALLBACK_RECEIVE_CLIENT_HTTP: {
        // Pull the pending body data; it arrives via RECEIVE_CLIENT_HTTP_READ.
        char read_buffer[LWS_PRE + 4096];
        char *read_pointer = read_buffer + LWS_PRE;
        int read_length = static_cast<int>(sizeof(read_buffer) - LWS_PRE);
        if (lws_http_client_read(connection, &read_pointer, &read_length) < 0) {
            return -1;
        }
        return 0;
    }

    case LWS_CALLBACK_COMPLETED_CLIENT_HTTP:
        exchange->completed = true;
        break;

    case LWS_CALLBACK_CLOSED_CLIENT_HTTP:
        // A close after the status line ends a close-delimited body.
        if (!exchange->completed && !exchange->failed) {
            if (exchange->response->status_code > 0) {
                exchange->completed = true;
            } else {
                exchange->response->error_detail = "Connection closed before a response was received";
                exchange->failed = true;
            }
        }
        break;

    default:
        break;
    }

    return lws_callback_http_dummy(connection, reason, user_data, incoming_data, incoming_length);
}

// --- Public functions ---

HttpResponse perform(const HttpRequest &request) {
    HttpResponse response;
    response.effective_url = request.url;

    // lws_parse_uri writes into its input, so give it a private copy.
    std::vector<char> url_buffer(request.url.begin(), request.url.end());
    url_buffer.push_back('\0');
    const char *scheme = nullptr;
    const char *address = nullptr;
    const char *path_tail = nullptr;
    int port = 0;
    if (lws_parse_uri(url_buffer.data(), &scheme, &address, &port, &path_tail) != 0 ||
        address == nullptr || address[0] == '\0') {
        response.error_detail = "Invalid URL: " + request.url;
        return response;
    }
    std::string scheme_name = text_encoding::to_lower(scheme ? scheme : "");
    if (scheme_name != "http" && scheme_name != "https") {
        response.error_detail = "Unsupported URL scheme in " + request.url;
        return response;
    }
    bool use_tls = (scheme_name == "https");
    std::string host = address;
    std::string path = "/" + std::string(path_tail ? path_tail : "");

    // The Host header carries the port unless it is the scheme default.
    std::string host_header = host;
    if (port != (use_tls ? 443 : 80)) {
        host_header += ":" + std::to_string(port);
    }

    Exchange exchange;
    exchange.request = &request;
    exchange.response = &response;

    lws_set_log_level(debug_log::is_debug_enabled() ? (LLL_ERR | LLL_WARN | LLL_NOTICE) : LLL_ERR, nullptr);

    // Create libwebsockets context.
    struct lws_context_creation_info context_info;
    memset(&context_info, 0, sizeof(context_info));
    context_info.port = CONTEXT_PORT_NO_LISTEN; // Client mode, no listening.
    context_info.protocols = http_protocols;
    context_info.gid = -1;
    context_info.uid = -1;
    context_info.user = &exchange;
    if (use_tls) {
        context_info.options |= LWS_SERVER_OPTION_DO_SSL_GLOBAL_INIT;
    }

    struct lws_context *context = lws_create_context(&context_info);
    if (context == nullptr) {
        response.error_detail = "Failed to create libwebsockets context";
        return response;
    }

    struct lws_client_connect_info connect_info;
    memset(&connect_info, 0, sizeof(connect_info));
    connect_info.context = context;
    connect_info.address = host.c_str();
    connect_info.port = port;
    connect_info.path = path.c_str();
    connect_info.host = host_header.c_str();
    connect_info.method = request.method.c_str();
    connect_info.protocol = http_protocols[0].name;
    connect_info.alpn = "http/1.1";
    // 3xx responses go back to the caller; they are never followed.
    connect_info.ssl_connection = (use_tls ? LCCSCF_USE_SSL : 0) | LCCSCF_HTTP_NO_FOLLOW_REDIRECT;

    debug_log::log("HTTP " + request.method + " " + scheme_name + "://" + host + ":" +
                   std::to_string(port) + path);

    struct lws *connection = lws_client_connect_via_info(&connect_info);
    if (connection == nullptr && !exchange.failed) {
        response.error_detail = "Failed to initiate connection to " + host;
        exchange.failed = true;
    }

    auto start_time = std::chrono::steady_clock::now();
    while (!exchange.completed && !exchange.failed) {
        if (lws_service(context, 50) < 0) {
            response.error_detail = "libwebsockets event loop failed";
            exchange.failed = true;
            break;
        }

        auto elapsed = std::chrono::steady_clock::now() - start_time;
        if (std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() > request.timeout_milliseconds) {
            response.error_detail = "Request timed out after " +
                                    std::to_string(request.timeout_milliseconds / 1000) + " s: " + request.url;
            exchange.failed = true;
            break;
        }
    }

    lws_context_destroy(context);

    response.success = exchange.completed && !exchange.failed;
    return response;
}

} // namespace lws_http_client
