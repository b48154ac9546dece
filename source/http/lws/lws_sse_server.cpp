#include "http/lws/lws_sse_server.hpp"
#include "mcp/mcp_sse.hpp"
#include "utils/debug_log.hpp"

#include <libwebsockets.h>
#include <cstdlib>
#include <cstring>
#include <map>
#include <string>
#include <vector>

namespace lws_sse_server {

enum class ConnectionKind {
    kUnrouted,
    kEventStream,
    kMessagePost,
};

// Per-connection state, keyed by the lws handle.
struct Connection {
    ConnectionKind kind = ConnectionKind::kUnrouted;
    std::string session_id;
    std::string query;
    std::string body;
    bool body_too_large = false;
    bool reply_pending = false;
    std::string reply_body;
    bool keepalive_due = false;
};

struct ServerState {
    std::map<struct lws *, Connection> connections;
    std::map<std::string, struct lws *> streams; // session id -> event stream
};

static int http_server_callback(struct lws *connection, enum lws_callback_reasons reason,
                                void *user_data, void *incoming_data, size_t incoming_length);

static const struct lws_protocols http_protocols[] = {
    {
        "http",
        http_server_callback,
        0,    // per-session data size
        0     // rx buffer size (lws default)
    },
    {nullptr, nullptr, 0, 0} // sentinel
};

static ServerState *state_of(struct lws *connection) {
    return static_cast<ServerState *>(lws_context_user(lws_get_context(connection)));
}

// Query string of the current request, fragments joined with '&'.
static std::string read_query(struct lws *connection) {
    int length = lws_hdr_total_length(connection, WSI_TOKEN_HTTP_URI_ARGS);
    if (length <= 0) {
        return "";
    }
    std::vector<char> buffer(static_cast<size_t>(length) + 1);
    if (lws_hdr_copy(connection, buffer.data(), static_cast<int>(buffer.size()), WSI_TOKEN_HTTP_URI_ARGS) < 0) {
        return "";
    }
    return std::string(buffer.data());
}

static long read_content_length(struct lws *connection) {
    char buffer[32];
    if (lws_hdr_copy(connection, buffer, sizeof(buffer), WSI_TOKEN_HTTP_CONTENT_LENGTH) <= 0) {
        return 0;
    }
    return std::strtol(buffer, nullptr, 10);
}

// Send a text/plain reply: headers now, body from the writeable callback.
static int start_reply(struct lws *connection, Connection &state, int status_code, const std::string &text) {
    unsigned char buffer[LWS_PRE + 512];
    unsigned char *start = buffer + LWS_PRE;
    unsigned char *position = start;
    unsigned char *end = buffer + sizeof(buffer) - 1;

    if (lws_add_http_common_headers(connection, static_cast<unsigned int>(status_code), "text/plain",
                                    text.size(), &position, end)) {
        return 1;
    }
    if (lws_finalize_write_http_header(connection, start, &position, end)) {
        return 1;
    }
    state.reply_pending = true;
    state.reply_body = text;
    lws_callback_on_writable(connection);
    return 0;
}

static int open_event_stream(struct lws *connection, ServerState &server, Connection &state) {
    std::string session_id = mcp_sse::open_session();
    if (session_id.empty()) {
        return start_reply(connection, state, 500, "Could not create session");
    }

    unsigned char buffer[LWS_PRE + 512];
    unsigned char *start = buffer + LWS_PRE;
    unsigned char *position = start;
    unsigned char *end = buffer + sizeof(buffer) - 1;

    if (lws_add_http_common_headers(connection, HTTP_STATUS_OK, "text/event-stream",
                                    LWS_ILLEGAL_HTTP_CONTENT_LEN, &position, end) ||
        lws_add_http_header_by_token(connection, WSI_TOKEN_HTTP_CACHE_CONTROL,
                                     reinterpret_cast<const unsigned char *>("no-cache"), 8,
                                     &position, end) ||
        lws_finalize_write_http_header(connection, start, &position, end)) {
        mcp_sse::close_session(session_id);
        return 1;
    }

    state.kind = ConnectionKind::kEventStream;
    state.session_id = session_id;
    server.streams[session_id] = connection;

    // The stream lives until the client goes away.
    lws_set_timeout(connection, NO_PENDING_TIMEOUT, 0);
    lws_set_timer_usecs(connection, static_cast<lws_usec_t>(mcp_sse::kKeepaliveSeconds) * LWS_USEC_PER_SEC);
    lws_callback_on_writable(connection);
    return 0;
}

static int write_stream_event(struct lws *connection, Connection &state) {
    std::string event;
    if (!mcp_sse::take_next_event(state.session_id, event)) {
        if (!state.keepalive_due) {
            return 0;
        }
        event = mcp_sse::format_keepalive();
    }
    state.keepalive_due = false;

    std::vector<unsigned char> send_buffer(LWS_PRE + event.size());
    memcpy(send_buffer.data() + LWS_PRE, event.data(), event.size());
    int bytes_written = lws_write(connection, send_buffer.data() + LWS_PRE, event.size(), LWS_WRITE_HTTP);
    if (bytes_written < static_cast<int>(event.size())) {
        debug_log::log("SSE write failed for session " + state.session_id);
        return -1;
    }

    if (mcp_sse::has_pending_events(state.session_id)) {
        lws_callback_on_writable(connection);
    }
    return 0;
}

static int write_reply_body(struct lws *connection, Connection &state) {
    if (!state.reply_pending) {
        return 0;
    }
    state.reply_pending = false;

    std::vector<unsigned char> send_buffer(LWS_PRE + state.reply_body.size());
    memcpy(send_buffer.data() + LWS_PRE, state.reply_body.data(), state.reply_body.size());
    int bytes_written = lws_write(connection, send_buffer.data() + LWS_PRE, state.reply_body.size(),
                                  LWS_WRITE_HTTP_FINAL);
    if (bytes_written < static_cast<int>(state.reply_body.size())) {
        return -1;
    }
    if (lws_http_transaction_completed(connection)) {
        return -1;
    }
    return 0;
}

static int http_server_callback(struct lws *connection, enum lws_callback_reasons reason,
                                void *user_data, void *incoming_data, size_t incoming_length) {
    ServerState *server = (connection != nullptr) ? state_of(connection) : nullptr;
    if (server == nullptr) {
        return lws_callback_http_dummy(connection, reason, user_data, incoming_data, incoming_length);
    }

    switch (reason) {
    case LWS_CALLBACK_HTTP: {
        Connection &state = server->connections[connection];
        state = Connection();

        std::string path = incoming_data ? static_cast<const char *>(incoming_data) : "";
        bool is_get = lws_hdr_total_length(connection, WSI_TOKEN_GET_URI) > 0;
        bool is_post = lws_hdr_total_length(connection, WSI_TOKEN_POST_URI) > 0;
        debug_log::log(std::string(is_post ? "POST " : "GET ") + path);

        if (path == mcp_sse::kStreamPath) {
            if (!is_get) {
                return start_reply(connection, state, 405, "Method Not Allowed");
            }
            return open_event_stream(connection, *server, state);
        }
        if (path == mcp_sse::kMessagePath || path + "/" == mcp_sse::kMessagePath) {
            if (!is_post) {
                return start_reply(connection, state, 405, "Method Not Allowed");
            }
            state.kind = ConnectionKind::kMessagePost;
            state.query = read_query(connection);
            // Without a body lws never reports a completed body.
            if (read_content_length(connection) <= 0) {
                mcp_sse::PostOutcome outcome = mcp_sse::accept_post(state.query, "");
                return start_reply(connection, state, outcome.status_code, outcome.body);
            }
            return 0;
        }
        return start_reply(connection, state, 404, "Not Found");
    }

    case LWS_CALLBACK_HTTP_BODY: {
        auto found = server->connections.find(connection);
        if (found == server->connections.end() || found->second.kind != ConnectionKind::kMessagePost) {
            break;
        }
        Connection &state = found->second;
        if (state.body.size() + incoming_length > mcp_sse::kMaxMessageBytes) {
            state.body_too_large = true;
        } else {
            state.body.append(static_cast<const char *>(incoming_data), incoming_length);
        }
        return 0;
    }

    case LWS_CALLBACK_HTTP_BODY_COMPLETION: {
        auto found = server->connections.find(connection);
        if (found == server->connections.end() || found->second.kind != ConnectionKind::kMessagePost) {
            break;
        }
        Connection &state = found->second;
        if (state.body_too_large) {
            return start_reply(connection, state, 413, "Message too large");
        }
        mcp_sse::PostOutcome outcome = mcp_sse::accept_post(state.query, state.body);
        state.body.clear();
        return start_reply(connection, state, outcome.status_code, outcome.body);
    }

    case LWS_CALLBACK_HTTP_WRITEABLE: {
        auto found = server->connections.find(connection);
        if (found == server->connections.end()) {
            break;
        }
        Connection &state = found->second;
        if (state.kind == ConnectionKind::kEventStream) {
            return write_stream_event(connection, state);
        }
        return write_reply_body(connection, state);
    }

    case LWS_CALLBACK_TIMER: {
        auto found = server->connections.find(connection);
        if (found != server->connections.end() && found->second.kind == ConnectionKind::kEventStream) {
            found->second.keepalive_due = true;
            lws_callback_on_writable(connection);
            lws_set_timer_usecs(connection,
                                static_cast<lws_usec_t>(mcp_sse::kKeepaliveSeconds) * LWS_USEC_PER_SEC);
        }
        break;
    }

    case LWS_CALLBACK_CLOSED_HTTP: {
        auto found = server->connections.find(connection);
        if (found != server->connections.end()) {
            if (found->second.kind == ConnectionKind::kEventStream) {
                mcp_sse::close_session(found->second.session_id);
                server->streams.erase(found->second.session_id);
            }
            server->connections.erase(found);
        }
        break;
    }

    default:
        break;
    }

    return lws_callback_http_dummy(connection, reason, user_data, incoming_data, incoming_length);
}

ServeResult serve(const std::string &host, int port, const StopCondition &should_stop) {
    ServeResult result;
    ServerState server;

    lws_set_log_level(debug_log::is_debug_enabled() ? (LLL_ERR | LLL_WARN | LLL_NOTICE) : LLL_ERR, nullptr);

    bool every_interface = host.empty() || host == "0.0.0.0" || host == "::";

    struct lws_context_creation_info context_info;
    memset(&context_info, 0, sizeof(context_info));
    context_info.port = port;
    context_info.iface = every_interface ? nullptr : host.c_str();
    context_info.protocols = http_protocols;
    context_info.gid = -1;
    context_info.uid = -1;
    context_info.user = &server;

    struct lws_context *context = lws_create_context(&context_info);
    if (context == nullptr) {
        result.error_detail = "Cannot listen on " + host + ":" + std::to_string(port);
        return result;
    }

    debug_log::log_always("SSE transport listening on " + host + ":" + std::to_string(port) +
                          " (GET " + mcp_sse::kStreamPath + ", POST " + mcp_sse::kMessagePath + ")");

    result.success = true;
    while (!should_stop()) {
        if (lws_service(context, 50) < 0) {
            result.success = false;
            result.error_detail = "libwebsockets event loop failed";
            break;
        }
        for (const std::string &session_id : mcp_sse::process_pending_messages()) {
            auto stream = server.streams.find(session_id);
            if (stream != server.streams.end()) {
                lws_callback_on_writable(stream->second);
            }
        }
    }

    lws_context_destroy(context);
    mcp_sse::clear_sessions();
    return result;
}

} // namespace lws_sse_server
