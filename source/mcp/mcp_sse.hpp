#ifndef GMCPS_MCP_SSE_HPP
#define GMCPS_MCP_SSE_HPP

// MCP over HTTP with server-sent events.
//
// A client opens GET /sse and receives an "endpoint" event naming
// /messages/?session_id=<id>. It then POSTs JSON-RPC messages there; each
// POST is answered 202 right away and the JSON-RPC reply arrives later as
// a "message" event on that session's stream.
//
// This module holds the sessions and their outgoing event queues. The
// HTTP side lives in http/lws/lws_sse_server. Single-threaded: everything
// runs on the server's event loop.

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace mcp_sse {

constexpr const char *kStreamPath = "/sse";
constexpr const char *kMessagePath = "/messages/";

// Upper bound for one POSTed message.
constexpr std::size_t kMaxMessageBytes = 4 * 1024 * 1024;

// Comment lines keep idle streams open through proxies.
constexpr int kKeepaliveSeconds = 15;

struct PostOutcome {
    int status_code = 0;
    std::string body; // text/plain
};

// One SSE event. Multi-line data is split over several data: lines.
std::string format_event(const std::string &event_name, const std::string &data);

std::string format_keepalive();

// Value of name in a query string ("a=1&b=2"). nullopt when absent.
std::optional<std::string> find_query_parameter(const std::string &query, const std::string &name);

// Create a session with a random 32-hex-digit id and queue its endpoint
// event. Returns an empty string if no random bytes were available.
std::string open_session();

// Forget a session and anything queued for it.
void close_session(const std::string &session_id);

bool has_session(const std::string &session_id);

// Handle POST /messages/?<query> with the given body. A 202 outcome means
// the message was queued for process_pending_messages().
PostOutcome accept_post(const std::string &query, const std::string &body);

// Dispatch every queued message and queue the replies as "message" events.
// Returns the ids of sessions that have new events.
std::vector<std::string> process_pending_messages();

// Pop the next formatted event for a session. False when none is queued.
bool take_next_event(const std::string &session_id, std::string &out_event);

bool has_pending_events(const std::string &session_id);

// Drop all sessions and queued messages (server shutdown, tests).
void clear_sessions();

} // namespace mcp_sse

#endif // GMCPS_MCP_SSE_HPP
