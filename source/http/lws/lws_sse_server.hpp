#ifndef GMCPS_LWS_SSE_SERVER_HPP
#define GMCPS_LWS_SSE_SERVER_HPP

// HTTP listener for the SSE transport, on top of libwebsockets.
// Routes GET /sse and POST /messages/ into mcp_sse and runs dispatch on
// the same event loop, between lws_service() rounds.

#include <functional>
#include <string>

namespace lws_sse_server {

struct ServeResult {
    bool success = false;
    std::string error_detail;
};

// Polled between event loop rounds; serve() returns once it yields true.
using StopCondition = std::function<bool()>;

// Listen on host:port ("0.0.0.0", "::" or "" for every interface) and
// serve until should_stop() is true. Fails only if the listener cannot be
// set up or the event loop breaks.
ServeResult serve(const std::string &host, int port, const StopCondition &should_stop);

} // namespace lws_sse_server

#endif // GMCPS_LWS_SSE_SERVER_HPP
