#ifndef GMCPS_LWS_HTTP_CLIENT_HPP
#define GMCPS_LWS_HTTP_CLIENT_HPP

// HTTP(S) client on top of libwebsockets.
// Each call creates its own lws context, performs one request, services the
// event loop until the response completes or the timeout elapses, and
// destroys the context again. Nothing is shared between calls.

#include "http/http_transport_abi.hpp"

namespace lws_http_client {

// Perform a single blocking HTTP exchange. Never throws; transport
// problems (DNS, refused connection, TLS, timeout) come back as
// success == false with error_detail set.
http_transport::HttpResponse perform(const http_transport::HttpRequest &request);

} // namespace lws_http_client

#endif // GMCPS_LWS_HTTP_CLIENT_HPP
