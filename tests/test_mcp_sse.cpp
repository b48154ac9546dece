// Tests for the SSE session layer: event framing, session routing of
// POSTed messages and delivery of replies as "message" events.

#include "mcp/mcp_sse.hpp"
#include "test_helpers.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using json = nlohmann::json;
using test_helpers::expect;
using test_helpers::expect_equal;

namespace test_mcp_sse {

// Data of a single-line event ("event: x\r\ndata: <data>\r\n\r\n").
static std::string event_data(const std::string &event) {
    std::size_t start = event.find("data: ");
    std::size_t end = event.find("\r\n", start);
    if (start == std::string::npos || end == std::string::npos) {
        return "";
    }
    return event.substr(start + 6, end - start - 6);
}

static bool test_event_framing() {
    bool success = expect_equal(mcp_sse::format_event("message", "{\"id\":1}"),
                                "event: message\r\ndata: {\"id\":1}\r\n\r\n", "Single-line event");
    success &= expect_equal(mcp_sse::format_event("note", "a\nb"),
                            "event: note\r\ndata: a\r\ndata: b\r\n\r\n", "Multi-line data is split");
    success &= expect_equal(mcp_sse::format_keepalive(), ": ping\r\n\r\n", "Keepalive is a comment line");
    return success;
}

static bool test_query_parameters() {
    bool success = expect(mcp_sse::find_query_parameter("session_id=abc", "session_id") == std::string("abc"),
                          "Single parameter");
    success &= expect(mcp_sse::find_query_parameter("x=1&session_id=def&y", "session_id") == std::string("def"),
                      "Parameter among others");
    success &= expect(mcp_sse::find_query_parameter("session_idx=1", "session_id") == std::nullopt,
                      "Prefix of another name does not match");
    success &= expect(mcp_sse::find_query_parameter("", "session_id") == std::nullopt, "Empty query");
    return success;
}

static bool test_session_lifecycle() {
    mcp_sse::clear_sessions();

    std::string session_id = mcp_sse::open_session();
    bool success = expect(session_id.size() == 32, "Session id is 32 hex digits");
    success &= expect(mcp_sse::has_session(session_id), "Opened session is known");
    success &= expect(mcp_sse::open_session() != session_id, "Session ids are not reused");

    std::string endpoint;
    success &= expect(mcp_sse::take_next_event(session_id, endpoint), "Endpoint event is queued first");
    success &= expect(test_helpers::starts_with(endpoint, "event: endpoint\r\n"), "First event is named endpoint");
    success &= expect_equal(event_data(endpoint), "/messages/?session_id=" + session_id,
                            "Endpoint names the message path with the session id");
    success &= expect(!mcp_sse::has_pending_events(session_id), "Nothing else is queued");

    mcp_sse::close_session(session_id);
    success &= expect(!mcp_sse::has_session(session_id), "Closed session is forgotten");

    mcp_sse::clear_sessions();
    return success;
}

static bool test_post_routing() {
    mcp_sse::clear_sessions();
    std::string session_id = mcp_sse::open_session();
    std::string unused;
    mcp_sse::take_next_event(session_id, unused);
    const std::string ping = "{\"jsonrpc\":\"2.0\",\"id\":5,\"method\":\"ping\"}";

    mcp_sse::PostOutcome missing = mcp_sse::accept_post("", ping);
    bool success = expect(missing.status_code == 400 && missing.body == "session_id is required",
                          "POST without session_id is 400");
    mcp_sse::PostOutcome malformed = mcp_sse::accept_post("session_id=not-hex", ping);
    success &= expect(malformed.status_code == 400 && malformed.body == "Invalid session ID",
                      "Malformed session id is 400");
    mcp_sse::PostOutcome unknown = mcp_sse::accept_post("session_id=" + std::string(32, 'a'), ping);
    success &= expect(unknown.status_code == 404 && unknown.body == "Could not find session",
                      "Unknown session is 404");
    mcp_sse::PostOutcome garbage = mcp_sse::accept_post("session_id=" + session_id, "{\"jsonrpc\":");
    success &= expect(garbage.status_code == 400 && garbage.body == "Could not parse message",
                      "Unparseable body is 400");
    success &= expect(mcp_sse::process_pending_messages().empty(), "Rejected POSTs queue nothing");

    mcp_sse::PostOutcome accepted = mcp_sse::accept_post("session_id=" + session_id, ping);
    success &= expect(accepted.status_code == 202 && accepted.body == "Accepted", "Valid POST is 202");
    success &= expect(!mcp_sse::has_pending_events(session_id), "Reply is not produced before processing");

    std::vector<std::string> touched = mcp_sse::process_pending_messages();
    success &= expect(touched.size() == 1 && touched[0] == session_id, "Processing reports the session");

    std::string reply_event;
    success &= expect(mcp_sse::take_next_event(session_id, reply_event), "Reply is queued on the stream");
    success &= expect(test_helpers::starts_with(reply_event, "event: message\r\n"), "Reply is a message event");
    json reply = json::parse(event_data(reply_event));
    success &= expect(reply["id"] == 5 && reply["result"].is_object(), "Reply carries the JSON-RPC response");

    mcp_sse::clear_sessions();
    return success;
}

static bool test_notifications_and_closed_sessions() {
    mcp_sse::clear_sessions();
    std::string session_id = mcp_sse::open_session();
    std::string unused;
    mcp_sse::take_next_event(session_id, unused);

    mcp_sse::accept_post("session_id=" + session_id, "{\"jsonrpc\":\"2.0\",\"method\":\"notifications/initialized\"}");
    bool success = expect(mcp_sse::process_pending_messages().empty(), "Notifications produce no event");
    success &= expect(!mcp_sse::has_pending_events(session_id), "Stream stays quiet after a notification");

    mcp_sse::accept_post("session_id=" + session_id, "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"ping\"}");
    mcp_sse::close_session(session_id);
    success &= expect(mcp_sse::process_pending_messages().empty(), "Messages for a closed session are dropped");

    mcp_sse::clear_sessions();
    return success;
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_event_framing();
    all_passed &= test_query_parameters();
    all_passed &= test_session_lifecycle();
    all_passed &= test_post_routing();
    all_passed &= test_notifications_and_closed_sessions();
    return all_passed;
}

} // namespace test_mcp_sse
