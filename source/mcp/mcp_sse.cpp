#include "mcp/mcp_sse.hpp"
#include "mcp/mcp_dispatch.hpp"
#include "utils/debug_log.hpp"
#include "utils/text_encoding.hpp"

#include <nlohmann/json.hpp>
#include <openssl/rand.h>

#include <algorithm>
#include <deque>
#include <map>
#include <sstream>
#include <utility>

namespace mcp_sse {

using json = nlohmann::json;

static constexpr std::size_t SESSION_ID_BYTES = 16;

// Outgoing events per open session.
static std::map<std::string, std::deque<std::string>> session_events;

// Accepted messages waiting for dispatch, with the session they came from.
static std::deque<std::pair<std::string, json>> pending_messages;

static bool is_session_id(const std::string &text) {
    if (text.size() != SESSION_ID_BYTES * 2) {
        return false;
    }
    return std::all_of(text.begin(), text.end(), [](char character) {
        return (character >= '0' && character <= '9') || (character >= 'a' && character <= 'f');
    });
}

std::string format_event(const std::string &event_name, const std::string &data) {
    std::string event = "event: " + event_name + "\r\n";
    std::istringstream lines(data);
    std::string line;
    bool any_line = false;
    while (std::getline(lines, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        event += "data: " + line + "\r\n";
        any_line = true;
    }
    if (!any_line) {
        event += "data: \r\n";
    }
    event += "\r\n";
    return event;
}

std::string format_keepalive() {
    return ": ping\r\n\r\n";
}

std::optional<std::string> find_query_parameter(const std::string &query, const std::string &name) {
    std::size_t position = 0;
    while (position <= query.size()) {
        std::size_t separator = query.find('&', position);
        if (separator == std::string::npos) {
            separator = query.size();
        }
        std::string pair = query.substr(position, separator - position);
        std::size_t equals = pair.find('=');
        std::string key = pair.substr(0, equals);
        if (key == name) {
            return equals == std::string::npos ? std::string() : pair.substr(equals + 1);
        }
        position = separator + 1;
    }
    return std::nullopt;
}

std::string open_session() {
    unsigned char random_bytes[SESSION_ID_BYTES];
    if (RAND_bytes(random_bytes, static_cast<int>(sizeof(random_bytes))) != 1) {
        debug_log::log_always("Could not generate a session id: RAND_bytes failed");
        return "";
    }
    std::string session_id = text_encoding::bytes_to_hex(
        std::string(reinterpret_cast<const char *>(random_bytes), sizeof(random_bytes)));

    session_events[session_id].push_back(
        format_event("endpoint", std::string(kMessagePath) + "?session_id=" + session_id));
    debug_log::log("SSE session opened: " + session_id);
    return session_id;
}

void close_session(const std::string &session_id) {
    if (session_events.erase(session_id) > 0) {
        debug_log::log("SSE session closed: " + session_id);
    }
    pending_messages.erase(std::remove_if(pending_messages.begin(), pending_messages.end(),
                                          [&](const std::pair<std::string, json> &pending) {
                                              return pending.first == session_id;
                                          }),
                           pending_messages.end());
}

bool has_session(const std::string &session_id) {
    return session_events.count(session_id) > 0;
}

PostOutcome accept_post(const std::string &query, const std::string &body) {
    std::optional<std::string> session_id = find_query_parameter(query, "session_id");
    if (!session_id.has_value() || session_id->empty()) {
        return {400, "session_id is required"};
    }
    if (!is_session_id(*session_id)) {
        return {400, "Invalid session ID"};
    }
    if (!has_session(*session_id)) {
        return {404, "Could not find session"};
    }
    if (body.size() > kMaxMessageBytes) {
        return {413, "Message too large"};
    }

    json message;
    try {
        message = json::parse(body);
    } catch (const json::parse_error &error) {
        debug_log::log("SSE message parse error: " + std::string(error.what()));
        return {400, "Could not parse message"};
    }

    pending_messages.emplace_back(*session_id, std::move(message));
    return {202, "Accepted"};
}

std::vector<std::string> process_pending_messages() {
    std::vector<std::string> sessions_with_events;
    while (!pending_messages.empty()) {
        std::pair<std::string, json> pending = std::move(pending_messages.front());
        pending_messages.pop_front();

        json reply = mcp_dispatch::dispatch_message(pending.second);
        if (reply.is_null()) {
            continue;
        }
        // The stream may have closed while the message was being handled.
        auto events = session_events.find(pending.first);
        if (events == session_events.end()) {
            continue;
        }
        events->second.push_back(
            format_event("message", reply.dump(-1, ' ', false, json::error_handler_t::replace)));
        if (std::find(sessions_with_events.begin(), sessions_with_events.end(), pending.first) ==
            sessions_with_events.end()) {
            sessions_with_events.push_back(pending.first);
        }
    }
    return sessions_with_events;
}

bool take_next_event(const std::string &session_id, std::string &out_event) {
    auto events = session_events.find(session_id);
    if (events == session_events.end() || events->second.empty()) {
        return false;
    }
    out_event = std::move(events->second.front());
    events->second.pop_front();
    return true;
}

bool has_pending_events(const std::string &session_id) {
    auto events = session_events.find(session_id);
    return events != session_events.end() && !events->second.empty();
}

void clear_sessions() {
    session_events.clear();
    pending_messages.clear();
}

} // namespace mcp_sse
