// GMCPS – Ghost Model Context Protocol Server
// Entry point: loads configuration, registers the tools and runs the chosen
// MCP transport (HTTP + server-sent events, or stdio).
//
// Logs go to stderr (in stdio mode stdout carries only MCP messages).

#include <nlohmann/json.hpp>
#include <iostream>
#include <string>
#include <csignal>

#include "config/server_config.hpp"
#include "ghost/request_dispatcher.hpp"
#include "http/lws/lws_http_client.hpp"
#include "http/lws/lws_sse_server.hpp"
#include "mcp/mcp_dispatch.hpp"
#include "mcp/mcp_stdio.hpp"
#include "tool_handlers/tool_handlers.hpp"
#include "utils/debug_log.hpp"

using json = nlohmann::json;

// Global flag for graceful shutdown.
static volatile std::sig_atomic_t shutdown_requested = 0;

static void signal_handler(int signal_number) {
    (void)signal_number;
    shutdown_requested = 1;
}

// Read JSON-RPC messages from stdin, dispatch, write responses to stdout.
static void run_stdio_loop() {
    debug_log::log_always("Ghost MCP Server started. Waiting for MCP messages on stdin.");

    while (!shutdown_requested) {
        std::string raw_message = mcp_stdio::read_message();

        if (raw_message.empty()) {
            // EOF on stdin means the client disconnected.
            debug_log::log_always("EOF on stdin. Shutting down.");
            break;
        }

        json parsed_message;
        try {
            parsed_message = json::parse(raw_message);
        } catch (const json::parse_error &error) {
            debug_log::log_always("Failed to parse incoming JSON: " + std::string(error.what()));
            mcp_stdio::write_message(mcp_dispatch::build_parse_error_response().dump());
            continue;
        }

        json response = mcp_dispatch::dispatch_message(parsed_message);

        // Notifications return null (no response needed).
        if (response.is_null()) {
            continue;
        }

        mcp_stdio::write_message(response.dump(-1, ' ', false, json::error_handler_t::replace));
    }
}

int main(int argc, char **argv) {
    server_config::LoadResult loaded = server_config::load_from_process(argc, argv);
    if (loaded.help_requested) {
        std::cout << server_config::usage_text();
        return 0;
    }
    if (!loaded.success) {
        debug_log::log_always("Configuration error: " + loaded.error_detail);
        std::cerr << server_config::usage_text();
        return 1;
    }
    const server_config::ServerConfig config = loaded.config;

    debug_log::log_always("gmcps – Ghost MCP Server, build " + std::string(__DATE__) + " " + __TIME__);
    debug_log::log("Ghost site: " + config.base_url + " (Admin API " + config.api_version + ")");
    debug_log::log("Transport: " + config.transport);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    const request_dispatcher::ApiContext context{config, lws_http_client::perform};
    tool_handlers::register_all_tools(context);

    if (config.transport == "sse") {
        lws_sse_server::ServeResult served = lws_sse_server::serve(
            config.host, config.port, [] { return shutdown_requested != 0; });
        if (!served.success) {
            debug_log::log_always("SSE transport failed: " + served.error_detail);
            return 1;
        }
    } else {
        run_stdio_loop();
    }

    debug_log::log_always("Ghost MCP Server shut down.");
    return 0;
}
