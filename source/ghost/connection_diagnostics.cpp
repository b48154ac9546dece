#include "ghost/connection_diagnostics.hpp"
#include "ghost/token_signer.hpp"
#include "utils/debug_log.hpp"
#include "utils/text_encoding.hpp"

#include <nlohmann/json.hpp>

namespace connection_diagnostics {

using json = nlohmann::json;
using ordered_json = nlohmann::ordered_json;

static std::string dump_report(const ordered_json &report) {
    return report.dump(2, ' ', false, json::error_handler_t::replace);
}

static std::string failure_report(const request_dispatcher::ApiContext &context, const std::string &error_detail) {
    bool key_well_formed = token_signer::parse_credential(context.config.admin_api_key).success;

    ordered_json report;
    report["error"] = text_encoding::sanitize_utf8(error_detail);
    report["api_url"] = request_dispatcher::admin_url(context.config, "site/");
    report["api_key_format"] = key_well_formed ? "ID:SECRET" : "Invalid";
    return dump_report(report);
}

std::string debug_api_connection(const request_dispatcher::ApiContext &context) {
    const server_config::ServerConfig &config = context.config;

    http_transport::HttpRequest site_request;
    site_request.url = config.base_url + "/ghost/";
    debug_log::log("debug_api_connection: GET " + site_request.url);
    http_transport::HttpResponse site_response = context.transport(site_request);
    if (!site_response.success) {
        return failure_report(context, site_response.error_detail);
    }

    token_signer::TokenResult token = token_signer::issue_token(config.admin_api_key, config.api_version);
    if (!token.success) {
        ordered_json report;
        report["error"] = token.error.message;
        return dump_report(report);
    }

    http_transport::HttpRequest api_request;
    api_request.url = request_dispatcher::admin_url(config, "site/");
    api_request.headers = request_dispatcher::build_request_headers(token.token, config.api_version);
    debug_log::log("debug_api_connection: GET " + api_request.url);
    http_transport::HttpResponse api_response = context.transport(api_request);
    if (!api_response.success) {
        return failure_report(context, api_response.error_detail);
    }

    ordered_json headers_sent = ordered_json::object();
    for (const auto &header : api_request.headers) {
        headers_sent[header.first] = header.second;
    }

    ordered_json report;
    report["site_status"] = site_response.status_code;
    report["site_url"] = site_response.effective_url;
    report["api_status"] = api_response.status_code;
    report["api_url"] = api_response.effective_url;
    report["api_response"] = text_encoding::truncate_utf8(
        text_encoding::sanitize_utf8(api_response.body), kResponseSnippetLength);
    report["headers_sent"] = headers_sent;
    return dump_report(report);
}

} // namespace connection_diagnostics
