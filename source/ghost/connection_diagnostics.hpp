#ifndef GMCPS_CONNECTION_DIAGNOSTICS_HPP
#define GMCPS_CONNECTION_DIAGNOSTICS_HPP

// Connection check behind the debug_api_connection tool.

#include <cstddef>
#include <string>

#include "ghost/request_dispatcher.hpp"

namespace connection_diagnostics {

// Longest api_response snippet in the report, in characters.
constexpr size_t kResponseSnippetLength = 500;

// GETs {base}/ghost/ without credentials and {base}/ghost/api/<v>/admin/site/
// with a signed token. Returns a JSON report with both status codes and
// URLs, the first 500 characters of the admin response and the headers
// sent. Failures come back as a JSON object with an "error" field.
std::string debug_api_connection(const request_dispatcher::ApiContext &context);

} // namespace connection_diagnostics

#endif // GMCPS_CONNECTION_DIAGNOSTICS_HPP
