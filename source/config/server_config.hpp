#ifndef GMCPS_SERVER_CONFIG_HPP
#define GMCPS_SERVER_CONFIG_HPP

// Process-wide configuration, built once at startup and passed by
// reference into everything that talks to the Ghost Admin API.
//
// Sources, lowest precedence first: .env file, process environment,
// command line.

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace server_config {

// Ghost Admin API version used in URLs, the JWT audience and Accept-Version.
inline constexpr const char *kApiVersion = "v4";

struct ServerConfig {
    std::string base_url;       // site root, no trailing slash, no API path
    std::string admin_api_key;  // "ID:SECRET" as issued by Ghost
    std::string host = "0.0.0.0"; // SSE listen address
    int port = 8053;
    std::string transport = "sse"; // "sse" or "stdio"
    std::string api_version = kApiVersion;
};

struct LoadResult {
    bool success = false;
    bool help_requested = false;
    ServerConfig config;
    std::string error_detail;
};

// Environment lookup: returns nullopt for unset variables.
using EnvironmentLookup = std::function<std::optional<std::string>(const std::string &name)>;

// Parse .env style contents (KEY=VALUE per line, '#' comments, optional
// "export " prefix, optional matching quotes). Malformed lines are skipped.
std::map<std::string, std::string> parse_env_file(const std::string &contents);

// Build the configuration from command line arguments (argv without the
// program name), .env values and the environment.
LoadResult load(const std::vector<std::string> &arguments,
                const std::map<std::string, std::string> &env_file_values,
                const EnvironmentLookup &lookup_environment);

// Convenience for main(): reads the .env file named by --env-file (default
// ".env" in the working directory, silently skipped if absent) and the
// real process environment.
LoadResult load_from_process(int argc, char **argv);

std::string usage_text();

} // namespace server_config

#endif // GMCPS_SERVER_CONFIG_HPP
