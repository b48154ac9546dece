#include "config/server_config.hpp"
#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"
#include "utils/text_encoding.hpp"

#include <sstream>
#include <stdexcept>

namespace server_config {

static const std::string DEFAULT_ENV_FILE = ".env";

// Find the value of --name=value or --name value. Returns false if absent.
static bool find_option(const std::vector<std::string> &arguments, const std::string &name,
                        std::string &out_value, std::string &error_detail) {
    const std::string flag = "--" + name;
    for (size_t index = 0; index < arguments.size(); index++) {
        const std::string &argument = arguments[index];
        if (argument.compare(0, flag.size() + 1, flag + "=") == 0) {
            out_value = argument.substr(flag.size() + 1);
            return true;
        }
        if (argument == flag) {
            if (index + 1 >= arguments.size()) {
                error_detail = "Option " + flag + " requires a value.";
                return false;
            }
            out_value = arguments[index + 1];
            return true;
        }
    }
    return false;
}

static std::string unquote(const std::string &value) {
    if (value.size() >= 2) {
        char first = value.front();
        char last = value.back();
        if ((first == '"' && last == '"') || (first == '\'' && last == '\'')) {
            return value.substr(1, value.size() - 2);
        }
    }
    return value;
}

std::map<std::string, std::string> parse_env_file(const std::string &contents) {
    std::map<std::string, std::string> values;
    std::istringstream stream(contents);
    std::string line;
    while (std::getline(stream, line)) {
        std::string trimmed = text_encoding::trim(line);
        if (trimmed.empty() || trimmed[0] == '#') {
            continue;
        }
        if (trimmed.compare(0, 7, "export ") == 0) {
            trimmed = text_encoding::trim(trimmed.substr(7));
        }
        auto equals_position = trimmed.find('=');
        if (equals_position == std::string::npos || equals_position == 0) {
            continue;
        }
        std::string key = text_encoding::trim(trimmed.substr(0, equals_position));
        std::string value = text_encoding::trim(trimmed.substr(equals_position + 1));
        values[key] = unquote(value);
    }
    return values;
}

LoadResult load(const std::vector<std::string> &arguments,
                const std::map<std::string, std::string> &env_file_values,
                const EnvironmentLookup &lookup_environment) {
    LoadResult result;

    for (const auto &argument : arguments) {
        if (argument == "--help" || argument == "-h") {
            result.help_requested = true;
            result.success = true;
            return result;
        }
    }

    // Environment wins over .env, as load_dotenv() does not override.
    auto lookup = [&](const std::string &name) -> std::optional<std::string> {
        std::optional<std::string> value = lookup_environment(name);
        if (value.has_value()) {
            return value;
        }
        auto iterator = env_file_values.find(name);
        if (iterator != env_file_values.end()) {
            return iterator->second;
        }
        return std::nullopt;
    };

    ServerConfig &config = result.config;

    std::optional<std::string> base_url = lookup("GHOST_BASE_URL");
    if (!base_url.has_value() || text_encoding::trim(*base_url).empty()) {
        result.error_detail = "GHOST_BASE_URL is not set.";
        return result;
    }
    config.base_url = text_encoding::trim(*base_url);
    while (!config.base_url.empty() && config.base_url.back() == '/') {
        config.base_url.pop_back();
    }
    if (config.base_url.compare(0, 7, "http://") != 0 && config.base_url.compare(0, 8, "https://") != 0) {
        result.error_detail = "GHOST_BASE_URL must start with http:// or https:// (got '" + config.base_url + "').";
        return result;
    }

    std::optional<std::string> admin_api_key = lookup("GHOST_ADMIN_API_KEY");
    if (!admin_api_key.has_value() || admin_api_key->empty()) {
        result.error_detail = "GHOST_ADMIN_API_KEY is not set.";
        return result;
    }
    // Format is checked per request, so a bad key is reported by the tools.
    config.admin_api_key = text_encoding::trim(*admin_api_key);

    std::optional<std::string> host = lookup("HOST");
    if (host.has_value() && !host->empty()) {
        config.host = *host;
    }

    std::optional<std::string> port = lookup("PORT");
    if (port.has_value() && !port->empty()) {
        int parsed_port = 0;
        try {
            size_t consumed = 0;
            parsed_port = std::stoi(*port, &consumed);
            if (consumed != port->size()) {
                parsed_port = 0;
            }
        } catch (const std::exception &) {
            parsed_port = 0;
        }
        if (parsed_port < 1 || parsed_port > 65535) {
            result.error_detail = "PORT must be an integer between 1 and 65535 (got '" + *port + "').";
            return result;
        }
        config.port = parsed_port;
    }

    std::string transport;
    if (find_option(arguments, "transport", transport, result.error_detail)) {
        config.transport = text_encoding::to_lower(transport);
    } else if (!result.error_detail.empty()) {
        return result;
    }
    if (config.transport != "sse" && config.transport != "stdio") {
        result.error_detail = "Unknown transport '" + config.transport + "' (expected sse or stdio).";
        return result;
    }

    result.success = true;
    return result;
}

LoadResult load_from_process(int argc, char **argv) {
    std::vector<std::string> arguments;
    for (int index = 1; index < argc; index++) {
        arguments.emplace_back(argv[index]);
    }

    std::string env_file_path = DEFAULT_ENV_FILE;
    bool env_file_explicit = false;
    std::string option_error;
    if (find_option(arguments, "env-file", env_file_path, option_error)) {
        env_file_explicit = true;
    } else if (!option_error.empty()) {
        LoadResult result;
        result.error_detail = option_error;
        return result;
    }

    std::map<std::string, std::string> env_file_values;
    std::string env_file_contents;
    if (platform::read_file_contents(env_file_path, env_file_contents)) {
        env_file_values = parse_env_file(env_file_contents);
        debug_log::log("Loaded " + std::to_string(env_file_values.size()) + " value(s) from " + env_file_path);
    } else if (env_file_explicit) {
        LoadResult result;
        result.error_detail = "Cannot read env file: " + env_file_path;
        return result;
    }

    return load(arguments, env_file_values, platform::get_environment_variable);
}

std::string usage_text() {
    return "Usage: gmcps [--transport=sse|stdio] [--env-file PATH]\n"
           "\n"
           "Ghost Admin API MCP server. Speaks MCP (JSON-RPC 2.0) over HTTP with\n"
           "server-sent events (default; GET /sse, POST /messages/) or on stdin/stdout.\n"
           "\n"
           "Environment (or .env file):\n"
           "  GHOST_BASE_URL        Site root, e.g. https://blog.example.com\n"
           "  GHOST_ADMIN_API_KEY   Admin API key in ID:SECRET form\n"
           "  HOST, PORT            SSE listen address (default 0.0.0.0:8053)\n"
           "  GMCPS_DEBUG           Set to 1 for verbose logging on stderr\n";
}

} // namespace server_config
