// Tests for configuration loading: .env parsing, precedence and validation.

#include "config/server_config.hpp"
#include "test_helpers.hpp"

#include <map>
#include <string>
#include <vector>

using test_helpers::expect;
using test_helpers::expect_equal;

namespace test_server_config {

static server_config::EnvironmentLookup environment_from(const std::map<std::string, std::string> &values) {
    return [values](const std::string &name) -> std::optional<std::string> {
        auto iterator = values.find(name);
        if (iterator == values.end()) {
            return std::nullopt;
        }
        return iterator->second;
    };
}

static bool test_env_file_parsing() {
    std::string contents =
        "# Ghost settings\n"
        "GHOST_BASE_URL=https://blog.example.com/\n"
        "export GHOST_ADMIN_API_KEY=\"abc:0011\"\n"
        "  PORT = '9000'  \n"
        "not a setting\n"
        "=novalue\n";
    std::map<std::string, std::string> values = server_config::parse_env_file(contents);

    bool success = expect(values.size() == 3, "Three settings parsed, junk lines skipped");
    success &= expect_equal(values["GHOST_BASE_URL"], "https://blog.example.com/", "Plain value");
    success &= expect_equal(values["GHOST_ADMIN_API_KEY"], "abc:0011", "export prefix and double quotes stripped");
    success &= expect_equal(values["PORT"], "9000", "Whitespace and single quotes stripped");
    return success;
}

static bool test_defaults_and_normalisation() {
    std::map<std::string, std::string> env_file = {
        {"GHOST_BASE_URL", "https://blog.example.com//"},
        {"GHOST_ADMIN_API_KEY", test_helpers::TEST_ADMIN_API_KEY},
    };
    server_config::LoadResult loaded = server_config::load({}, env_file, environment_from({}));

    bool success = expect(loaded.success, "Config loads from .env values alone");
    success &= expect_equal(loaded.config.base_url, "https://blog.example.com", "Trailing slashes are stripped");
    success &= expect_equal(loaded.config.host, "0.0.0.0", "Default host");
    success &= expect(loaded.config.port == 8053, "Default port is 8053");
    success &= expect_equal(loaded.config.transport, "sse", "Default transport is sse");
    success &= expect_equal(loaded.config.api_version, "v4", "API version is v4");
    return success;
}

static bool test_environment_overrides_env_file() {
    std::map<std::string, std::string> env_file = {
        {"GHOST_BASE_URL", "https://from-file.example.com"},
        {"GHOST_ADMIN_API_KEY", "file:00"},
        {"PORT", "1111"},
    };
    server_config::LoadResult loaded = server_config::load(
        {"--transport", "STDIO"}, env_file,
        environment_from({{"GHOST_BASE_URL", "http://from-env.example.com"}, {"HOST", "127.0.0.1"}}));

    bool success = expect(loaded.success, "Config loads from mixed sources");
    success &= expect_equal(loaded.config.base_url, "http://from-env.example.com", "Environment wins over .env");
    success &= expect_equal(loaded.config.admin_api_key, "file:00", ".env fills what the environment lacks");
    success &= expect_equal(loaded.config.host, "127.0.0.1", "HOST from environment");
    success &= expect(loaded.config.port == 1111, "PORT from .env");
    success &= expect_equal(loaded.config.transport, "stdio", "--transport value is case-insensitive");
    return success;
}

static bool test_validation_errors() {
    auto load_with = [](const std::vector<std::string> &arguments, const std::map<std::string, std::string> &env) {
        return server_config::load(arguments, {}, environment_from(env));
    };
    const std::map<std::string, std::string> valid = {
        {"GHOST_BASE_URL", "https://blog.example.com"},
        {"GHOST_ADMIN_API_KEY", "id:00"},
    };

    bool success = expect(!load_with({}, {{"GHOST_ADMIN_API_KEY", "id:00"}}).success, "Missing base URL is rejected");
    success &= expect(!load_with({}, {{"GHOST_BASE_URL", "https://b.example.com"}}).success, "Missing API key is rejected");
    success &= expect(!load_with({}, {{"GHOST_BASE_URL", "blog.example.com"}, {"GHOST_ADMIN_API_KEY", "id:00"}}).success,
                      "Base URL without scheme is rejected");

    std::map<std::string, std::string> bad_port = valid;
    bad_port["PORT"] = "80a";
    success &= expect(!load_with({}, bad_port).success, "Non-numeric port is rejected");
    bad_port["PORT"] = "70000";
    success &= expect(!load_with({}, bad_port).success, "Out-of-range port is rejected");

    server_config::LoadResult sse = load_with({"--transport=sse"}, valid);
    success &= expect(sse.success && sse.config.transport == "sse", "sse transport is accepted");
    server_config::LoadResult stdio = load_with({"--transport", "stdio"}, valid);
    success &= expect(stdio.success && stdio.config.transport == "stdio", "stdio transport is accepted");
    server_config::LoadResult websocket = load_with({"--transport=websocket"}, valid);
    success &= expect(!websocket.success && test_helpers::contains(websocket.error_detail, "websocket"),
                      "Unknown transport is rejected with a message");
    success &= expect(!load_with({"--transport"}, valid).success, "--transport without a value is rejected");

    std::map<std::string, std::string> malformed_key = valid;
    malformed_key["GHOST_ADMIN_API_KEY"] = "no-separator";
    success &= expect(load_with({}, malformed_key).success, "Malformed API key is left for per-call reporting");

    server_config::LoadResult help = load_with({"--help"}, {});
    success &= expect(help.success && help.help_requested, "--help short-circuits validation");
    return success;
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_env_file_parsing();
    all_passed &= test_defaults_and_normalisation();
    all_passed &= test_environment_overrides_env_file();
    all_passed &= test_validation_errors();
    return all_passed;
}

} // namespace test_server_config
