#ifndef GMCPS_TOOL_ARGUMENTS_HPP
#define GMCPS_TOOL_ARGUMENTS_HPP

// Typed extraction of tools/call arguments. Every reader returns false and
// sets error_message when the argument has the wrong type; a missing or
// null optional argument is not an error.

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace tool_arguments {

using json = nlohmann::json;

// Post statuses Ghost accepts on write.
extern const std::vector<std::string> POST_STATUSES;

bool read_required_string(const json &arguments, const std::string &name,
                          std::string &out_value, std::string &error_message);

bool read_optional_string(const json &arguments, const std::string &name,
                          std::optional<std::string> &out_value, std::string &error_message);

bool read_optional_string_list(const json &arguments, const std::string &name,
                               std::optional<std::vector<std::string>> &out_value,
                               std::string &error_message);

// Accepts JSON integers and floats with no fractional part (5.0).
bool read_optional_integer(const json &arguments, const std::string &name,
                           std::optional<int> &out_value, std::string &error_message);

// value must be one of allowed.
bool check_one_of(const std::string &value, const std::vector<std::string> &allowed,
                  const std::string &name, std::string &error_message);

} // namespace tool_arguments

#endif // GMCPS_TOOL_ARGUMENTS_HPP
