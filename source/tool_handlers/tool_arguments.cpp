#include "tool_handlers/tool_arguments.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace tool_arguments {

const std::vector<std::string> POST_STATUSES = {"draft", "published", "scheduled"};

static bool is_absent(const json &arguments, const std::string &name) {
    return !arguments.contains(name) || arguments[name].is_null();
}

bool read_required_string(const json &arguments, const std::string &name,
                          std::string &out_value, std::string &error_message) {
    if (!arguments.contains(name) || !arguments[name].is_string()) {
        error_message = "Missing required parameter '" + name + "' (string).";
        return false;
    }
    out_value = arguments[name].get<std::string>();
    return true;
}

bool read_optional_string(const json &arguments, const std::string &name,
                          std::optional<std::string> &out_value, std::string &error_message) {
    if (is_absent(arguments, name)) {
        out_value.reset();
        return true;
    }
    if (!arguments[name].is_string()) {
        error_message = "Parameter '" + name + "' must be a string.";
        return false;
    }
    out_value = arguments[name].get<std::string>();
    return true;
}

bool read_optional_string_list(const json &arguments, const std::string &name,
                               std::optional<std::vector<std::string>> &out_value,
                               std::string &error_message) {
    if (is_absent(arguments, name)) {
        out_value.reset();
        return true;
    }
    const json &value = arguments[name];
    if (!value.is_array()) {
        error_message = "Parameter '" + name + "' must be an array of strings.";
        return false;
    }
    std::vector<std::string> items;
    for (const auto &item : value) {
        if (!item.is_string()) {
            error_message = "Parameter '" + name + "' must be an array of strings.";
            return false;
        }
        items.push_back(item.get<std::string>());
    }
    out_value = std::move(items);
    return true;
}

bool read_optional_integer(const json &arguments, const std::string &name,
                           std::optional<int> &out_value, std::string &error_message) {
    if (is_absent(arguments, name)) {
        out_value.reset();
        return true;
    }
    const json &value = arguments[name];
    if (value.is_number_float()) {
        // Clients that only have doubles send 5.0 for 5.
        double number = value.get<double>();
        if (!std::isfinite(number) || std::floor(number) != number) {
            error_message = "Parameter '" + name + "' must be an integer.";
            return false;
        }
        if (number < std::numeric_limits<int>::min() || number > std::numeric_limits<int>::max()) {
            error_message = "Parameter '" + name + "' is out of range.";
            return false;
        }
        out_value = static_cast<int>(number);
        return true;
    }
    if (!value.is_number_integer()) {
        error_message = "Parameter '" + name + "' must be an integer.";
        return false;
    }
    if (value.is_number_unsigned() &&
        value.get<unsigned long long>() > static_cast<unsigned long long>(std::numeric_limits<int>::max())) {
        error_message = "Parameter '" + name + "' is out of range.";
        return false;
    }
    long long number = value.get<long long>();
    if (number < std::numeric_limits<int>::min() || number > std::numeric_limits<int>::max()) {
        error_message = "Parameter '" + name + "' is out of range.";
        return false;
    }
    out_value = static_cast<int>(number);
    return true;
}

bool check_one_of(const std::string &value, const std::vector<std::string> &allowed,
                  const std::string &name, std::string &error_message) {
    if (std::find(allowed.begin(), allowed.end(), value) != allowed.end()) {
        return true;
    }
    error_message = "Parameter '" + name + "' must be one of:";
    for (const auto &option : allowed) {
        error_message += " " + option;
    }
    error_message += " (got '" + value + "').";
    return false;
}

} // namespace tool_arguments
