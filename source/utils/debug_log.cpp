#include "utils/debug_log.hpp"
#include "utils/text_encoding.hpp"

#include <cstdlib>
#include <iostream>
#include <string>

namespace debug_log {

bool is_debug_enabled() {
    const char *value = std::getenv("GMCPS_DEBUG");
    if (value == nullptr || value[0] == '\0') {
        return false;
    }
    std::string normalized = text_encoding::to_lower(std::string(value));
    return (normalized == "1" || normalized == "true" || normalized == "yes");
}

void log(const std::string &message) {
    if (!is_debug_enabled()) {
        return;
    }
    std::cerr << "[gmcps] " << message << std::endl;
}

void log_always(const std::string &message) {
    std::cerr << "[gmcps] " << message << std::endl;
}

} // namespace debug_log
