#ifndef GMCPS_PLATFORM_ABI_HPP
#define GMCPS_PLATFORM_ABI_HPP

// Platform abstraction interface.
// Each OS-specific implementation lives under platform/<os>/ and provides
// definitions for the functions declared here.

#include <cstdint>
#include <optional>
#include <string>

namespace platform {

// Read the entire contents of a text file into a string.
// Returns true on success, false on failure (file not found, permission, etc.).
bool read_file_contents(const std::string &file_path, std::string &output_contents);

// Look up a process environment variable. Returns nullopt when unset.
std::optional<std::string> get_environment_variable(const std::string &name);

// Current wall-clock time as Unix seconds.
std::int64_t unix_time_seconds();

} // namespace platform

#endif // GMCPS_PLATFORM_ABI_HPP
