#ifndef GMCPS_MCP_STDIO_HPP
#define GMCPS_MCP_STDIO_HPP

// MCP stdio transport: JSON messages in on stdin, out on stdout.

#include <iostream>
#include <string>

namespace mcp_stdio {

// Read a single complete JSON object from input. Returns the raw JSON
// string, or empty string on EOF.
std::string read_message(std::istream &input = std::cin);

// Write a JSON message followed by a newline, then flush.
void write_message(const std::string &json_string, std::ostream &output = std::cout);

} // namespace mcp_stdio

#endif // GMCPS_MCP_STDIO_HPP
