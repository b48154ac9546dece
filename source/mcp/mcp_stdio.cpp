#include "mcp/mcp_stdio.hpp"

// Framing uses brace-counting with string/escape awareness, so it works both
// with newline-delimited and streamed JSON.

namespace mcp_stdio {

std::string read_message(std::istream &input) {
    std::string buffer;
    int brace_depth = 0;
    bool inside_string = false;
    bool escape_next = false;

    char character;
    while (input.get(character)) {
        // Anything before the opening brace (whitespace, newlines) is dropped.
        if (brace_depth == 0) {
            if (character == '{') {
                brace_depth = 1;
                buffer += character;
            }
            continue;
        }

        buffer += character;

        if (inside_string) {
            if (escape_next) {
                escape_next = false;
            } else if (character == '\\') {
                escape_next = true;
            } else if (character == '"') {
                inside_string = false;
            }
            continue;
        }

        if (character == '"') {
            inside_string = true;
        } else if (character == '{') {
            brace_depth++;
        } else if (character == '}' && --brace_depth == 0) {
            return buffer;
        }
    }

    // EOF reached without a complete message.
    return "";
}

void write_message(const std::string &json_string, std::ostream &output) {
    output << json_string << "\n";
    output.flush();
}

} // namespace mcp_stdio
