#include "mcp/mcp_stdio.hpp"

#include <iostream>
#include <mutex>

// Uses brace-counting with string/escape awareness for framing,
// so it works both with newline-delimited and streamed JSON.

namespace mcp_stdio {

static std::mutex output_mutex;

// Tracks { } depth, respecting strings and escapes.
std::string read_message(std::istream &input) {
    std::string buffer;
    int brace_depth = 0;
    bool inside_string = false;
    bool escape_next = false;
    bool started = false;

    char character;
    while (input.get(character)) {
        if (!started) {
            if (character == '{') {
                started = true;
                brace_depth = 1;
                buffer += character;
            }
            // Ignore anything before the first '{' (whitespace, newlines, etc.)
            continue;
        }

        buffer += character;

        if (escape_next) {
            escape_next = false;
            continue;
        }

        if (character == '\\' && inside_string) {
            escape_next = true;
            continue;
        }

        if (character == '"') {
            inside_string = !inside_string;
            continue;
        }

        if (inside_string) {
            continue;
        }

        if (character == '{') {
            brace_depth++;
        } else if (character == '}') {
            brace_depth--;
            if (brace_depth == 0) {
                return buffer;
            }
        }
    }

    // EOF reached without a complete message.
    return "";
}

std::string read_message() {
    return read_message(std::cin);
}

void write_message(std::ostream &output, const std::string &json_string) {
    std::lock_guard<std::mutex> lock(output_mutex);
    output << json_string << "\n";
    output.flush();
}

void write_message(const std::string &json_string) {
    write_message(std::cout, json_string);
}

} // namespace mcp_stdio
