#ifndef MCPROXY_MCP_STDIO_HPP
#define MCPROXY_MCP_STDIO_HPP

// MCP stdio transport on the caller side: reading JSON messages from stdin and
// writing responses to stdout.

#include <iosfwd>
#include <string>

namespace mcp_stdio {

// Read a single complete JSON object from input. Returns the raw JSON string,
// or an empty string on EOF.
std::string read_message(std::istream &input);

// read_message() on std::cin.
std::string read_message();

// Write one message followed by a newline and flush. Safe to call from
// several threads; whole lines never interleave.
void write_message(std::ostream &output, const std::string &json_string);

// write_message() on std::cout.
void write_message(const std::string &json_string);

} // namespace mcp_stdio

#endif // MCPROXY_MCP_STDIO_HPP
