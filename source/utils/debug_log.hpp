#ifndef MCPROXY_DEBUG_LOG_HPP
#define MCPROXY_DEBUG_LOG_HPP

// Leveled logging to stderr. stdout is reserved for the MCP protocol stream,
// so every diagnostic line goes through here with a [mcproxy] prefix.

#include <string>

namespace debug_log {

enum class Level {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3,
};

// Returns true if MCPROXY_DEBUG env is set to a truthy value (1, true, yes)
// or the level was lowered to Debug with set_level().
bool is_debug_enabled();

// Minimum level that is written. Defaults to Info.
void set_level(Level level);

// Parses "DEBUG", "INFO", "WARNING" or "ERROR" (any case). Returns false on
// an unknown name and leaves output_level untouched.
bool parse_level(const std::string &name, Level &output_level);

// Writes message only when is_debug_enabled().
void log(const std::string &message);

void info(const std::string &message);
void warning(const std::string &message);
void error(const std::string &message);

} // namespace debug_log

#endif // MCPROXY_DEBUG_LOG_HPP
