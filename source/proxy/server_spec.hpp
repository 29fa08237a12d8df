#ifndef MCPROXY_SERVER_SPEC_HPP
#define MCPROXY_SERVER_SPEC_HPP

// Declared child servers and their lifecycle states.

#include <chrono>
#include <set>
#include <string>
#include <vector>

namespace proxy {

// Defaults: 30 s to list tools, 300 s per call.
constexpr std::chrono::milliseconds DEFAULT_DISCOVERY_TIMEOUT{30000};
constexpr std::chrono::milliseconds DEFAULT_CALL_TIMEOUT{300000};

// Upper bound for either timeout: one day.
constexpr std::chrono::milliseconds MAXIMUM_TIMEOUT{86400000};

// Immutable description of one child server.
struct ServerSpec {
    std::string name;
    std::string binary_path;
    std::string build_command;            // empty = nothing to build
    std::string build_working_directory;  // empty = current directory
    std::vector<std::string> launch_args;
    std::chrono::milliseconds discovery_timeout = DEFAULT_DISCOVERY_TIMEOUT;
    std::chrono::milliseconds call_timeout = DEFAULT_CALL_TIMEOUT;
    std::set<std::string> enabled_tools;  // empty = every tool enabled

    bool has_build_command() const { return !build_command.empty(); }
};

enum class ServerState {
    NotBuilt,
    Building,
    Built,
    Launching,
    Ready,
    Degraded,
    Stopped,
};

const char *to_string(ServerState state);

// A spec rejected by validation (ConfigError). Only that entry is dropped.
struct SpecError {
    std::string server_name;
    std::string message;
};

struct ValidatedSpecs {
    std::vector<ServerSpec> accepted;
    std::vector<SpecError> rejected;
};

// Checks each spec: non-empty name and binary, name unique (the first
// occurrence wins), timeouts in (0, MAXIMUM_TIMEOUT], and an existing build
// directory when a build command is set.
ValidatedSpecs validate_specs(const std::vector<ServerSpec> &specs);

} // namespace proxy

#endif // MCPROXY_SERVER_SPEC_HPP
