#ifndef MCPROXY_BUILDER_HPP
#define MCPROXY_BUILDER_HPP

// Runs a server's build command. The command is opaque: whatever build system
// it invokes, it is handed to the shell as-is.

#include <string>

#include "proxy/error_kind.hpp"
#include "proxy/server_spec.hpp"

namespace proxy {

struct BuildResult {
    bool success = false;
    bool executed = false;   // false when ServerSpec has no build command
    int exit_code = -1;
    std::string output;      // combined stdout and stderr of the build
    ErrorKind error_kind = ErrorKind::None;
    std::string error_message;
};

// Build spec once. Never retries.
BuildResult build(const ServerSpec &spec);

} // namespace proxy

#endif // MCPROXY_BUILDER_HPP
