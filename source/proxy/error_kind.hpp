#ifndef MCPROXY_ERROR_KIND_HPP
#define MCPROXY_ERROR_KIND_HPP

// Failure taxonomy shared by every proxy component. Results carry one of
// these next to a human-readable message instead of throwing.

namespace proxy {

enum class ErrorKind {
    None,
    ConfigError,             // malformed or duplicate server spec
    BuildError,              // build command exited non-zero
    LaunchError,             // binary missing or exited immediately
    DiscoveryTimeout,
    DiscoveryProtocolError,  // malformed initialize/tools/list response
    UnknownTool,             // qualified name not in the current catalog
    CallTimeout,
    ProcessExited,           // child died (or is gone) mid-call
    TransportError,          // pipe read/write failure
    ToolError,               // child answered with a JSON-RPC error object
};

const char *to_string(ErrorKind kind);

// JSON-RPC error code reported to the caller for a failed tools/call.
int to_json_rpc_code(ErrorKind kind);

} // namespace proxy

#endif // MCPROXY_ERROR_KIND_HPP
