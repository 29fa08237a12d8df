#include "proxy/error_kind.hpp"

#include "protocol/json_rpc.hpp"

namespace proxy {

const char *to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None:
        return "None";
    case ErrorKind::ConfigError:
        return "ConfigError";
    case ErrorKind::BuildError:
        return "BuildError";
    case ErrorKind::LaunchError:
        return "LaunchError";
    case ErrorKind::DiscoveryTimeout:
        return "DiscoveryTimeout";
    case ErrorKind::DiscoveryProtocolError:
        return "DiscoveryProtocolError";
    case ErrorKind::UnknownTool:
        return "UnknownTool";
    case ErrorKind::CallTimeout:
        return "CallTimeout";
    case ErrorKind::ProcessExited:
        return "ProcessExited";
    case ErrorKind::TransportError:
        return "TransportError";
    case ErrorKind::ToolError:
        return "ToolError";
    }
    return "Unknown";
}

int to_json_rpc_code(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::UnknownTool:
        return json_rpc::INVALID_PARAMS;
    case ErrorKind::CallTimeout:
        return json_rpc::CALL_TIMEOUT;
    case ErrorKind::ProcessExited:
        return json_rpc::PROCESS_EXITED;
    case ErrorKind::TransportError:
        return json_rpc::TRANSPORT_ERROR;
    default:
        return json_rpc::SERVER_ERROR;
    }
}

} // namespace proxy
