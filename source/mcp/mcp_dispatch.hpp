#ifndef MCPROXY_MCP_DISPATCH_HPP
#define MCPROXY_MCP_DISPATCH_HPP

// MCP JSON-RPC method dispatch for the caller-facing side of the proxy.

#include <nlohmann/json.hpp>

#include "proxy/child_session.hpp"
#include "proxy/dispatcher.hpp"

namespace mcp_dispatch {

using json = nlohmann::json;

// Dispatch a single JSON-RPC message. Returns the response JSON, or a null
// json value for notifications (which require no response).
json dispatch_message(proxy::Dispatcher &dispatcher, const json &message);

// True for a tools/call request. The server loop runs these on a worker so a
// slow tool never holds up other requests.
bool is_tool_call(const json &message);

// Render the outcome of a tools/call as a JSON-RPC response.
json build_call_response(const json &request_id, const proxy::CallResult &call_result);

} // namespace mcp_dispatch

#endif // MCPROXY_MCP_DISPATCH_HPP
