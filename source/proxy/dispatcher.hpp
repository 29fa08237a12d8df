#ifndef MCPROXY_DISPATCHER_HPP
#define MCPROXY_DISPATCHER_HPP

// Caller-facing tool operations: list the merged catalog and route a call by
// qualified name to the session that owns the tool.

#include <nlohmann/json.hpp>
#include <string>

#include "proxy/child_session.hpp"
#include "proxy/proxy_core.hpp"

namespace proxy {

class Dispatcher {
public:
    explicit Dispatcher(ProxyCore &core) : core_(core) {}

    // {"tools": [{name, description, inputSchema}, ...]} from one snapshot.
    // Origin servers are not exposed.
    json list_tools() const;

    // UnknownTool when qualified_name is not in the current catalog.
    // Otherwise the call is forwarded with the owning server's call timeout.
    CallResult call_tool(const std::string &qualified_name, const json &arguments,
                         const json &origin_id = nullptr) const;

private:
    ProxyCore &core_;
};

} // namespace proxy

#endif // MCPROXY_DISPATCHER_HPP
