#include "proxy/dispatcher.hpp"

#include "mcp/mcp_tools.hpp"
#include "utils/debug_log.hpp"

#include <memory>

namespace proxy {

json Dispatcher::list_tools() const {
    mcp_tools::CatalogSnapshot snapshot = core_.catalog();
    return mcp_tools::build_tools_list_response(*snapshot);
}

CallResult Dispatcher::call_tool(const std::string &qualified_name, const json &arguments,
                                 const json &origin_id) const {
    CallResult result;

    // The descriptor is copied out so a catalog swap during the call is harmless.
    mcp_tools::ToolDescriptor descriptor;
    {
        mcp_tools::CatalogSnapshot snapshot = core_.catalog();
        const mcp_tools::ToolDescriptor *found = snapshot->find(qualified_name);
        if (found == nullptr) {
            result.error_kind = ErrorKind::UnknownTool;
            result.error_message = "Unknown tool: " + qualified_name;
            debug_log::log(result.error_message);
            return result;
        }
        descriptor = *found;
    }

    std::shared_ptr<ChildSession> session = core_.session_for(descriptor.origin_server);
    if (!session) {
        result.error_kind = ErrorKind::ProcessExited;
        result.error_message = "Server " + descriptor.origin_server + " is not running";
        debug_log::warning(result.error_message);
        return result;
    }

    debug_log::log("Routing " + qualified_name + " to " + descriptor.origin_server + " as " +
                   descriptor.local_name);
    const json call_arguments = arguments.is_null() ? json::object() : arguments;
    return session->call(descriptor.local_name, call_arguments, session->spec().call_timeout, origin_id);
}

} // namespace proxy
