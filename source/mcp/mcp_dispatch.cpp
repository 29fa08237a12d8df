#include "mcp/mcp_dispatch.hpp"

#include <string>

#include "protocol/json_rpc.hpp"
#include "proxy/error_kind.hpp"
#include "utils/debug_log.hpp"

// Routes incoming MCP messages to the appropriate handler.

namespace mcp_dispatch {

// Protocol version we support.
static const std::string PROTOCOL_VERSION = "2024-11-05";

// Server info.
static const std::string SERVER_NAME = "mcproxy";
static const std::string SERVER_VERSION = "0.1.0";
// Tells MCP clients that tools come from several aggregated servers and that
// clashing names are qualified with the server name.
static const std::string SERVER_DESCRIPTION =
    "MCP proxy: aggregates several tool servers into one catalog. Tool names "
    "that clash between servers are exposed as <server>.<tool>.";

static json handle_initialize(const json &request_id, const json &params) {
    if (params.contains("clientInfo") && params["clientInfo"].is_object() &&
        params["clientInfo"].contains("name") && params["clientInfo"]["name"].is_string()) {
        debug_log::log("initialize from " + params["clientInfo"]["name"].get<std::string>());
    }

    json capabilities;
    capabilities["tools"] = json::object();

    json server_info;
    server_info["name"] = SERVER_NAME;
    server_info["version"] = SERVER_VERSION;
    server_info["description"] = SERVER_DESCRIPTION;

    json result;
    result["protocolVersion"] = PROTOCOL_VERSION;
    result["capabilities"] = capabilities;
    result["serverInfo"] = server_info;

    return json_rpc::build_response(request_id, result);
}

static json handle_tools_list(proxy::Dispatcher &dispatcher, const json &request_id) {
    return json_rpc::build_response(request_id, dispatcher.list_tools());
}

static json handle_tools_call(proxy::Dispatcher &dispatcher, const json &request_id, const json &params) {
    std::string tool_name;
    if (params.contains("name") && params["name"].is_string()) {
        tool_name = params["name"].get<std::string>();
    } else {
        return json_rpc::build_error_response(request_id, json_rpc::INVALID_PARAMS,
                                               "Missing or invalid 'name' in tools/call");
    }

    json arguments = json::object();
    if (params.contains("arguments") && params["arguments"].is_object()) {
        arguments = params["arguments"];
    }

    proxy::CallResult call_result = dispatcher.call_tool(tool_name, arguments, request_id);
    return build_call_response(request_id, call_result);
}

json build_call_response(const json &request_id, const proxy::CallResult &call_result) {
    if (call_result.success) {
        return json_rpc::build_response(request_id, call_result.result);
    }

    // The child's own error object goes back untouched.
    if (call_result.error_kind == proxy::ErrorKind::ToolError && call_result.remote_error.is_object()) {
        json response;
        response["jsonrpc"] = "2.0";
        response["id"] = request_id;
        response["error"] = call_result.remote_error;
        return response;
    }

    json error_data;
    error_data["kind"] = proxy::to_string(call_result.error_kind);
    return json_rpc::build_error_response(request_id, proxy::to_json_rpc_code(call_result.error_kind),
                                           call_result.error_message, error_data);
}

bool is_tool_call(const json &message) {
    return !json_rpc::is_notification(message) && json_rpc::get_method(message) == "tools/call";
}

json dispatch_message(proxy::Dispatcher &dispatcher, const json &message) {
    std::string method = json_rpc::get_method(message);
    json request_id = json_rpc::get_id(message);
    json params = json_rpc::get_params(message);

    // Handle notifications (no response expected).
    if (json_rpc::is_notification(message)) {
        debug_log::log("Notification " + method);
        return nullptr;
    }

    if (method.empty()) {
        return json_rpc::build_error_response(request_id, json_rpc::INVALID_REQUEST,
                                               "Missing 'method'");
    }
    if (method == "initialize") {
        return handle_initialize(request_id, params);
    }
    if (method == "ping") {
        return json_rpc::build_response(request_id, json::object());
    }
    if (method == "tools/list") {
        return handle_tools_list(dispatcher, request_id);
    }
    if (method == "tools/call") {
        return handle_tools_call(dispatcher, request_id, params);
    }

    return json_rpc::build_error_response(request_id, json_rpc::METHOD_NOT_FOUND,
                                           "Unknown method: " + method);
}

} // namespace mcp_dispatch
