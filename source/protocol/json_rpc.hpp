#ifndef MCPROXY_JSON_RPC_HPP
#define MCPROXY_JSON_RPC_HPP

// JSON-RPC 2.0 helpers shared by both sides of the proxy: the caller-facing
// server loop and the child-facing sessions.
// Uses nlohmann/json for parsing and serialization.

#include <nlohmann/json.hpp>
#include <string>

namespace json_rpc {

using json = nlohmann::json;

// Build a JSON-RPC 2.0 request. params is omitted when null.
json build_request(int request_id, const std::string &method, const json &params = nullptr);

// Build a JSON-RPC 2.0 notification (no id).
json build_notification(const std::string &method, const json &params = nullptr);

// Build a JSON-RPC 2.0 success response.
json build_response(const json &request_id, const json &result_payload);

// Build a JSON-RPC 2.0 error response.
json build_error_response(const json &request_id, int error_code, const std::string &error_message);

// Build a JSON-RPC 2.0 error response with additional data.
json build_error_response(const json &request_id, int error_code, const std::string &error_message, const json &error_data);

// Standard JSON-RPC error codes.
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;

// Server-defined codes (-32000..-32099) used for proxy failures.
constexpr int CALL_TIMEOUT = -32001;
constexpr int PROCESS_EXITED = -32002;
constexpr int TRANSPORT_ERROR = -32003;
constexpr int SERVER_ERROR = -32000;

// Extract method name from a JSON-RPC request/notification. Returns empty if missing.
std::string get_method(const json &message);

// Extract the id from a JSON-RPC message. Returns nullptr json if missing (notification).
json get_id(const json &message);

// Extract an integer id. Returns false when the id is missing or not an integer.
bool get_integer_id(const json &message, int &output_id);

// Extract params from a JSON-RPC message. Returns empty object if missing.
json get_params(const json &message);

// Check if a message is a notification (no id field).
bool is_notification(const json &message);

// Check if a message is a response: carries an id and either result or error,
// and no method.
bool is_response(const json &message);

} // namespace json_rpc

#endif // MCPROXY_JSON_RPC_HPP
