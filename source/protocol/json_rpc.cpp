#include "protocol/json_rpc.hpp"

#include <limits>

namespace json_rpc {

json build_request(int request_id, const std::string &method, const json &params) {
    json request;
    request["jsonrpc"] = "2.0";
    request["id"] = request_id;
    request["method"] = method;
    if (!params.is_null()) {
        request["params"] = params;
    }
    return request;
}

json build_notification(const std::string &method, const json &params) {
    json notification;
    notification["jsonrpc"] = "2.0";
    notification["method"] = method;
    if (!params.is_null()) {
        notification["params"] = params;
    }
    return notification;
}

json build_response(const json &request_id, const json &result_payload) {
    json response;
    response["jsonrpc"] = "2.0";
    response["id"] = request_id;
    response["result"] = result_payload;
    return response;
}

json build_error_response(const json &request_id, int error_code, const std::string &error_message) {
    json response;
    response["jsonrpc"] = "2.0";
    response["id"] = request_id;
    response["error"]["code"] = error_code;
    response["error"]["message"] = error_message;
    return response;
}

json build_error_response(const json &request_id, int error_code, const std::string &error_message, const json &error_data) {
    json response = build_error_response(request_id, error_code, error_message);
    response["error"]["data"] = error_data;
    return response;
}

std::string get_method(const json &message) {
    if (message.contains("method") && message["method"].is_string()) {
        return message["method"].get<std::string>();
    }
    return "";
}

json get_id(const json &message) {
    if (message.contains("id")) {
        return message["id"];
    }
    return nullptr;
}

bool get_integer_id(const json &message, int &output_id) {
    if (!message.contains("id") || !message["id"].is_number_integer()) {
        return false;
    }
    long long raw_id = message["id"].get<long long>();
    if (raw_id < std::numeric_limits<int>::min() || raw_id > std::numeric_limits<int>::max()) {
        return false;
    }
    output_id = static_cast<int>(raw_id);
    return true;
}

json get_params(const json &message) {
    if (message.contains("params") && message["params"].is_object()) {
        return message["params"];
    }
    return json::object();
}

bool is_notification(const json &message) {
    return !message.contains("id");
}

bool is_response(const json &message) {
    if (!message.is_object() || !message.contains("id") || message.contains("method")) {
        return false;
    }
    return message.contains("result") || message.contains("error");
}

} // namespace json_rpc
