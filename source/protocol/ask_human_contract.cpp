#include "protocol/ask_human_contract.hpp"

namespace ask_human_contract {

static std::string trim(const std::string &value) {
    const char *whitespace = " \t\r\n";
    size_t first = value.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return "";
    }
    size_t last = value.find_last_not_of(whitespace);
    return value.substr(first, last - first + 1);
}

// Null or missing leaves output empty.
static bool read_string_list(const json &payload, const char *key, std::vector<std::string> &output) {
    output.clear();
    if (!payload.contains(key) || payload[key].is_null()) {
        return true;
    }
    if (!payload[key].is_array()) {
        return false;
    }
    for (const auto &item : payload[key]) {
        if (!item.is_string()) {
            return false;
        }
        output.push_back(item.get<std::string>());
    }
    return true;
}

json to_json(const AskHumanRequest &request) {
    json payload;
    payload["question"] = request.question;
    payload["placeholder"] = request.placeholder;
    payload["quick_answers"] = request.quick_answers;
    payload["hints"] = request.hints;
    payload["timeout_seconds"] = request.timeout_seconds;
    return payload;
}

json to_json(const AskHumanResponse &response) {
    json payload;
    payload["answer"] = response.answer;
    payload["source"] = response.source;
    payload["duration_ms"] = response.duration_ms;
    return payload;
}

ParseResult parse_request(const json &payload, AskHumanRequest &output_request) {
    ParseResult result;
    if (!payload.is_object()) {
        result.error_message = "Request must be a JSON object";
        return result;
    }

    AskHumanRequest request;
    if (!payload.contains("question") || !payload["question"].is_string() ||
        trim(payload["question"].get<std::string>()).empty()) {
        result.error_message = "Missing or empty 'question'";
        return result;
    }
    request.question = payload["question"].get<std::string>();

    if (payload.contains("placeholder") && !payload["placeholder"].is_null()) {
        if (!payload["placeholder"].is_string()) {
            result.error_message = "'placeholder' must be a string";
            return result;
        }
        request.placeholder = payload["placeholder"].get<std::string>();
    }

    if (!read_string_list(payload, "quick_answers", request.quick_answers)) {
        result.error_message = "'quick_answers' must be an array of strings";
        return result;
    }
    if (!read_string_list(payload, "hints", request.hints)) {
        result.error_message = "'hints' must be an array of strings";
        return result;
    }

    if (payload.contains("timeout_seconds") && !payload["timeout_seconds"].is_null()) {
        // Read wide so values beyond int range are rejected, not truncated.
        const json &timeout = payload["timeout_seconds"];
        long long seconds = 0;
        if (timeout.is_number_unsigned()) {
            unsigned long long value = timeout.get<unsigned long long>();
            seconds = value > static_cast<unsigned long long>(MAX_TIMEOUT_SECONDS) ? MAX_TIMEOUT_SECONDS + 1LL
                                                                                  : static_cast<long long>(value);
        } else if (timeout.is_number_integer()) {
            seconds = timeout.get<long long>();
        }
        if (seconds <= 0 || seconds > MAX_TIMEOUT_SECONDS) {
            result.error_message = "'timeout_seconds' must be a positive integer of at most " +
                                   std::to_string(MAX_TIMEOUT_SECONDS);
            return result;
        }
        request.timeout_seconds = static_cast<int>(seconds);
    }

    output_request = request;
    result.success = true;
    return result;
}

ParseResult parse_response(const json &payload, AskHumanResponse &output_response) {
    ParseResult result;
    if (!payload.is_object()) {
        result.error_message = "Response must be a JSON object";
        return result;
    }

    AskHumanResponse response;
    if (!payload.contains("answer") || !payload["answer"].is_string()) {
        result.error_message = "Missing 'answer'";
        return result;
    }
    response.answer = trim(payload["answer"].get<std::string>());

    if (payload.contains("source")) {
        if (!payload["source"].is_string() || payload["source"].get<std::string>() != "text") {
            result.error_message = "'source' must be \"text\"";
            return result;
        }
    }

    if (payload.contains("duration_ms")) {
        if (!payload["duration_ms"].is_number_integer()) {
            result.error_message = "'duration_ms' must be an integer";
            return result;
        }
        response.duration_ms = payload["duration_ms"].get<long long>();
    }

    output_response = response;
    result.success = true;
    return result;
}

} // namespace ask_human_contract
