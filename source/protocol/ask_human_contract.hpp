#ifndef MCPROXY_ASK_HUMAN_CONTRACT_HPP
#define MCPROXY_ASK_HUMAN_CONTRACT_HPP

// Request/response contract of the human-input collaborator. The dialog
// front ends live outside this repository; only the wire shape is modelled.

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace ask_human_contract {

using json = nlohmann::json;

constexpr int DEFAULT_TIMEOUT_SECONDS = 180;
constexpr int MAX_TIMEOUT_SECONDS = 86400;

struct AskHumanRequest {
    std::string question;
    std::string placeholder;
    std::vector<std::string> quick_answers;  // clickable, fill the answer field
    std::vector<std::string> hints;          // shown as text only
    int timeout_seconds = DEFAULT_TIMEOUT_SECONDS;
};

struct AskHumanResponse {
    std::string answer;
    std::string source = "text";
    long long duration_ms = 0;
};

struct ParseResult {
    bool success = false;
    std::string error_message;
};

json to_json(const AskHumanRequest &request);
json to_json(const AskHumanResponse &response);

// question is required and must be non-empty; timeout_seconds must be
// positive and at most MAX_TIMEOUT_SECONDS. Absent lists become empty, an
// absent timeout the default.
ParseResult parse_request(const json &payload, AskHumanRequest &output_request);

// answer is required and is trimmed; source must be "text".
ParseResult parse_response(const json &payload, AskHumanResponse &output_response);

} // namespace ask_human_contract

#endif // MCPROXY_ASK_HUMAN_CONTRACT_HPP
