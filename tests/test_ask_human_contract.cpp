// Tests for the human-input collaborator contract.

#include "protocol/ask_human_contract.hpp"
#include "test_support.hpp"

#include <nlohmann/json.hpp>
#include <string>

using json = nlohmann::json;
using test_support::report;

namespace test_ask_human_contract {

static bool test_request_defaults() {
    ask_human_contract::AskHumanRequest request;
    ask_human_contract::ParseResult result =
        ask_human_contract::parse_request(json::parse(R"({"question": "Deploy now?"})"), request);
    bool success = result.success && request.question == "Deploy now?" && request.placeholder.empty() &&
                   request.quick_answers.empty() && request.hints.empty() && request.timeout_seconds == 180;
    return report(success, "request defaults: empty lists, 180 s timeout");
}

static bool test_request_wire_keys() {
    ask_human_contract::AskHumanRequest request;
    request.question = "Which branch?";
    request.placeholder = "branch name";
    request.quick_answers = {"main", "dev"};
    request.hints = {"use main for releases"};
    request.timeout_seconds = 60;

    json payload = ask_human_contract::to_json(request);
    bool success = payload["question"] == "Which branch?" && payload["placeholder"] == "branch name" &&
                   payload["quick_answers"].size() == 2 && payload["hints"][0] == "use main for releases" &&
                   payload["timeout_seconds"] == 60;
    return report(success, "request serializes with snake_case wire keys", payload.dump());
}

static bool test_request_validation() {
    ask_human_contract::AskHumanRequest request;
    bool empty_question = ask_human_contract::parse_request(json::parse(R"({"question": "  "})"), request).success;
    bool bad_timeout = ask_human_contract::parse_request(
        json::parse(R"({"question": "q", "timeout_seconds": 0})"), request).success;
    bool bad_hints = ask_human_contract::parse_request(
        json::parse(R"({"question": "q", "hints": [1]})"), request).success;
    bool null_lists = ask_human_contract::parse_request(
        json::parse(R"({"question": "q", "hints": null, "quick_answers": null})"), request).success;
    bool success = !empty_question && !bad_timeout && !bad_hints && null_lists;
    return report(success, "request validation");
}

static bool test_oversized_timeout_is_rejected() {
    ask_human_contract::AskHumanRequest request;
    bool beyond_int = ask_human_contract::parse_request(
        json::parse(R"({"question": "q", "timeout_seconds": 10000000000})"), request).success;
    bool beyond_ceiling = ask_human_contract::parse_request(
        json::parse(R"({"question": "q", "timeout_seconds": 86401})"), request).success;
    bool negative = ask_human_contract::parse_request(
        json::parse(R"({"question": "q", "timeout_seconds": -5})"), request).success;
    ask_human_contract::ParseResult at_ceiling = ask_human_contract::parse_request(
        json::parse(R"({"question": "q", "timeout_seconds": 86400})"), request);
    bool success = !beyond_int && !beyond_ceiling && !negative && at_ceiling.success &&
                   request.timeout_seconds == ask_human_contract::MAX_TIMEOUT_SECONDS;
    return report(success, "timeout_seconds outside 1..86400 is rejected, not truncated",
                  std::to_string(request.timeout_seconds));
}

static bool test_response_parsing() {
    ask_human_contract::AskHumanResponse response;
    ask_human_contract::ParseResult good = ask_human_contract::parse_response(
        json::parse(R"({"answer": "  yes \n", "source": "text", "duration_ms": 1234})"), response);
    ask_human_contract::AskHumanResponse unused;
    bool wrong_source = ask_human_contract::parse_response(
        json::parse(R"({"answer": "yes", "source": "voice"})"), unused).success;
    bool no_answer = ask_human_contract::parse_response(json::parse(R"({"source": "text"})"), unused).success;

    json payload = ask_human_contract::to_json(response);
    bool success = good.success && response.answer == "yes" && response.duration_ms == 1234 &&
                   !wrong_source && !no_answer && payload["source"] == "text" && payload["duration_ms"] == 1234;
    return report(success, "response is trimmed and source must be text");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_request_defaults();
    all_passed &= test_request_wire_keys();
    all_passed &= test_request_validation();
    all_passed &= test_oversized_timeout_is_rejected();
    all_passed &= test_response_parsing();
    return all_passed;
}

} // namespace test_ask_human_contract
