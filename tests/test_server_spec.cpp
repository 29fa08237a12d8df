// Tests for server spec validation.

#include "proxy/server_spec.hpp"
#include "test_support.hpp"

#include <chrono>
#include <string>
#include <vector>

using test_support::report;

namespace test_server_spec {

static proxy::ServerSpec make_spec(const std::string &name) {
    proxy::ServerSpec spec;
    spec.name = name;
    spec.binary_path = "/bin/true";
    return spec;
}

static bool test_valid_specs_accepted() {
    proxy::ValidatedSpecs result = proxy::validate_specs({make_spec("alpha"), make_spec("beta")});
    bool success = result.accepted.size() == 2 && result.rejected.empty();
    return report(success, "valid specs are accepted");
}

static bool test_duplicate_name_keeps_first() {
    proxy::ServerSpec first = make_spec("alpha");
    first.launch_args = {"--first"};
    proxy::ServerSpec second = make_spec("alpha");
    second.launch_args = {"--second"};

    proxy::ValidatedSpecs result = proxy::validate_specs({first, second});
    bool success = result.accepted.size() == 1 && result.accepted[0].launch_args[0] == "--first" &&
                   result.rejected.size() == 1 && result.rejected[0].server_name == "alpha";
    return report(success, "duplicate name rejected, first occurrence kept");
}

static bool test_dotted_name_rejected() {
    proxy::ValidatedSpecs result = proxy::validate_specs({make_spec("a.b"), make_spec("ok")});
    bool success = result.accepted.size() == 1 && result.accepted[0].name == "ok" &&
                   result.rejected.size() == 1 && result.rejected[0].server_name == "a.b";
    return report(success, "server name containing '.' rejected");
}

static bool test_bad_entries_rejected_individually() {
    proxy::ServerSpec no_name = make_spec("");
    proxy::ServerSpec no_binary = make_spec("nobinary");
    no_binary.binary_path.clear();
    proxy::ServerSpec zero_timeout = make_spec("zero");
    zero_timeout.call_timeout = std::chrono::milliseconds(0);
    proxy::ServerSpec missing_directory = make_spec("nodir");
    missing_directory.build_command = "make";
    missing_directory.build_working_directory = "/nonexistent/mcproxy/build/dir";

    proxy::ValidatedSpecs result = proxy::validate_specs(
        {no_name, no_binary, zero_timeout, missing_directory, make_spec("good")});
    bool success = result.accepted.size() == 1 && result.accepted[0].name == "good" &&
                   result.rejected.size() == 4;
    return report(success, "each bad entry is rejected on its own",
                  std::to_string(result.rejected.size()) + " rejected");
}

static bool test_timeout_ceiling() {
    proxy::ServerSpec slow_discovery = make_spec("slow_discovery");
    slow_discovery.discovery_timeout = proxy::MAXIMUM_TIMEOUT + std::chrono::milliseconds(1);
    proxy::ServerSpec slow_call = make_spec("slow_call");
    slow_call.call_timeout = std::chrono::milliseconds(10000000000000000LL);
    proxy::ServerSpec one_day = make_spec("one_day");
    one_day.call_timeout = proxy::MAXIMUM_TIMEOUT;

    proxy::ValidatedSpecs result = proxy::validate_specs({slow_discovery, slow_call, one_day});
    bool success = result.accepted.size() == 1 && result.accepted[0].name == "one_day" &&
                   result.rejected.size() == 2;
    return report(success, "timeouts above one day are rejected");
}

static bool test_build_directory_only_checked_with_build_command() {
    proxy::ServerSpec spec = make_spec("plain");
    spec.build_working_directory = "/nonexistent/mcproxy/build/dir";
    proxy::ValidatedSpecs result = proxy::validate_specs({spec});
    return report(result.accepted.size() == 1, "build directory ignored without a build command");
}

static bool test_state_names() {
    bool success = std::string(proxy::to_string(proxy::ServerState::Ready)) == "Ready" &&
                   std::string(proxy::to_string(proxy::ServerState::Degraded)) == "Degraded";
    return report(success, "server state names");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_valid_specs_accepted();
    all_passed &= test_duplicate_name_keeps_first();
    all_passed &= test_dotted_name_rejected();
    all_passed &= test_bad_entries_rejected_individually();
    all_passed &= test_timeout_ceiling();
    all_passed &= test_build_directory_only_checked_with_build_command();
    all_passed &= test_state_names();
    return all_passed;
}

} // namespace test_server_spec
