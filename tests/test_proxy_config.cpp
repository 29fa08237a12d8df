// Tests for loading proxy_config.json.

#include "config/proxy_config.hpp"
#include "test_support.hpp"

#include <chrono>
#include <string>

using test_support::report;

namespace test_proxy_config {

static bool test_full_entry() {
    std::string contents = R"({
        "servers": [
            {"name": "alpha", "binary": "bin/alpha", "build_command": "make", "build_cwd": "tmp",
             "args": ["--stdio", "-v"], "timeout": 5, "call_timeout": 1.5,
             "enabled_tools": ["search"]}
        ],
        "enabled_tools": ["alpha.search", "fetch"]
    })";
    config::ConfigLoadResult result = config::parse_proxy_config(contents, "/");
    if (!result.success || result.config.servers.size() != 1) {
        return report(false, "full server entry parses", result.error_message);
    }
    const proxy::ServerSpec &spec = result.config.servers[0];
    bool success = spec.name == "alpha" && spec.binary_path == "/bin/alpha" &&
                   spec.build_command == "make" && spec.build_working_directory == "/tmp" &&
                   spec.launch_args.size() == 2 && spec.launch_args[1] == "-v" &&
                   spec.discovery_timeout == std::chrono::milliseconds(5000) &&
                   spec.call_timeout == std::chrono::milliseconds(1500) &&
                   spec.enabled_tools.count("search") == 1 &&
                   result.config.enabled_tools.size() == 2 && result.rejected.empty();
    return report(success, "full server entry parses with paths resolved", spec.binary_path);
}

static bool test_defaults_and_absolute_paths() {
    config::ConfigLoadResult result = config::parse_proxy_config(
        R"({"servers": [{"name": "plain", "binary": "/usr/bin/plain"}]})", "/etc/mcproxy");
    bool success = result.success && result.config.servers.size() == 1 &&
                   result.config.servers[0].binary_path == "/usr/bin/plain" &&
                   result.config.servers[0].discovery_timeout == proxy::DEFAULT_DISCOVERY_TIMEOUT &&
                   result.config.servers[0].call_timeout == proxy::DEFAULT_CALL_TIMEOUT &&
                   result.config.servers[0].launch_args.empty() && result.config.enabled_tools.empty();
    return report(success, "missing fields take defaults, absolute paths are kept");
}

static bool test_bad_entries_are_isolated() {
    std::string contents = R"({
        "servers": [
            {"name": "good", "binary": "/bin/good"},
            {"name": "badargs", "binary": "/bin/x", "args": "--not-a-list"},
            {"name": "good", "binary": "/bin/again"},
            {"name": "dotted.name", "binary": "/bin/y"},
            {"name": "nobinary"},
            42
        ]
    })";
    config::ConfigLoadResult result = config::parse_proxy_config(contents, "/");
    bool success = result.success && result.config.servers.size() == 1 &&
                   result.config.servers[0].binary_path == "/bin/good" && result.rejected.size() == 5;
    return report(success, "each bad server entry is dropped on its own",
                  std::to_string(result.rejected.size()) + " rejected");
}

static bool test_timeout_ceiling() {
    std::string contents = R"({
        "servers": [
            {"name": "huge", "binary": "/bin/huge", "call_timeout": 1e13},
            {"name": "enormous", "binary": "/bin/enormous", "timeout": 1e300},
            {"name": "negative", "binary": "/bin/negative", "call_timeout": -1e300},
            {"name": "overday", "binary": "/bin/overday", "timeout": 86400.5},
            {"name": "day", "binary": "/bin/day", "timeout": 86400, "call_timeout": 86400}
        ]
    })";
    config::ConfigLoadResult result = config::parse_proxy_config(contents, "/");
    bool success = result.success && result.config.servers.size() == 1 &&
                   result.config.servers[0].name == "day" &&
                   result.config.servers[0].call_timeout == proxy::MAXIMUM_TIMEOUT &&
                   result.rejected.size() == 4;
    return report(success, "timeouts above one day are rejected per entry",
                  std::to_string(result.rejected.size()) + " rejected");
}

static bool test_malformed_document() {
    config::ConfigLoadResult broken = config::parse_proxy_config("{\"servers\": [", "/");
    config::ConfigLoadResult not_object = config::parse_proxy_config("[1, 2]", "/");
    config::ConfigLoadResult bad_servers = config::parse_proxy_config(R"({"servers": {}})", "/");
    bool success = !broken.success && !not_object.success && !bad_servers.success &&
                   !broken.error_message.empty();
    return report(success, "malformed documents fail the load");
}

static bool test_missing_file_is_empty_config() {
    config::ConfigLoadResult result = config::load_proxy_config("/nonexistent/mcproxy/proxy_config.json");
    bool success = result.success && !result.file_found && result.config.servers.empty();
    return report(success, "missing config file yields no servers");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_full_entry();
    all_passed &= test_defaults_and_absolute_paths();
    all_passed &= test_bad_entries_are_isolated();
    all_passed &= test_timeout_ceiling();
    all_passed &= test_malformed_document();
    all_passed &= test_missing_file_is_empty_config();
    return all_passed;
}

} // namespace test_proxy_config
