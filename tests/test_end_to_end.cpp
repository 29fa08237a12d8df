// End-to-end tests: run the mcproxy binary over two fake servers and talk to
// it over stdio exactly like an MCP client would.

#include "platform/platform_abi.hpp"
#include "proxy/child_session.hpp"
#include "test_support.hpp"

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <set>
#include <string>
#include <thread>

#include <unistd.h>

using json = nlohmann::json;
using test_support::elapsed_milliseconds;
using test_support::report;

namespace test_end_to_end {

static std::string write_config(const std::string &directory) {
    json alpha;
    alpha["name"] = "alpha";
    alpha["binary"] = MCPROXY_FAKE_SERVER_PATH;
    alpha["args"] = {"--label", "alpha", "--tools", "search,fetch,sleep"};

    json beta;
    beta["name"] = "beta";
    beta["binary"] = MCPROXY_FAKE_SERVER_PATH;
    beta["args"] = {"--label", "beta", "--tools", "search,hang"};
    beta["call_timeout"] = 0.3;

    json document;
    document["servers"] = {alpha, beta};
    document["enabled_tools"] = json::array();

    std::string path = directory + "/proxy_config.json";
    std::ofstream output(path);
    output << document.dump(2);
    return path;
}

static proxy::ServerSpec proxy_spec(const std::string &config_path) {
    proxy::ServerSpec spec;
    spec.name = "mcproxy";
    spec.binary_path = MCPROXY_BINARY_PATH;
    spec.launch_args = {"--config", config_path};
    spec.discovery_timeout = std::chrono::milliseconds(15000);
    return spec;
}

static std::string text_of(const proxy::CallResult &result) {
    json payload = result.result;
    if (!result.success || !payload.contains("content") || payload["content"].empty()) {
        return "";
    }
    return payload["content"][0].value("text", std::string());
}

static bool test_proxy_over_stdio(const std::string &config_path) {
    proxy::ChildSession session(proxy_spec(config_path));
    proxy::LaunchResult launch = session.launch();
    if (!launch.success) {
        return report(false, "mcproxy launches", launch.error_message);
    }
    proxy::DiscoveryResult discovery = session.discover(session.spec().discovery_timeout);
    if (!discovery.success) {
        return report(false, "mcproxy lists tools", discovery.error_message);
    }

    std::set<std::string> names;
    for (const auto &tool : discovery.tools) {
        names.insert(tool.name);
    }
    std::set<std::string> expected = {"alpha.search", "beta.search", "fetch", "sleep", "hang"};
    bool all_passed = report(names == expected, "merged catalog is served over stdio");

    proxy::CallResult alpha_search = session.call("alpha.search", json::object(), std::chrono::milliseconds(5000));
    proxy::CallResult beta_search = session.call("beta.search", json::object(), std::chrono::milliseconds(5000));
    all_passed &= report(text_of(alpha_search) == "alpha:search" && text_of(beta_search) == "beta:search",
                         "qualified calls reach their own server");

    proxy::CallResult unknown = session.call("search", json::object(), std::chrono::milliseconds(5000));
    all_passed &= report(unknown.error_kind == proxy::ErrorKind::ToolError &&
                             unknown.remote_error["code"] == -32602 &&
                             unknown.remote_error["data"]["kind"] == "UnknownTool",
                         "unknown tool is a JSON-RPC error with kind UnknownTool", unknown.remote_error.dump());

    proxy::CallResult timed_out = session.call("hang", json::object(), std::chrono::milliseconds(5000));
    all_passed &= report(timed_out.remote_error["code"] == -32001 &&
                             timed_out.remote_error["data"]["kind"] == "CallTimeout",
                         "child call timeout is reported as CallTimeout", timed_out.remote_error.dump());

    // A slow call must not hold up the next request.
    proxy::CallResult slow_result;
    json sleep_arguments;
    sleep_arguments["ms"] = 1000;
    std::thread slow_caller([&] {
        slow_result = session.call("sleep", sleep_arguments, std::chrono::milliseconds(5000));
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    auto start = std::chrono::steady_clock::now();
    proxy::CallResult fast_result = session.call("fetch", json::object(), std::chrono::milliseconds(5000));
    long fast_milliseconds = elapsed_milliseconds(start);
    slow_caller.join();
    all_passed &= report(text_of(fast_result) == "alpha:fetch" && fast_milliseconds < 700 &&
                             text_of(slow_result) == "alpha:slept 1000",
                         "calls are served concurrently", std::to_string(fast_milliseconds) + " ms");

    session.shutdown();
    all_passed &= report(session.state() == proxy::ServerState::Stopped, "mcproxy exits on EOF");
    return all_passed;
}

static bool test_list_tools_command(const std::string &directory, const std::string &config_path) {
    platform::CommandResult result = platform::run_shell_command(
        std::string(MCPROXY_BINARY_PATH) + " --config " + config_path + " --list-tools --log-level ERROR",
        directory);
    bool success = result.started && result.exit_code == 0 &&
                   result.output.find("alpha.search (server: alpha)") != std::string::npos &&
                   result.output.find("fetch (server: alpha)") != std::string::npos &&
                   result.output.find("beta: Ready") != std::string::npos;
    return report(success, "--list-tools prints tools with origins and server states", result.output);
}

static bool test_bad_argument() {
    platform::CommandResult result =
        platform::run_shell_command(std::string(MCPROXY_BINARY_PATH) + " --bogus", "");
    bool success = result.started && result.exit_code == 2 && result.output.find("Usage") != std::string::npos;
    return report(success, "unknown argument prints usage and exits 2");
}

bool run_all_tests() {
    char directory_template[] = "/tmp/mcproxy_e2e_XXXXXX";
    char *created = mkdtemp(directory_template);
    if (created == nullptr) {
        return report(false, "create temporary directory");
    }
    std::string directory = created;
    std::string config_path = write_config(directory);

    bool all_passed = true;
    all_passed &= test_proxy_over_stdio(config_path);
    all_passed &= test_list_tools_command(directory, config_path);
    all_passed &= test_bad_argument();

    std::remove(config_path.c_str());
    rmdir(directory.c_str());
    return all_passed;
}

} // namespace test_end_to_end
