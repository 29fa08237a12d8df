// Test runner: runs every suite and reports results.

#include <iostream>
#include <vector>
#include <string>
#include <functional>
#include <chrono>

// Forward declarations of test functions from other test files.
namespace test_json_rpc {
    bool run_all_tests();
}

namespace test_server_spec {
    bool run_all_tests();
}

namespace test_builder {
    bool run_all_tests();
}

namespace test_child_session {
    bool run_all_tests();
}

namespace test_catalog_merger {
    bool run_all_tests();
}

namespace test_proxy_core {
    bool run_all_tests();
}

namespace test_mcp_dispatch {
    bool run_all_tests();
}

namespace test_proxy_config {
    bool run_all_tests();
}

namespace test_ask_human_contract {
    bool run_all_tests();
}

namespace test_end_to_end {
    bool run_all_tests();
}

struct TestSuite {
    std::string name;
    std::function<bool()> runner;
};

int main() {
    std::vector<TestSuite> suites = {
        {"test_json_rpc", test_json_rpc::run_all_tests},
        {"test_server_spec", test_server_spec::run_all_tests},
        {"test_builder", test_builder::run_all_tests},
        {"test_child_session", test_child_session::run_all_tests},
        {"test_catalog_merger", test_catalog_merger::run_all_tests},
        {"test_proxy_core", test_proxy_core::run_all_tests},
        {"test_mcp_dispatch", test_mcp_dispatch::run_all_tests},
        {"test_proxy_config", test_proxy_config::run_all_tests},
        {"test_ask_human_contract", test_ask_human_contract::run_all_tests},
        {"test_end_to_end", test_end_to_end::run_all_tests},
    };

    int passed_count = 0;
    int failed_count = 0;
    auto total_start_time = std::chrono::steady_clock::now();

    std::cout << "=== mcproxy Test Runner ===" << std::endl;
    std::cout << std::endl;

    for (const auto &suite : suites) {
        std::cout << "--- " << suite.name << " ---" << std::endl;
        auto suite_start_time = std::chrono::steady_clock::now();

        bool suite_passed = suite.runner();

        auto suite_elapsed = std::chrono::steady_clock::now() - suite_start_time;
        long suite_milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(suite_elapsed).count();

        if (suite_passed) {
            std::cout << "  PASSED (" << suite_milliseconds << " ms)" << std::endl;
            passed_count++;
        } else {
            std::cout << "  FAILED (" << suite_milliseconds << " ms)" << std::endl;
            failed_count++;
        }
        std::cout << std::endl;
    }

    auto total_elapsed = std::chrono::steady_clock::now() - total_start_time;
    long total_milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(total_elapsed).count();

    std::cout << "=== Results ===" << std::endl;
    std::cout << "  Passed: " << passed_count << std::endl;
    std::cout << "  Failed: " << failed_count << std::endl;
    std::cout << "  Total time: " << total_milliseconds << " ms" << std::endl;

    return (failed_count == 0) ? 0 : 1;
}
