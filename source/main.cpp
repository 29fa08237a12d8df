// mcproxy – MCP tool-server aggregating proxy
// Entry point: command line, startup of the child servers and the stdio MCP
// server loop.
//
// Reads JSON-RPC 2.0 messages from stdin, dispatches them, writes responses to stdout.
// Logs go to stderr (permitted by MCP spec).

#include <nlohmann/json.hpp>
#include <chrono>
#include <csignal>
#include <signal.h>
#include <future>
#include <iostream>
#include <string>
#include <vector>

#include "config/proxy_config.hpp"
#include "mcp/mcp_dispatch.hpp"
#include "mcp/mcp_stdio.hpp"
#include "platform/platform_abi.hpp"
#include "protocol/json_rpc.hpp"
#include "proxy/builder.hpp"
#include "proxy/catalog_merger.hpp"
#include "proxy/dispatcher.hpp"
#include "proxy/proxy_core.hpp"
#include "utils/debug_log.hpp"

using json = nlohmann::json;

static const char *DEFAULT_CONFIG_PATH = "proxy_config.json";

// Global flag for graceful shutdown.
static volatile std::sig_atomic_t shutdown_requested = 0;

static void signal_handler(int signal_number) {
    (void)signal_number;
    shutdown_requested = 1;
}

// No SA_RESTART: a signal interrupts the blocking read on stdin so the loop
// can notice shutdown_requested.
static void install_signal_handlers() {
    struct sigaction action = {};
    action.sa_handler = signal_handler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

struct CommandLine {
    std::string config_path = DEFAULT_CONFIG_PATH;
    bool list_tools = false;
    bool rebuild = false;
    bool show_help = false;
    std::string log_level;
};

static void print_usage(std::ostream &output) {
    output << "Usage: mcproxy [--config PATH] [--list-tools] [--rebuild] "
              "[--log-level DEBUG|INFO|WARNING|ERROR]\n"
              "\n"
              "  --config PATH     server list (default: ./proxy_config.json)\n"
              "  --list-tools      print the merged tool catalog and exit\n"
              "  --rebuild         run every build command and exit\n"
              "  --log-level LEVEL stderr log level (default: INFO)\n";
}

static bool parse_command_line(int argc, char **argv, CommandLine &command_line, std::string &error_message) {
    for (int index = 1; index < argc; ++index) {
        std::string argument = argv[index];
        if (argument == "--help" || argument == "-h") {
            command_line.show_help = true;
        } else if (argument == "--list-tools") {
            command_line.list_tools = true;
        } else if (argument == "--rebuild") {
            command_line.rebuild = true;
        } else if (argument == "--config" || argument == "--log-level") {
            if (index + 1 >= argc) {
                error_message = argument + " needs a value";
                return false;
            }
            std::string value = argv[++index];
            if (argument == "--config") {
                command_line.config_path = value;
            } else {
                command_line.log_level = value;
            }
        } else {
            error_message = "Unknown argument: " + argument;
            return false;
        }
    }
    return true;
}

// --rebuild: every build runs regardless of the others' results.
static int run_rebuild(const config::ProxyConfig &proxy_config) {
    debug_log::info("Rebuilding all binaries...");
    int failures = 0;
    for (const auto &spec : proxy_config.servers) {
        if (!spec.has_build_command()) {
            continue;
        }
        proxy::BuildResult build_result = proxy::build(spec);
        if (!build_result.success) {
            ++failures;
        }
    }
    debug_log::info("Rebuild finished, " + std::to_string(failures) + " failed");
    return failures == 0 ? 0 : 1;
}

// --list-tools: the merged catalog with origins, for the operator.
static int run_list_tools(proxy::ProxyCore &core) {
    mcp_tools::CatalogSnapshot snapshot = core.catalog();
    std::cout << "Tools (" << snapshot->tools.size() << "):\n";
    for (const auto &entry : snapshot->tools) {
        const mcp_tools::ToolDescriptor &tool = entry.second;
        std::cout << "  - " << tool.qualified_name << " (server: " << tool.origin_server << ")\n";
        if (!tool.description.empty()) {
            std::cout << "    " << tool.description << "\n";
        }
    }

    std::cout << "Servers:\n";
    for (const auto &status : core.server_statuses()) {
        std::cout << "  - " << status.server_name << ": " << proxy::to_string(status.state);
        if (status.last_error_kind != proxy::ErrorKind::None) {
            std::cout << " [" << proxy::status_label(status.last_error_kind) << "] " << status.last_error;
        } else {
            std::cout << ", " << status.tool_count << " tools";
        }
        std::cout << "\n";
    }
    std::cout.flush();
    return 0;
}

static void prune_finished(std::vector<std::future<void>> &workers) {
    for (auto iterator = workers.begin(); iterator != workers.end();) {
        if (iterator->wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
            iterator->get();
            iterator = workers.erase(iterator);
        } else {
            ++iterator;
        }
    }
}

static void serve(proxy::ProxyCore &core, proxy::Dispatcher &dispatcher) {
    std::vector<std::future<void>> workers;

    debug_log::info("mcproxy started. Waiting for MCP messages on stdin.");

    // Main message loop: read from stdin, dispatch, write to stdout.
    while (!shutdown_requested) {
        std::string raw_message = mcp_stdio::read_message();

        if (raw_message.empty()) {
            debug_log::info(shutdown_requested ? "Signal received. Shutting down." : "EOF on stdin. Shutting down.");
            break;
        }

        json parsed_message;
        try {
            parsed_message = json::parse(raw_message);
        } catch (const json::parse_error &error) {
            debug_log::warning("Failed to parse incoming JSON: " + std::string(error.what()));
            json error_response = json_rpc::build_error_response(nullptr, json_rpc::PARSE_ERROR, "Parse error");
            mcp_stdio::write_message(error_response.dump());
            continue;
        }

        prune_finished(workers);

        // A slow tool call must not hold up tools/list or other calls.
        if (mcp_dispatch::is_tool_call(parsed_message)) {
            workers.push_back(std::async(std::launch::async, [&dispatcher, parsed_message] {
                json response = mcp_dispatch::dispatch_message(dispatcher, parsed_message);
                mcp_stdio::write_message(response.dump(-1, ' ', false, json::error_handler_t::replace));
            }));
            continue;
        }

        json response = mcp_dispatch::dispatch_message(dispatcher, parsed_message);

        // Notifications return null (no response needed).
        if (response.is_null()) {
            continue;
        }

        mcp_stdio::write_message(response.dump(-1, ' ', false, json::error_handler_t::replace));
    }

    // On a signal, in-flight calls are failed by stopping the children rather
    // than waited out.
    if (shutdown_requested) {
        core.shutdown();
    }
    debug_log::log("Waiting for " + std::to_string(workers.size()) + " in-flight calls");
    for (auto &worker : workers) {
        worker.get();
    }
}

int main(int argc, char **argv) {
    CommandLine command_line;
    std::string argument_error;
    if (!parse_command_line(argc, argv, command_line, argument_error)) {
        std::cerr << "mcproxy: " << argument_error << "\n";
        print_usage(std::cerr);
        return 2;
    }
    if (command_line.show_help) {
        print_usage(std::cout);
        return 0;
    }
    if (!command_line.log_level.empty()) {
        debug_log::Level level;
        if (!debug_log::parse_level(command_line.log_level, level)) {
            std::cerr << "mcproxy: unknown log level " << command_line.log_level << "\n";
            return 2;
        }
        debug_log::set_level(level);
    }

    debug_log::info(std::string("mcproxy – MCP proxy server, build ") + __DATE__ + " " + __TIME__);

    install_signal_handlers();
    platform::ignore_broken_pipe_signal();

    config::ConfigLoadResult load_result = config::load_proxy_config(command_line.config_path);
    if (!load_result.success) {
        debug_log::error("Cannot load " + command_line.config_path + ": " + load_result.error_message);
        return 1;
    }
    for (const auto &rejected : load_result.rejected) {
        debug_log::error("Config error in server " + rejected.server_name + ": " + rejected.message);
    }

    if (command_line.rebuild) {
        return run_rebuild(load_result.config);
    }

    proxy::ProxyCore core(load_result.config.servers, load_result.config.enabled_tools);
    core.start();

    int exit_code = 0;
    if (command_line.list_tools) {
        exit_code = run_list_tools(core);
    } else {
        if (core.catalog()->tools.empty()) {
            debug_log::warning("No tools found on any server");
        }
        proxy::Dispatcher dispatcher(core);
        serve(core, dispatcher);
    }

    core.shutdown();
    debug_log::info("mcproxy shut down.");
    return exit_code;
}
