#include "proxy/catalog_merger.hpp"

#include "utils/debug_log.hpp"

#include <map>
#include <thread>
#include <utility>

namespace proxy {

std::string status_label(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None:
        return "success";
    case ErrorKind::ConfigError:
        return "config-error";
    case ErrorKind::BuildError:
        return "build-failed";
    case ErrorKind::LaunchError:
        return "launch-failed";
    case ErrorKind::DiscoveryTimeout:
        return "discovery-timeout";
    case ErrorKind::DiscoveryProtocolError:
        return "discovery-protocol-error";
    case ErrorKind::ProcessExited:
        return "process-exited";
    case ErrorKind::TransportError:
        return "transport-error";
    default:
        return to_string(kind);
    }
}

DiscoveryReport discover_all(const std::vector<std::shared_ptr<ChildSession>> &sessions) {
    std::vector<DiscoveryResult> results(sessions.size());
    std::vector<std::thread> workers;
    workers.reserve(sessions.size());

    // Each worker writes only its own slot.
    for (size_t index = 0; index < sessions.size(); ++index) {
        workers.emplace_back([&sessions, &results, index] {
            const std::shared_ptr<ChildSession> &session = sessions[index];
            results[index] = session->discover(session->spec().discovery_timeout);
        });
    }
    for (auto &worker : workers) {
        worker.join();
    }

    DiscoveryReport report;
    for (size_t index = 0; index < sessions.size(); ++index) {
        const ServerSpec &spec = sessions[index]->spec();
        DiscoveryResult &result = results[index];

        DiscoveryStatus status;
        status.server_name = spec.name;
        status.success = result.success;
        status.error_kind = result.error_kind;
        status.detail = result.error_message;
        report.statuses.push_back(status);

        if (result.success) {
            ServerTools server_tools;
            server_tools.server_name = spec.name;
            server_tools.enabled_tools = spec.enabled_tools;
            server_tools.tools = std::move(result.tools);
            report.discovered.push_back(std::move(server_tools));
        }
    }
    return report;
}

bool is_tool_enabled(const std::string &server_name, const std::string &local_name,
                     const std::set<std::string> &server_enabled_tools,
                     const std::set<std::string> &global_enabled_tools) {
    if (!server_enabled_tools.empty() && server_enabled_tools.count(local_name) == 0) {
        return false;
    }
    if (global_enabled_tools.empty()) {
        return true;
    }
    return global_enabled_tools.count(local_name) != 0 ||
           global_enabled_tools.count(server_name + "." + local_name) != 0;
}

mcp_tools::CatalogSnapshot merge_catalog(const std::vector<ServerTools> &server_tools,
                                         const std::set<std::string> &global_enabled_tools,
                                         uint64_t version) {
    struct Candidate {
        const std::string *server_name;
        const RemoteTool *tool;
        bool qualified;
    };

    // Filter, dropping a server's repeated local names.
    std::vector<Candidate> candidates;
    std::map<std::string, int> local_name_counts;
    for (const auto &server : server_tools) {
        std::set<std::string> seen_local_names;
        for (const auto &tool : server.tools) {
            if (!is_tool_enabled(server.server_name, tool.name, server.enabled_tools, global_enabled_tools)) {
                debug_log::log("Tool " + tool.name + " of " + server.server_name + " is disabled");
                continue;
            }
            if (!seen_local_names.insert(tool.name).second) {
                debug_log::warning(server.server_name + " reported tool " + tool.name + " twice, keeping the first");
                continue;
            }
            candidates.push_back({&server.server_name, &tool, false});
            local_name_counts[tool.name]++;
        }
    }

    std::set<std::string> qualified_names;
    for (auto &candidate : candidates) {
        if (local_name_counts[candidate.tool->name] > 1) {
            candidate.qualified = true;
            qualified_names.insert(*candidate.server_name + "." + candidate.tool->name);
        }
    }

    // A bare local name may itself look like "<server>.<tool>" and clash with
    // a qualified one; qualify it as well until nothing clashes. Server names
    // never contain '.', so qualified names cannot clash with each other.
    bool changed = true;
    while (changed) {
        changed = false;
        for (auto &candidate : candidates) {
            if (!candidate.qualified && qualified_names.count(candidate.tool->name) != 0) {
                candidate.qualified = true;
                qualified_names.insert(*candidate.server_name + "." + candidate.tool->name);
                changed = true;
            }
        }
    }

    auto catalog = std::make_shared<mcp_tools::MergedCatalog>();
    catalog->version = version;
    for (const auto &candidate : candidates) {
        mcp_tools::ToolDescriptor descriptor;
        descriptor.origin_server = *candidate.server_name;
        descriptor.local_name = candidate.tool->name;
        descriptor.qualified_name = candidate.qualified
                                        ? *candidate.server_name + "." + candidate.tool->name
                                        : candidate.tool->name;
        descriptor.description = candidate.tool->description.empty()
                                     ? "Tool " + candidate.tool->name + " from " + *candidate.server_name
                                     : candidate.tool->description;
        descriptor.input_schema = candidate.tool->input_schema;

        std::string key = descriptor.qualified_name;
        if (!catalog->tools.emplace(key, std::move(descriptor)).second) {
            debug_log::error("Qualified name collision on " + key + ", dropping the later tool");
        }
    }

    debug_log::log("Merged catalog v" + std::to_string(version) + " with " +
                   std::to_string(catalog->tools.size()) + " tools");
    return catalog;
}

size_t count_tools_from(const mcp_tools::MergedCatalog &catalog, const std::string &server_name) {
    size_t count = 0;
    for (const auto &entry : catalog.tools) {
        if (entry.second.origin_server == server_name) {
            ++count;
        }
    }
    return count;
}

} // namespace proxy
