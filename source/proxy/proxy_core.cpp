#include "proxy/proxy_core.hpp"

#include "platform/platform_abi.hpp"
#include "proxy/builder.hpp"
#include "utils/debug_log.hpp"

#include <atomic>
#include <thread>
#include <utility>

namespace proxy {

static bool ends_with(const std::string &value, const std::string &suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Startup skips the build when the binary is already there.
static bool binary_present(const ServerSpec &spec) {
    if (ends_with(spec.binary_path, ".py")) {
        std::string ignored;
        return platform::read_file_contents(spec.binary_path, ignored);
    }
    return platform::is_executable_file(spec.binary_path);
}

ProxyCore::ProxyCore(std::vector<ServerSpec> specs, std::set<std::string> global_enabled_tools)
    : global_enabled_tools_(std::move(global_enabled_tools)) {
    servers_.reserve(specs.size());
    for (auto &spec : specs) {
        ServerEntry entry;
        entry.spec = std::move(spec);
        servers_.push_back(std::move(entry));
    }

    auto empty = std::make_shared<mcp_tools::MergedCatalog>();
    empty->version = 0;
    std::atomic_store(&catalog_, mcp_tools::CatalogSnapshot(empty));
}

ProxyCore::~ProxyCore() {
    shutdown();
}

std::vector<DiscoveryStatus> ProxyCore::start() {
    std::lock_guard<std::mutex> lifecycle_lock(lifecycle_mutex_);

    std::vector<size_t> indices;
    for (size_t index = 0; index < servers_.size(); ++index) {
        indices.push_back(index);
    }
    debug_log::info("Starting " + std::to_string(indices.size()) + " servers");
    return bring_up(indices, false);
}

DiscoveryStatus ProxyCore::rebuild(const std::string &server_name) {
    std::lock_guard<std::mutex> lifecycle_lock(lifecycle_mutex_);

    for (size_t index = 0; index < servers_.size(); ++index) {
        if (servers_[index].spec.name == server_name) {
            debug_log::info("Rebuilding " + server_name);
            std::vector<DiscoveryStatus> statuses = bring_up({index}, true);
            return statuses.front();
        }
    }

    DiscoveryStatus status;
    status.server_name = server_name;
    status.error_kind = ErrorKind::ConfigError;
    status.detail = "Unknown server: " + server_name;
    debug_log::warning(status.detail);
    return status;
}

std::vector<DiscoveryStatus> ProxyCore::rebuild_all() {
    std::lock_guard<std::mutex> lifecycle_lock(lifecycle_mutex_);

    std::vector<size_t> indices;
    for (size_t index = 0; index < servers_.size(); ++index) {
        indices.push_back(index);
    }
    debug_log::info("Rebuilding all " + std::to_string(indices.size()) + " servers");
    return bring_up(indices, true);
}

void ProxyCore::shutdown() {
    std::lock_guard<std::mutex> lifecycle_lock(lifecycle_mutex_);

    std::vector<std::shared_ptr<ChildSession>> sessions;
    {
        std::lock_guard<std::mutex> lock(servers_mutex_);
        for (auto &entry : servers_) {
            if (entry.session) {
                sessions.push_back(entry.session);
            }
            entry.state = ServerState::Stopped;
        }
    }
    if (sessions.empty()) {
        return;
    }

    debug_log::info("Shutting down " + std::to_string(sessions.size()) + " servers");
    std::vector<std::thread> workers;
    for (auto &session : sessions) {
        workers.emplace_back([session] { session->shutdown(); });
    }
    for (auto &worker : workers) {
        worker.join();
    }
}

mcp_tools::CatalogSnapshot ProxyCore::catalog() const {
    return std::atomic_load(&catalog_);
}

std::shared_ptr<ChildSession> ProxyCore::session_for(const std::string &server_name) const {
    std::lock_guard<std::mutex> lock(servers_mutex_);
    const ServerEntry *entry = find_entry(server_name);
    if (entry == nullptr) {
        return nullptr;
    }
    return entry->session;
}

std::vector<ServerStatus> ProxyCore::server_statuses() const {
    mcp_tools::CatalogSnapshot snapshot = catalog();

    std::vector<ServerStatus> statuses;
    std::lock_guard<std::mutex> lock(servers_mutex_);
    for (const auto &entry : servers_) {
        ServerStatus status;
        status.server_name = entry.spec.name;
        status.state = entry.state;
        status.last_error_kind = entry.last_error_kind;
        status.last_error = entry.last_error;
        if (entry.session && entry.state != ServerState::Stopped) {
            status.state = entry.session->state();
            if (status.state == ServerState::Degraded) {
                status.last_error_kind = entry.session->degraded_kind();
                status.last_error = entry.session->degraded_reason();
            }
        }
        status.tool_count = count_tools_from(*snapshot, entry.spec.name);
        statuses.push_back(status);
    }
    return statuses;
}

ServerState ProxyCore::server_state(const std::string &server_name) const {
    std::lock_guard<std::mutex> lock(servers_mutex_);
    const ServerEntry *entry = find_entry(server_name);
    if (entry == nullptr) {
        return ServerState::Stopped;
    }
    if (entry->session && entry->state != ServerState::Stopped) {
        return entry->session->state();
    }
    return entry->state;
}

std::vector<DiscoveryStatus> ProxyCore::bring_up(const std::vector<size_t> &indices, bool force_build) {
    std::vector<DiscoveryStatus> statuses(indices.size());
    std::vector<std::shared_ptr<ChildSession>> launched(indices.size());

    // Builds and launches are independent per server.
    {
        std::vector<std::thread> workers;
        for (size_t slot = 0; slot < indices.size(); ++slot) {
            workers.emplace_back([this, &indices, &statuses, &launched, slot, force_build] {
                launched[slot] = prepare_server(indices[slot], force_build, statuses[slot]);
            });
        }
        for (auto &worker : workers) {
            worker.join();
        }
    }

    std::vector<std::shared_ptr<ChildSession>> to_discover;
    std::vector<size_t> discover_slots;
    for (size_t slot = 0; slot < indices.size(); ++slot) {
        if (launched[slot]) {
            to_discover.push_back(launched[slot]);
            discover_slots.push_back(slot);
        }
    }

    DiscoveryReport report = discover_all(to_discover);

    {
        std::lock_guard<std::mutex> lock(servers_mutex_);
        size_t discovered_index = 0;
        for (size_t position = 0; position < discover_slots.size(); ++position) {
            size_t slot = discover_slots[position];
            ServerEntry &entry = servers_[indices[slot]];
            const DiscoveryStatus &discovery_status = report.statuses[position];
            statuses[slot] = discovery_status;

            if (discovery_status.success) {
                entry.last_tools = report.discovered[discovered_index++].tools;
                entry.has_tools = true;
                entry.state = ServerState::Ready;
                entry.last_error_kind = ErrorKind::None;
                entry.last_error.clear();
            } else {
                entry.last_tools.clear();
                entry.has_tools = false;
                entry.state = ServerState::Degraded;
                entry.last_error_kind = discovery_status.error_kind;
                entry.last_error = discovery_status.detail;
            }
        }
    }

    publish_catalog();

    mcp_tools::CatalogSnapshot snapshot = catalog();
    for (auto &status : statuses) {
        if (status.success) {
            status.tool_count = count_tools_from(*snapshot, status.server_name);
        }
        debug_log::info(status.server_name + ": " + status_label(status.error_kind) +
                        (status.success ? " (" + std::to_string(status.tool_count) + " tools)"
                                        : " (" + status.detail + ")"));
    }
    return statuses;
}

std::shared_ptr<ChildSession> ProxyCore::prepare_server(size_t index, bool force_build, DiscoveryStatus &status) {
    std::shared_ptr<ChildSession> previous;
    ServerSpec spec;
    {
        std::lock_guard<std::mutex> lock(servers_mutex_);
        ServerEntry &entry = servers_[index];
        previous = std::move(entry.session);
        entry.session.reset();
        entry.state = ServerState::NotBuilt;
        spec = entry.spec;
    }
    status.server_name = spec.name;

    // In-flight calls on the old session fail with ProcessExited.
    if (previous) {
        previous->shutdown();
        previous.reset();
    }

    bool needs_build = spec.has_build_command() && (force_build || !binary_present(spec));
    if (needs_build) {
        {
            std::lock_guard<std::mutex> lock(servers_mutex_);
            servers_[index].state = ServerState::Building;
        }
        BuildResult build_result = build(spec);
        if (!build_result.success) {
            std::lock_guard<std::mutex> lock(servers_mutex_);
            ServerEntry &entry = servers_[index];
            entry.state = ServerState::NotBuilt;
            entry.last_error_kind = ErrorKind::BuildError;
            entry.last_error = build_result.error_message;
            entry.last_tools.clear();
            entry.has_tools = false;
            status.error_kind = ErrorKind::BuildError;
            status.detail = build_result.error_message;
            return nullptr;
        }
    }

    auto session = std::make_shared<ChildSession>(spec);
    {
        std::lock_guard<std::mutex> lock(servers_mutex_);
        ServerEntry &entry = servers_[index];
        entry.state = ServerState::Built;
        entry.session = session;
    }

    LaunchResult launch_result = session->launch();
    if (!launch_result.success) {
        std::lock_guard<std::mutex> lock(servers_mutex_);
        ServerEntry &entry = servers_[index];
        entry.state = ServerState::Degraded;
        entry.last_error_kind = launch_result.error_kind;
        entry.last_error = launch_result.error_message;
        entry.last_tools.clear();
        entry.has_tools = false;
        status.error_kind = launch_result.error_kind;
        status.detail = launch_result.error_message;
        return nullptr;
    }
    return session;
}

void ProxyCore::publish_catalog() {
    std::vector<ServerTools> server_tools;
    uint64_t version = 0;
    {
        std::lock_guard<std::mutex> lock(servers_mutex_);
        for (const auto &entry : servers_) {
            if (!entry.has_tools) {
                continue;
            }
            ServerTools tools;
            tools.server_name = entry.spec.name;
            tools.enabled_tools = entry.spec.enabled_tools;
            tools.tools = entry.last_tools;
            server_tools.push_back(std::move(tools));
        }
        version = next_catalog_version_++;
    }

    mcp_tools::CatalogSnapshot merged = merge_catalog(server_tools, global_enabled_tools_, version);
    std::atomic_store(&catalog_, merged);
    debug_log::log("Published catalog v" + std::to_string(version));
}

ProxyCore::ServerEntry *ProxyCore::find_entry(const std::string &server_name) {
    for (auto &entry : servers_) {
        if (entry.spec.name == server_name) {
            return &entry;
        }
    }
    return nullptr;
}

const ProxyCore::ServerEntry *ProxyCore::find_entry(const std::string &server_name) const {
    for (const auto &entry : servers_) {
        if (entry.spec.name == server_name) {
            return &entry;
        }
    }
    return nullptr;
}

} // namespace proxy
