#ifndef MCPROXY_PROXY_CORE_HPP
#define MCPROXY_PROXY_CORE_HPP

// Composition root: owns every child session and the published catalog, and
// drives startup, rebuild and shutdown.
//
// The catalog is an immutable snapshot behind one shared_ptr. Readers load it
// atomically and never lock; a rebuild publishes a complete new snapshot only
// after the merge finishes, so a concurrent tools/list sees either the old or
// the new catalog in full.

#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "mcp/mcp_tools.hpp"
#include "proxy/catalog_merger.hpp"
#include "proxy/child_session.hpp"
#include "proxy/error_kind.hpp"
#include "proxy/server_spec.hpp"

namespace proxy {

// Operator-facing view of one declared server.
struct ServerStatus {
    std::string server_name;
    ServerState state = ServerState::NotBuilt;
    ErrorKind last_error_kind = ErrorKind::None;
    std::string last_error;
    size_t tool_count = 0;
};

class ProxyCore {
public:
    ProxyCore(std::vector<ServerSpec> specs, std::set<std::string> global_enabled_tools);
    ~ProxyCore();

    ProxyCore(const ProxyCore &) = delete;
    ProxyCore &operator=(const ProxyCore &) = delete;

    // Build (only servers whose binary is missing), launch and discover every
    // server, then publish the catalog. Per-server failures are isolated and
    // reported in the returned statuses.
    std::vector<DiscoveryStatus> start();

    // Shut down the live session of server_name, rerun its build, relaunch,
    // rediscover and publish a new catalog. Usable from any state.
    DiscoveryStatus rebuild(const std::string &server_name);

    // rebuild() for every server at once; each result is independent.
    std::vector<DiscoveryStatus> rebuild_all();

    // Stop every session. Idempotent.
    void shutdown();

    // Current published catalog; never null.
    mcp_tools::CatalogSnapshot catalog() const;

    // The live session of server_name, or nullptr. Callers hold it only for
    // the duration of one request; a rebuild replaces it.
    std::shared_ptr<ChildSession> session_for(const std::string &server_name) const;

    std::vector<ServerStatus> server_statuses() const;
    ServerState server_state(const std::string &server_name) const;

private:
    struct ServerEntry {
        ServerSpec spec;
        std::shared_ptr<ChildSession> session;
        ServerState state = ServerState::NotBuilt;  // used while there is no session
        ErrorKind last_error_kind = ErrorKind::None;
        std::string last_error;
        std::vector<RemoteTool> last_tools;
        bool has_tools = false;
    };

    std::vector<DiscoveryStatus> bring_up(const std::vector<size_t> &indices, bool force_build);
    std::shared_ptr<ChildSession> prepare_server(size_t index, bool force_build, DiscoveryStatus &status);
    void publish_catalog();
    ServerEntry *find_entry(const std::string &server_name);
    const ServerEntry *find_entry(const std::string &server_name) const;

    std::set<std::string> global_enabled_tools_;

    // Guards servers_ contents (sessions, states, cached tool lists).
    mutable std::mutex servers_mutex_;
    std::vector<ServerEntry> servers_;

    // Serializes start, rebuild and shutdown against each other.
    std::mutex lifecycle_mutex_;

    // Accessed only through std::atomic_load / std::atomic_store.
    mcp_tools::CatalogSnapshot catalog_;
    uint64_t next_catalog_version_ = 1;
};

} // namespace proxy

#endif // MCPROXY_PROXY_CORE_HPP
