#ifndef MCPROXY_CATALOG_MERGER_HPP
#define MCPROXY_CATALOG_MERGER_HPP

// Discovery across child sessions and merging of their tool lists into one
// catalog with globally unique names.
//
// Qualification: a tool keeps its bare local name when no other surviving
// tool shares it; otherwise it becomes "<server>.<local>". The rule runs once
// over all servers after every server has reported, so a late collision can
// never leave an earlier bare name dangling.

#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "mcp/mcp_tools.hpp"
#include "proxy/child_session.hpp"
#include "proxy/error_kind.hpp"

namespace proxy {

// The unfiltered tool list one server reported, with its own allow-list.
struct ServerTools {
    std::string server_name;
    std::set<std::string> enabled_tools;
    std::vector<RemoteTool> tools;
};

// Outcome of bringing one server to Ready, as shown to the operator.
struct DiscoveryStatus {
    std::string server_name;
    bool success = false;
    ErrorKind error_kind = ErrorKind::None;
    std::string detail;
    size_t tool_count = 0;  // tools that made it into the catalog
};

// "success", "build-failed", "launch-failed", "discovery-timeout", ...
std::string status_label(ErrorKind kind);

struct DiscoveryReport {
    std::vector<ServerTools> discovered;     // successful servers only
    std::vector<DiscoveryStatus> statuses;   // one per queried session, same order
};

// Query every session concurrently, each bounded by its own discovery
// timeout. One server's failure or hang never delays another's result.
DiscoveryReport discover_all(const std::vector<std::shared_ptr<ChildSession>> &sessions);

// True when local_name passes both the server's allow-list and the global
// one. Global entries may name a tool bare or as "<server>.<local>".
bool is_tool_enabled(const std::string &server_name, const std::string &local_name,
                     const std::set<std::string> &server_enabled_tools,
                     const std::set<std::string> &global_enabled_tools);

// Filter and qualify. Servers appear in the catalog in no particular order;
// lookups go by qualified name.
mcp_tools::CatalogSnapshot merge_catalog(const std::vector<ServerTools> &server_tools,
                                         const std::set<std::string> &global_enabled_tools,
                                         uint64_t version);

// Number of catalog entries that came from server_name.
size_t count_tools_from(const mcp_tools::MergedCatalog &catalog, const std::string &server_name);

} // namespace proxy

#endif // MCPROXY_CATALOG_MERGER_HPP
