#ifndef MCPROXY_MCP_TOOLS_HPP
#define MCPROXY_MCP_TOOLS_HPP

// The merged tool catalog exposed to the caller: an immutable snapshot keyed
// by qualified name, plus the MCP payload builders that render it.

#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <memory>
#include <string>

namespace mcp_tools {

using json = nlohmann::json;

// One tool of the merged catalog.
struct ToolDescriptor {
    std::string origin_server;
    std::string local_name;      // as reported by the child
    std::string qualified_name;  // unique across the catalog
    std::string description;
    json input_schema;           // opaque, passed through as-is
};

// Snapshot of the whole catalog. Never mutated after it is published.
struct MergedCatalog {
    std::map<std::string, ToolDescriptor> tools;
    uint64_t version = 0;

    // Returns nullptr if qualified_name is not in the catalog.
    const ToolDescriptor *find(const std::string &qualified_name) const;
};

using CatalogSnapshot = std::shared_ptr<const MergedCatalog>;

// Build the response payload for tools/list. Origins are not exposed.
json build_tools_list_response(const MergedCatalog &catalog);

} // namespace mcp_tools

#endif // MCPROXY_MCP_TOOLS_HPP
