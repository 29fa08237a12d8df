#include "mcp/mcp_tools.hpp"

namespace mcp_tools {

const ToolDescriptor *MergedCatalog::find(const std::string &qualified_name) const {
    auto tool_iterator = tools.find(qualified_name);
    if (tool_iterator == tools.end()) {
        return nullptr;
    }
    return &tool_iterator->second;
}

json build_tools_list_response(const MergedCatalog &catalog) {
    json tools_array = json::array();
    for (const auto &entry : catalog.tools) {
        const ToolDescriptor &tool = entry.second;
        json tool_entry;
        tool_entry["name"] = tool.qualified_name;
        if (!tool.description.empty()) {
            tool_entry["description"] = tool.description;
        }
        tool_entry["inputSchema"] = tool.input_schema;
        tools_array.push_back(tool_entry);
    }

    json result;
    result["tools"] = tools_array;
    return result;
}

} // namespace mcp_tools
