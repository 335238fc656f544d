#pragma once

#include "protocol/Error.hpp"
#include <functional>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcprt {

using json = nlohmann::json;

/**
 * @brief Metadata for an MCP tool
 */
struct ToolDescriptor {
    std::string name;
    std::string description;
    json input_schema;  // JSON Schema for tool arguments
};

void to_json(json& j, const ToolDescriptor& descriptor);

/**
 * @brief Function signature for tool execution
 * @param args JSON object with arguments already validated against the schema
 * @return Tool payload, or ToolError describing the failure
 */
using ToolHandler = std::function<ToolResult(const json& args)>;

/**
 * @brief Immutable-after-startup mapping from tool name to schema and handler
 *
 * Populated once before the transport starts and only read afterwards, so
 * it needs no locking.
 */
class ToolRegistry {
public:
    /**
     * @brief Register a tool with handler
     * @param descriptor Tool metadata with JSON schema
     * @param handler Function to execute when tool is called
     * @throws ConfigurationError on empty/duplicate name, null handler or malformed schema
     */
    void register_tool(ToolDescriptor descriptor, ToolHandler handler);

    /**
     * @brief All registered tools, ordered by name
     */
    std::vector<ToolDescriptor> list() const;

    /**
     * @brief Validate arguments and run the named tool
     *
     * Never throws. Unknown tools yield MethodNotFound, schema violations
     * InvalidParams, handler exceptions InternalError; handler-reported
     * failures are passed through unchanged.
     *
     * @param name Tool name
     * @param args Arguments object from tools/call
     */
    ToolResult invoke(const std::string& name, const json& args) const;

    bool contains(const std::string& name) const;
    bool empty() const { return tools_.empty(); }
    size_t size() const { return tools_.size(); }

private:
    struct Entry {
        ToolDescriptor descriptor;
        ToolHandler handler;
    };

    std::map<std::string, Entry> tools_;
};

} // namespace mcprt
