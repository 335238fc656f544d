#pragma once

#include "mcp/ToolRegistry.hpp"

namespace mcprt {

/**
 * @brief MCP tool that returns its arguments unchanged
 *
 * Handy for checking a host integration end to end.
 */
class EchoTool {
public:
    /**
     * @brief Get tool metadata and JSON schema
     * @return ToolDescriptor with name, description, and input schema
     */
    static ToolDescriptor get_info();

    /**
     * @brief Execute tool with arguments
     * @param args JSON object with "text" parameter
     * @return The arguments object
     */
    ToolResult execute(const json& args) const;
};

} // namespace mcprt
