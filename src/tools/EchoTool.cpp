#include "EchoTool.hpp"
#include <spdlog/spdlog.h>

namespace mcprt {

ToolDescriptor EchoTool::get_info() {
    return {
        "echo",
        "Return the given arguments unchanged",
        {
            {"type", "object"},
            {"properties", {
                {"text", {
                    {"type", "string"},
                    {"description", "Text to send back"}
                }}
            }},
            {"required", json::array({"text"})}
        }
    };
}

ToolResult EchoTool::execute(const json& args) const {
    spdlog::debug("EchoTool: echoing {}", args.dump());
    return args;
}

} // namespace mcprt
