#pragma once

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>
#include <optional>
#include <stdexcept>
#include <string>

namespace mcprt {

using json = nlohmann::json;

/**
 * @brief JSON-RPC 2.0 error codes used by the runtime
 *
 * The -32000..-32099 range is reserved for domain (tool) failures.
 */
namespace error {
    constexpr int ParseError         = -32700;
    constexpr int InvalidRequest     = -32600;
    constexpr int MethodNotFound     = -32601;
    constexpr int InvalidParams      = -32602;
    constexpr int InternalError      = -32603;
    constexpr int ToolExecutionError = -32000;
    constexpr int ToolTimeout        = -32001;
} // namespace error

/**
 * @brief Startup-time configuration failure (duplicate tool, bad schema, ...)
 *
 * Thrown only while the server is being assembled; the entry point turns it
 * into exit code 1.
 */
class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Typed failure reported by a tool handler or by the registry
 */
struct ToolError {
    int code = error::ToolExecutionError;
    std::string message;
    std::optional<json> data;

    ToolError() = default;
    ToolError(std::string message)
        : message(std::move(message)) {}
    ToolError(int code, std::string message, std::optional<json> data = std::nullopt)
        : code(code), message(std::move(message)), data(std::move(data)) {}

    static ToolError timeout(const std::string& what) {
        return {error::ToolTimeout, what};
    }
};

/**
 * @brief Outcome of a tool invocation: payload on success, ToolError otherwise
 */
using ToolResult = tl::expected<json, ToolError>;

} // namespace mcprt
