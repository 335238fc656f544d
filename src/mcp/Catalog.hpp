#pragma once

#include "protocol/Error.hpp"
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcprt {

using json = nlohmann::json;

struct ResourceDescriptor {
    std::string uri;
    std::string name;
    std::string description;
    std::optional<std::string> mime_type;
};

struct PromptArgument {
    std::string name;
    std::string description;
    bool required = false;
};

struct PromptDescriptor {
    std::string name;
    std::string description;
    std::vector<PromptArgument> arguments;
};

void to_json(json& j, const ResourceDescriptor& resource);
void to_json(json& j, const PromptDescriptor& prompt);

/**
 * @brief Produces the text content of a resource
 */
using ResourceReader = std::function<tl::expected<std::string, ToolError>()>;

/**
 * @brief Renders a prompt into its message list
 * @param args Prompt arguments, all required ones present
 * @return JSON array of {"role", "content"} messages, or ToolError
 */
using PromptRenderer = std::function<ToolResult(const json& args)>;

/**
 * @brief Resources and prompts a deployment serves
 *
 * Filled at startup alongside the ToolRegistry and read-only afterwards.
 * Every entry carries the handler that serves it, so anything listed can
 * also be read or rendered. Listing an empty catalog yields empty arrays.
 */
class Catalog {
public:
    /// @throws ConfigurationError on empty or duplicate uri, or null reader
    void add_resource(ResourceDescriptor resource, ResourceReader reader);

    /// @throws ConfigurationError on empty or duplicate name, or null renderer
    void add_prompt(PromptDescriptor prompt, PromptRenderer renderer);

    std::vector<ResourceDescriptor> resources() const;
    std::vector<PromptDescriptor> prompts() const;

    /**
     * @brief Result body for resources/read
     *
     * Never throws. Unknown uri yields InvalidParams, reader exceptions
     * InternalError.
     */
    ToolResult read_resource(const std::string& uri) const;

    /**
     * @brief Result body for prompts/get
     *
     * Never throws. Unknown prompt or missing required argument yields
     * InvalidParams, renderer exceptions InternalError.
     */
    ToolResult get_prompt(const std::string& name, const json& args) const;

    bool has_resources() const { return !resources_.empty(); }
    bool has_prompts() const { return !prompts_.empty(); }

private:
    struct ResourceEntry {
        ResourceDescriptor descriptor;
        ResourceReader reader;
    };

    struct PromptEntry {
        PromptDescriptor descriptor;
        PromptRenderer renderer;
    };

    std::map<std::string, ResourceEntry> resources_;
    std::map<std::string, PromptEntry> prompts_;
};

} // namespace mcprt
