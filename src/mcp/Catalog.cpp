#include "Catalog.hpp"
#include <spdlog/spdlog.h>

namespace mcprt {

void to_json(json& j, const ResourceDescriptor& resource) {
    j = {
        {"uri", resource.uri},
        {"name", resource.name}
    };
    if (!resource.description.empty()) {
        j["description"] = resource.description;
    }
    if (resource.mime_type) {
        j["mimeType"] = *resource.mime_type;
    }
}

void to_json(json& j, const PromptDescriptor& prompt) {
    json arguments = json::array();
    for (const auto& arg : prompt.arguments) {
        arguments.push_back({
            {"name", arg.name},
            {"description", arg.description},
            {"required", arg.required}
        });
    }
    j = {
        {"name", prompt.name},
        {"description", prompt.description},
        {"arguments", arguments}
    };
}

void Catalog::add_resource(ResourceDescriptor resource, ResourceReader reader) {
    if (resource.uri.empty()) {
        throw ConfigurationError("Resource uri cannot be empty");
    }
    if (!reader) {
        throw ConfigurationError("Resource reader cannot be null: " + resource.uri);
    }
    if (resources_.count(resource.uri) != 0) {
        throw ConfigurationError("Duplicate resource uri: " + resource.uri);
    }
    spdlog::info("Registered resource: {}", resource.uri);
    std::string uri = resource.uri;
    resources_.emplace(uri, ResourceEntry{std::move(resource), std::move(reader)});
}

void Catalog::add_prompt(PromptDescriptor prompt, PromptRenderer renderer) {
    if (prompt.name.empty()) {
        throw ConfigurationError("Prompt name cannot be empty");
    }
    if (!renderer) {
        throw ConfigurationError("Prompt renderer cannot be null: " + prompt.name);
    }
    if (prompts_.count(prompt.name) != 0) {
        throw ConfigurationError("Duplicate prompt name: " + prompt.name);
    }
    spdlog::info("Registered prompt: {}", prompt.name);
    std::string name = prompt.name;
    prompts_.emplace(name, PromptEntry{std::move(prompt), std::move(renderer)});
}

std::vector<ResourceDescriptor> Catalog::resources() const {
    std::vector<ResourceDescriptor> result;
    for (const auto& [uri, entry] : resources_) {
        result.push_back(entry.descriptor);
    }
    return result;
}

std::vector<PromptDescriptor> Catalog::prompts() const {
    std::vector<PromptDescriptor> result;
    for (const auto& [name, entry] : prompts_) {
        result.push_back(entry.descriptor);
    }
    return result;
}

ToolResult Catalog::read_resource(const std::string& uri) const {
    auto it = resources_.find(uri);
    if (it == resources_.end()) {
        spdlog::warn("Read of unknown resource: {}", uri);
        return tl::unexpected(ToolError{error::InvalidParams, "Resource not found: " + uri});
    }

    const ResourceEntry& entry = it->second;
    try {
        auto text = entry.reader();
        if (!text) {
            spdlog::info("Resource {} could not be read: {}", uri, text.error().message);
            return tl::unexpected(text.error());
        }

        json content = {{"uri", uri}};
        if (entry.descriptor.mime_type) {
            content["mimeType"] = *entry.descriptor.mime_type;
        }
        content["text"] = std::move(*text);
        return json{{"contents", json::array({content})}};
    } catch (const std::exception& e) {
        spdlog::error("Resource reader for {} threw: {}", uri, e.what());
        return tl::unexpected(ToolError{error::InternalError, std::string("Internal error: ") + e.what()});
    } catch (...) {
        spdlog::error("Resource reader for {} threw a non-standard exception", uri);
        return tl::unexpected(ToolError{error::InternalError, "Internal error: unknown exception"});
    }
}

ToolResult Catalog::get_prompt(const std::string& name, const json& args) const {
    auto it = prompts_.find(name);
    if (it == prompts_.end()) {
        spdlog::warn("Request for unknown prompt: {}", name);
        return tl::unexpected(ToolError{error::InvalidParams, "Prompt not found: " + name});
    }

    const PromptEntry& entry = it->second;
    for (const auto& arg : entry.descriptor.arguments) {
        if (arg.required && !args.contains(arg.name)) {
            return tl::unexpected(ToolError{error::InvalidParams, "Missing required argument: " + arg.name});
        }
    }

    try {
        ToolResult messages = entry.renderer(args);
        if (!messages) {
            spdlog::info("Prompt {} failed: {}", name, messages.error().message);
            return messages;
        }
        if (!messages->is_array()) {
            spdlog::error("Prompt {} rendered {} instead of a message array", name, messages->type_name());
            return tl::unexpected(ToolError{error::InternalError, "Internal error: prompt did not render messages"});
        }
        return json{
            {"description", entry.descriptor.description},
            {"messages", std::move(*messages)}
        };
    } catch (const std::exception& e) {
        spdlog::error("Prompt {} threw with args {}: {}", name, args.dump(), e.what());
        return tl::unexpected(ToolError{error::InternalError, std::string("Internal error: ") + e.what()});
    } catch (...) {
        spdlog::error("Prompt {} threw a non-standard exception", name);
        return tl::unexpected(ToolError{error::InternalError, "Internal error: unknown exception"});
    }
}

} // namespace mcprt
