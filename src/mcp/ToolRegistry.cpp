#include "ToolRegistry.hpp"
#include "SchemaValidator.hpp"
#include <spdlog/spdlog.h>

namespace mcprt {

void to_json(json& j, const ToolDescriptor& descriptor) {
    j = {
        {"name", descriptor.name},
        {"description", descriptor.description},
        {"inputSchema", descriptor.input_schema}
    };
}

void ToolRegistry::register_tool(ToolDescriptor descriptor, ToolHandler handler) {
    if (descriptor.name.empty()) {
        throw ConfigurationError("Tool name cannot be empty");
    }
    if (!handler) {
        throw ConfigurationError("Tool handler cannot be null: " + descriptor.name);
    }
    if (tools_.count(descriptor.name) != 0) {
        throw ConfigurationError("Duplicate tool name: " + descriptor.name);
    }

    if (descriptor.input_schema.is_null()) {
        descriptor.input_schema = {{"type", "object"}};
    }
    std::string schema_error = SchemaValidator::check_schema(descriptor.input_schema);
    if (!schema_error.empty()) {
        throw ConfigurationError("Malformed schema for tool " + descriptor.name + ": " + schema_error);
    }

    std::string name = descriptor.name;
    tools_.emplace(name, Entry{std::move(descriptor), std::move(handler)});
    spdlog::info("Registered tool: {}", name);
}

std::vector<ToolDescriptor> ToolRegistry::list() const {
    std::vector<ToolDescriptor> result;
    result.reserve(tools_.size());
    for (const auto& [name, entry] : tools_) {
        result.push_back(entry.descriptor);
    }
    return result;
}

bool ToolRegistry::contains(const std::string& name) const {
    return tools_.count(name) != 0;
}

ToolResult ToolRegistry::invoke(const std::string& name, const json& args) const {
    auto it = tools_.find(name);
    if (it == tools_.end()) {
        spdlog::warn("Call to unknown tool: {}", name);
        return tl::unexpected(ToolError{error::MethodNotFound, "Tool not found: " + name});
    }

    const Entry& entry = it->second;

    try {
        std::string validation_error = SchemaValidator::validate(args, entry.descriptor.input_schema);
        if (!validation_error.empty()) {
            spdlog::debug("Rejected arguments for {}: {}", name, validation_error);
            return tl::unexpected(ToolError{error::InvalidParams, "Invalid params: " + validation_error});
        }

        spdlog::debug("Calling tool: {} with args: {}", name, args.dump());
        ToolResult result = entry.handler(args);
        if (!result) {
            spdlog::info("Tool {} failed: {}", name, result.error().message);
        }
        return result;
    } catch (const std::exception& e) {
        spdlog::error("Tool {} threw with args {}: {}", name, args.dump(), e.what());
        return tl::unexpected(ToolError{error::InternalError, std::string("Internal error: ") + e.what()});
    } catch (...) {
        spdlog::error("Tool {} threw a non-standard exception with args {}", name, args.dump());
        return tl::unexpected(ToolError{error::InternalError, "Internal error: unknown exception"});
    }
}

} // namespace mcprt
