#include "Dispatcher.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace mcprt {

std::optional<BuiltinMethod> parse_builtin(const std::string& method) {
    static const std::map<std::string, BuiltinMethod> methods = {
        {"initialize", BuiltinMethod::Initialize},
        {"ping", BuiltinMethod::Ping},
        {"tools/list", BuiltinMethod::ToolsList},
        {"tools/call", BuiltinMethod::ToolsCall},
        {"resources/list", BuiltinMethod::ResourcesList},
        {"resources/read", BuiltinMethod::ResourcesRead},
        {"prompts/list", BuiltinMethod::PromptsList},
        {"prompts/get", BuiltinMethod::PromptsGet}
    };

    auto it = methods.find(method);
    if (it == methods.end()) {
        return std::nullopt;
    }
    return it->second;
}

Dispatcher::Dispatcher(Session& session, const ToolRegistry& registry, const Catalog& catalog)
    : session_(session), registry_(registry), catalog_(catalog) {
    notification_handlers_["notifications/initialized"] = [](const json&) {
        spdlog::info("Client sent initialized notification");
    };
    notification_handlers_["notifications/cancelled"] = [](const json& params) {
        // Requests run to completion one at a time, so there is never anything to cancel
        spdlog::debug("Ignoring cancellation: {}", params.dump());
    };
}

void Dispatcher::on_notification(const std::string& method, NotificationHandler handler) {
    if (!handler) {
        throw ConfigurationError("Notification handler cannot be null: " + method);
    }
    if (notification_handlers_.count(method) != 0) {
        throw ConfigurationError("Duplicate notification handler: " + method);
    }
    notification_handlers_[method] = std::move(handler);
}

std::optional<Response> Dispatcher::handle(const Message& message) {
    if (const auto* request = std::get_if<Request>(&message)) {
        return handle_request(*request);
    }
    if (const auto* notification = std::get_if<Notification>(&message)) {
        handle_notification(*notification);
        return std::nullopt;
    }

    const auto& reply = std::get<Response>(message);
    spdlog::warn("Dropping unsolicited response from host (id={})", id_to_string(reply.id()));
    return std::nullopt;
}

std::optional<Response> Dispatcher::handle_decode_failure(const DecodeFailure& failure) {
    if (!failure.salvaged_id) {
        spdlog::error("Dropping line without usable id: {}", failure.reason);
        return std::nullopt;
    }
    spdlog::error("Rejecting message id={}: {}", id_to_string(*failure.salvaged_id), failure.reason);
    return Response::failure(*failure.salvaged_id, failure.code, failure.reason);
}

void Dispatcher::handle_notification(const Notification& notification) {
    auto it = notification_handlers_.find(notification.method);
    if (it == notification_handlers_.end()) {
        spdlog::debug("Ignoring notification: {}", notification.method);
        return;
    }

    try {
        it->second(notification.params);
    } catch (const std::exception& e) {
        spdlog::error("Notification handler for {} failed: {}", notification.method, e.what());
    } catch (...) {
        spdlog::error("Notification handler for {} threw a non-standard exception", notification.method);
    }
}

Response Dispatcher::handle_request(const Request& request) {
    spdlog::debug("Handling request: method={}, id={}", request.method, id_to_string(request.id));

    auto builtin = parse_builtin(request.method);
    if (!builtin) {
        return Response::failure(request.id, error::MethodNotFound, "Method not found: " + request.method);
    }

    if (session_.is_closed()) {
        return Response::failure(request.id, error::InvalidRequest, "Session closed");
    }
    if (*builtin != BuiltinMethod::Initialize && !session_.is_ready()) {
        spdlog::warn("Rejecting {} before initialize", request.method);
        return Response::failure(request.id, error::InvalidRequest, "Server not initialized");
    }

    try {
        return dispatch_builtin(*builtin, request);
    } catch (const std::exception& e) {
        spdlog::error("Error handling method {} (id={}): {}", request.method, id_to_string(request.id), e.what());
        return Response::failure(request.id, error::InternalError, std::string("Internal error: ") + e.what());
    } catch (...) {
        spdlog::error("Unknown exception handling method {} (id={})", request.method, id_to_string(request.id));
        return Response::failure(request.id, error::InternalError, "Internal error: unknown exception");
    }
}

Response Dispatcher::dispatch_builtin(BuiltinMethod method, const Request& request) {
    switch (method) {
        case BuiltinMethod::Initialize: {
            json result = session_.initialize(request.params, Capabilities::derive(registry_, catalog_));
            Response response = Response::success(request.id, std::move(result));
            session_.complete_initialization();
            return response;
        }
        case BuiltinMethod::Ping:
            return Response::success(request.id, json::object());
        case BuiltinMethod::ToolsList:
            return Response::success(request.id, handle_tools_list());
        case BuiltinMethod::ToolsCall:
            return handle_tools_call(request);
        case BuiltinMethod::ResourcesList:
            return Response::success(request.id, handle_resources_list());
        case BuiltinMethod::ResourcesRead:
            return handle_resources_read(request);
        case BuiltinMethod::PromptsList:
            return Response::success(request.id, handle_prompts_list());
        case BuiltinMethod::PromptsGet:
            return handle_prompts_get(request);
    }
    throw std::logic_error("Unhandled built-in method: " + request.method);
}

json Dispatcher::handle_tools_list() const {
    json tools_array = json::array();
    for (const auto& descriptor : registry_.list()) {
        tools_array.push_back(json(descriptor));
    }

    spdlog::debug("Returning {} tools", tools_array.size());
    return {{"tools", tools_array}};
}

json Dispatcher::handle_resources_list() const {
    json resources_array = json::array();
    for (const auto& resource : catalog_.resources()) {
        resources_array.push_back(json(resource));
    }
    return {{"resources", resources_array}};
}

json Dispatcher::handle_prompts_list() const {
    json prompts_array = json::array();
    for (const auto& prompt : catalog_.prompts()) {
        prompts_array.push_back(json(prompt));
    }
    return {{"prompts", prompts_array}};
}

Response Dispatcher::handle_tools_call(const Request& request) {
    const json& params = request.params;
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
        return Response::failure(request.id, error::InvalidParams, "Missing required parameter: name");
    }

    std::string tool_name = params["name"].get<std::string>();
    json arguments = params.value("arguments", json::object());
    if (arguments.is_null()) {
        arguments = json::object();
    }
    if (!arguments.is_object()) {
        return Response::failure(request.id, error::InvalidParams, "arguments must be an object");
    }

    return from_result(request.id, registry_.invoke(tool_name, arguments));
}

Response Dispatcher::handle_resources_read(const Request& request) {
    const json& params = request.params;
    if (!params.is_object() || !params.contains("uri") || !params["uri"].is_string()) {
        return Response::failure(request.id, error::InvalidParams, "Missing required parameter: uri");
    }
    return from_result(request.id, catalog_.read_resource(params["uri"].get<std::string>()));
}

Response Dispatcher::handle_prompts_get(const Request& request) {
    const json& params = request.params;
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
        return Response::failure(request.id, error::InvalidParams, "Missing required parameter: name");
    }

    json arguments = params.value("arguments", json::object());
    if (arguments.is_null()) {
        arguments = json::object();
    }
    if (!arguments.is_object()) {
        return Response::failure(request.id, error::InvalidParams, "arguments must be an object");
    }
    return from_result(request.id, catalog_.get_prompt(params["name"].get<std::string>(), arguments));
}

Response Dispatcher::from_result(const RequestId& id, ToolResult result) const {
    if (!result) {
        const ToolError& err = result.error();
        return Response::failure(id, ErrorObject{err.code, err.message, err.data});
    }
    return Response::success(id, std::move(*result));
}

} // namespace mcprt
