#pragma once

#include "Catalog.hpp"
#include "FrameCodec.hpp"
#include "Session.hpp"
#include "ToolRegistry.hpp"
#include "protocol/Message.hpp"
#include <functional>
#include <map>
#include <optional>
#include <string>

namespace mcprt {

/**
 * @brief Methods the runtime answers itself
 *
 * Closed set: anything else is either "Method not found" or reaches a
 * tool through tools/call.
 */
enum class BuiltinMethod {
    Initialize,
    Ping,
    ToolsList,
    ToolsCall,
    ResourcesList,
    ResourcesRead,
    PromptsList,
    PromptsGet
};

std::optional<BuiltinMethod> parse_builtin(const std::string& method);

/**
 * @brief Side effect run for an incoming notification
 */
using NotificationHandler = std::function<void(const json& params)>;

/**
 * @brief Routes decoded messages and builds protocol-valid responses
 *
 * Requests get exactly one Response with the request's id; notifications
 * and host replies get none. Nothing thrown below this boundary escapes
 * handle().
 */
class Dispatcher {
public:
    /**
     * @param session Handshake state machine for this connection
     * @param registry Tools, read-only from here on
     * @param catalog Resources and prompts, read-only from here on
     */
    Dispatcher(Session& session, const ToolRegistry& registry, const Catalog& catalog);

    /**
     * @brief Register a side effect for a notification method
     * @throws ConfigurationError if the method already has a handler
     */
    void on_notification(const std::string& method, NotificationHandler handler);

    /**
     * @brief Handle one decoded message
     * @return Response for requests, std::nullopt for notifications and replies
     */
    std::optional<Response> handle(const Message& message);

    /**
     * @brief Turn a decode failure into a response when an id was salvaged
     * @return Error response, or std::nullopt when the line must be dropped
     */
    std::optional<Response> handle_decode_failure(const DecodeFailure& failure);

private:
    Response handle_request(const Request& request);
    Response dispatch_builtin(BuiltinMethod method, const Request& request);
    void handle_notification(const Notification& notification);

    json handle_tools_list() const;
    json handle_resources_list() const;
    json handle_prompts_list() const;
    Response handle_tools_call(const Request& request);
    Response handle_resources_read(const Request& request);
    Response handle_prompts_get(const Request& request);
    Response from_result(const RequestId& id, ToolResult result) const;

    Session& session_;
    const ToolRegistry& registry_;
    const Catalog& catalog_;
    std::map<std::string, NotificationHandler> notification_handlers_;
};

} // namespace mcprt
