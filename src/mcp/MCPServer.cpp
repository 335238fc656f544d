#include "MCPServer.hpp"
#include <spdlog/spdlog.h>

namespace mcprt {

MCPServer::MCPServer(std::shared_ptr<ITransport> transport, ServerInfo info)
    : session_(std::move(info)),
      dispatcher_(session_, registry_, catalog_),
      loop_(std::move(transport), dispatcher_, session_) {
    spdlog::info("MCPServer initialized: {} {}", session_.server_info().name, session_.server_info().version);
}

void MCPServer::ensure_not_started(const char* what) const {
    if (started_) {
        throw ConfigurationError(std::string("Cannot ") + what + " after the server has started");
    }
}

void MCPServer::register_tool(ToolDescriptor descriptor, ToolHandler handler) {
    ensure_not_started("register a tool");
    registry_.register_tool(std::move(descriptor), std::move(handler));
}

void MCPServer::add_resource(ResourceDescriptor resource, ResourceReader reader) {
    ensure_not_started("add a resource");
    catalog_.add_resource(std::move(resource), std::move(reader));
}

void MCPServer::add_prompt(PromptDescriptor prompt, PromptRenderer renderer) {
    ensure_not_started("add a prompt");
    catalog_.add_prompt(std::move(prompt), std::move(renderer));
}

void MCPServer::on_notification(const std::string& method, NotificationHandler handler) {
    ensure_not_started("add a notification handler");
    dispatcher_.on_notification(method, std::move(handler));
}

int MCPServer::run() {
    started_ = true;
    spdlog::info("MCPServer starting main loop with {} tools", registry_.size());
    int code = loop_.run();
    spdlog::info("MCPServer stopped");
    return code;
}

void MCPServer::stop() {
    loop_.stop();
}

} // namespace mcprt
