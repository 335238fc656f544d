#pragma once

#include "Catalog.hpp"
#include "Dispatcher.hpp"
#include "ITransport.hpp"
#include "Session.hpp"
#include "ToolRegistry.hpp"
#include "TransportLoop.hpp"
#include <atomic>
#include <memory>
#include <string>

namespace mcprt {

/**
 * @brief MCP server over a line transport
 *
 * Owns the registry, catalog, session and dispatcher for one host
 * connection. Everything is registered before run(); registration after
 * the loop has started is rejected.
 */
class MCPServer {
public:
    /**
     * @brief Construct MCP server with transport
     * @param transport Transport implementation
     * @param info Identity reported during the handshake
     */
    explicit MCPServer(std::shared_ptr<ITransport> transport, ServerInfo info = {});

    /**
     * @brief Register a tool with handler
     * @param descriptor Tool metadata with JSON schema
     * @param handler Function to execute when tool is called
     * @throws ConfigurationError on duplicate name, malformed schema, or after run()
     */
    void register_tool(ToolDescriptor descriptor, ToolHandler handler);

    /// @throws ConfigurationError on duplicate uri, null reader or after run()
    void add_resource(ResourceDescriptor resource, ResourceReader reader);

    /// @throws ConfigurationError on duplicate name, null renderer or after run()
    void add_prompt(PromptDescriptor prompt, PromptRenderer renderer);

    /// @throws ConfigurationError on duplicate method or after run()
    void on_notification(const std::string& method, NotificationHandler handler);

    /**
     * @brief Start server main loop
     *
     * Blocks until stop() is called or the input stream closes.
     *
     * @return Process exit code
     */
    int run();

    /**
     * @brief Signal server to stop gracefully (signal-handler safe)
     */
    void stop();

    const Session& session() const { return session_; }
    const ToolRegistry& registry() const { return registry_; }

private:
    void ensure_not_started(const char* what) const;

    ToolRegistry registry_;
    Catalog catalog_;
    Session session_;
    Dispatcher dispatcher_;
    TransportLoop loop_;
    std::atomic<bool> started_{false};
};

} // namespace mcprt
