#include "core/Logging.hpp"
#include "mcp/MCPServer.hpp"
#include "mcp/StdioTransport.hpp"
#include "tools/EchoTool.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <csignal>
#include <iostream>
#include <memory>

namespace {
    mcprt::MCPServer* global_server = nullptr;

    void signal_handler(int) {
        if (global_server) {
            global_server->stop();
        }
    }

    void setup_signal_handlers() {
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);
    }
}

int main(int argc, char** argv) {
    CLI::App app{"MCP Stdio Server - JSON-RPC 2.0 tool host over stdin/stdout"};

    std::string log_level = "info";
    app.add_option("-l,--log-level", log_level, "Log level (trace, debug, info, warn, error, critical, off)")
        ->default_val("info");

    mcprt::ServerInfo info;
    app.add_option("--name", info.name, "Server name reported during initialize")
        ->default_val(info.name);
    app.add_option("--server-version", info.version, "Server version reported during initialize")
        ->default_val(info.version);

    std::string instructions;
    app.add_option("--instructions", instructions, "Usage instructions sent to the host during initialize");

    bool echo = false;
    app.add_flag("--echo", echo, "Register the echo tool");

    bool version = false;
    app.add_flag("-v,--version", version, "Print version information");

    CLI11_PARSE(app, argc, argv);

    if (version) {
        std::cout << info.name << " version " << info.version << std::endl;
        return 0;
    }

    auto level = mcprt::parse_log_level(log_level);
    if (!level) {
        std::cerr << "Invalid log level: " << log_level << std::endl;
        return 1;
    }
    mcprt::init_logging(*level);

    if (!instructions.empty()) {
        info.instructions = instructions;
    }

    spdlog::info("Starting MCP Stdio Server");
    spdlog::info("Log level: {}", log_level);

    std::unique_ptr<mcprt::MCPServer> server;
    try {
        auto transport = std::make_shared<mcprt::StdioTransport>();
        server = std::make_unique<mcprt::MCPServer>(std::move(transport), info);

        if (echo) {
            auto echo_tool = std::make_shared<mcprt::EchoTool>();
            server->register_tool(
                mcprt::EchoTool::get_info(),
                [echo_tool](const nlohmann::json& args) {
                    return echo_tool->execute(args);
                }
            );
        }
    } catch (const mcprt::ConfigurationError& e) {
        spdlog::critical("Configuration error: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error during startup: {}", e.what());
        return 1;
    }

    spdlog::info("All tools registered, starting server");

    global_server = server.get();
    setup_signal_handlers();

    int code = server->run();

    global_server = nullptr;
    spdlog::info("Server stopped cleanly");
    return code;
}
