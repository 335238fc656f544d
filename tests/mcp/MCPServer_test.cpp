#include "mcp/MCPServer.hpp"
#include "MockTransport.hpp"
#include <gtest/gtest.h>
#include <thread>

using namespace mcprt;
using json = nlohmann::json;

class MCPServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        transport = std::make_shared<MockTransport>();
        server = std::make_unique<MCPServer>(transport);
    }

    void push(int64_t id, const std::string& method, json params = json::object()) {
        transport->push_request({
            {"jsonrpc", "2.0"},
            {"id", id},
            {"method", method},
            {"params", std::move(params)}
        });
    }

    void push_initialize() {
        push(0, "initialize", {{"protocolVersion", "2024-11-05"}, {"clientInfo", {{"name", "test"}}}});
    }

    int run() {
        transport->close();
        return server->run();
    }

    std::shared_ptr<MockTransport> transport;
    std::unique_ptr<MCPServer> server;
};

TEST_F(MCPServerTest, ToolsListEmpty) {
    push_initialize();
    push(1, "tools/list");

    EXPECT_EQ(run(), 0);

    transport->pop_response();
    ASSERT_TRUE(transport->has_responses());
    json response = transport->pop_response();

    EXPECT_EQ(response["jsonrpc"], "2.0");
    EXPECT_EQ(response["id"], 1);
    EXPECT_TRUE(response.contains("result"));
    EXPECT_TRUE(response["result"]["tools"].is_array());
    EXPECT_EQ(response["result"]["tools"].size(), 0);
}

TEST_F(MCPServerTest, RegisterAndCallTool) {
    ToolDescriptor info{
        "test_tool",
        "A test tool",
        {
            {"type", "object"},
            {"properties", {
                {"input", {{"type", "string"}}}
            }}
        }
    };

    bool tool_called = false;
    server->register_tool(info, [&tool_called](const json& args) -> ToolResult {
        tool_called = true;
        return json{{"result", "success"}, {"input", args["input"]}};
    });

    push_initialize();
    push(2, "tools/call", {{"name", "test_tool"}, {"arguments", {{"input", "test_value"}}}});
    run();

    EXPECT_TRUE(tool_called);

    transport->pop_response();
    json response = transport->pop_response();
    EXPECT_EQ(response["id"], 2);
    EXPECT_EQ(response["result"]["result"], "success");
    EXPECT_EQ(response["result"]["input"], "test_value");
}

TEST_F(MCPServerTest, InitializeAdvertisesRegisteredFeatures) {
    server->register_tool({"noop", "Does nothing", {{"type", "object"}}},
                          [](const json&) -> ToolResult { return json::object(); });
    server->add_prompt({"greet", "Greets someone", {{"name", "Who to greet", true}}},
                       [](const json& args) -> ToolResult {
                           return json::array({{{"role", "user"},
                                                {"content", {{"type", "text"},
                                                             {"text", "Say hello to " + args.at("name").get<std::string>()}}}}});
                       });

    push_initialize();
    run();

    json result = transport->pop_response()["result"];
    EXPECT_EQ(result["protocolVersion"], "2024-11-05");
    EXPECT_EQ(result["serverInfo"]["name"], "mcp-stdio-server");
    EXPECT_TRUE(result["capabilities"].contains("tools"));
    EXPECT_TRUE(result["capabilities"].contains("prompts"));
    EXPECT_FALSE(result["capabilities"].contains("resources"));
}

TEST_F(MCPServerTest, AdvertisedResourcesCanBeRead) {
    server->add_resource({"notes://today", "today", "Today's notes", std::string("text/plain")},
                         []() -> tl::expected<std::string, ToolError> { return std::string("buy milk"); });

    push_initialize();
    push(5, "resources/list");
    push(6, "resources/read", {{"uri", "notes://today"}});
    run();

    json init = transport->pop_response()["result"];
    EXPECT_TRUE(init["capabilities"].contains("resources"));
    EXPECT_EQ(transport->pop_response()["result"]["resources"][0]["uri"], "notes://today");

    json read = transport->pop_response();
    EXPECT_EQ(read["id"], 6);
    ASSERT_TRUE(read.contains("result"));
    EXPECT_EQ(read["result"]["contents"][0]["text"], "buy milk");
    EXPECT_EQ(read["result"]["contents"][0]["mimeType"], "text/plain");
}

TEST_F(MCPServerTest, AdvertisedPromptsCanBeFetched) {
    server->add_prompt({"greet", "Greets someone", {{"name", "Who to greet", true}}},
                       [](const json& args) -> ToolResult {
                           return json::array({{{"role", "user"},
                                                {"content", {{"type", "text"},
                                                             {"text", "Say hello to " + args.at("name").get<std::string>()}}}}});
                       });

    push_initialize();
    push(7, "prompts/get", {{"name", "greet"}, {"arguments", {{"name", "Ada"}}}});
    run();

    transport->pop_response();
    json response = transport->pop_response();
    EXPECT_EQ(response["id"], 7);
    EXPECT_EQ(response["result"]["description"], "Greets someone");
    EXPECT_EQ(response["result"]["messages"][0]["content"]["text"], "Say hello to Ada");
}

TEST_F(MCPServerTest, CustomServerInfo) {
    ServerInfo info;
    info.name = "custom";
    info.version = "2.5.0";
    info.instructions = "Call echo first";
    server = std::make_unique<MCPServer>(transport, info);

    push_initialize();
    run();

    json result = transport->pop_response()["result"];
    EXPECT_EQ(result["serverInfo"]["name"], "custom");
    EXPECT_EQ(result["serverInfo"]["version"], "2.5.0");
    EXPECT_EQ(result["instructions"], "Call echo first");
}

TEST_F(MCPServerTest, MethodNotFound) {
    push_initialize();
    push(3, "unknown/method");
    run();

    transport->pop_response();
    json response = transport->pop_response();
    EXPECT_EQ(response["id"], 3);
    EXPECT_EQ(response["error"]["code"], -32601);
}

TEST_F(MCPServerTest, ToolNotFound) {
    push_initialize();
    push(4, "tools/call", {{"name", "nonexistent_tool"}, {"arguments", json::object()}});
    run();

    transport->pop_response();
    json response = transport->pop_response();
    EXPECT_EQ(response["id"], 4);
    EXPECT_EQ(response["error"]["code"], -32601);
    EXPECT_EQ(response["error"]["message"], "Tool not found: nonexistent_tool");
}

TEST_F(MCPServerTest, NotificationHandlersRun) {
    int progress = 0;
    server->on_notification("notifications/progress", [&progress](const json& params) {
        progress = params.value("progress", 0);
    });

    transport->push_request({{"jsonrpc", "2.0"}, {"method", "notifications/progress"}, {"params", {{"progress", 50}}}});
    run();

    EXPECT_EQ(progress, 50);
    EXPECT_FALSE(transport->has_responses());
}

TEST_F(MCPServerTest, RegistrationIsClosedOnceRunning) {
    run();

    EXPECT_THROW(server->register_tool({"late", "Too late", {{"type", "object"}}},
                                       [](const json&) -> ToolResult { return json::object(); }),
                 ConfigurationError);
    EXPECT_THROW(server->add_resource({"file:///late", "late", "Too late", std::nullopt},
                                      []() -> tl::expected<std::string, ToolError> { return std::string(); }),
                 ConfigurationError);
    EXPECT_THROW(server->add_prompt({"late", "Too late", {}},
                                    [](const json&) -> ToolResult { return json::array(); }),
                 ConfigurationError);
    EXPECT_THROW(server->on_notification("late", [](const json&) {}), ConfigurationError);
    EXPECT_FALSE(server->registry().contains("late"));
}

TEST_F(MCPServerTest, SessionClosesAfterInput) {
    push_initialize();
    EXPECT_EQ(server->session().state(), SessionState::Uninitialized);
    run();
    EXPECT_EQ(server->session().state(), SessionState::Closed);
}

TEST_F(MCPServerTest, StopFromAnotherThread) {
    std::thread runner([this] { server->run(); });

    push_initialize();
    ASSERT_TRUE(transport->wait_for_responses(1, std::chrono::seconds(2)));
    server->stop();
    runner.join();

    EXPECT_EQ(server->session().state(), SessionState::Closed);
    transport->close();
}
