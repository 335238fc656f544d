#include "mcp/Catalog.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace mcprt;
using json = nlohmann::json;

namespace {

ResourceReader text_reader(const std::string& text) {
    return [text]() -> tl::expected<std::string, ToolError> { return text; };
}

PromptRenderer empty_renderer() {
    return [](const json&) -> ToolResult { return json::array(); };
}

} // namespace

TEST(CatalogTest, StartsEmpty) {
    Catalog catalog;
    EXPECT_FALSE(catalog.has_resources());
    EXPECT_FALSE(catalog.has_prompts());
    EXPECT_TRUE(catalog.resources().empty());
    EXPECT_TRUE(catalog.prompts().empty());
}

TEST(CatalogTest, RejectsBadResources) {
    Catalog catalog;
    EXPECT_THROW(catalog.add_resource({"", "empty", "", std::nullopt}, text_reader("x")), ConfigurationError);
    EXPECT_THROW(catalog.add_resource({"mem://a", "a", "", std::nullopt}, ResourceReader()), ConfigurationError);

    catalog.add_resource({"mem://a", "a", "", std::nullopt}, text_reader("x"));
    EXPECT_THROW(catalog.add_resource({"mem://a", "again", "", std::nullopt}, text_reader("y")),
                 ConfigurationError);
    EXPECT_EQ(catalog.resources().size(), 1);
}

TEST(CatalogTest, RejectsBadPrompts) {
    Catalog catalog;
    EXPECT_THROW(catalog.add_prompt({"", "No name", {}}, empty_renderer()), ConfigurationError);
    EXPECT_THROW(catalog.add_prompt({"p", "Null renderer", {}}, PromptRenderer()), ConfigurationError);

    catalog.add_prompt({"p", "First", {}}, empty_renderer());
    EXPECT_THROW(catalog.add_prompt({"p", "Second", {}}, empty_renderer()), ConfigurationError);
}

TEST(CatalogTest, ResourceWithoutMimeType) {
    Catalog catalog;
    catalog.add_resource({"mem://plain", "plain", "", std::nullopt}, text_reader("body"));

    json listed = json(catalog.resources()[0]);
    EXPECT_FALSE(listed.contains("mimeType"));
    EXPECT_FALSE(listed.contains("description"));

    ToolResult read = catalog.read_resource("mem://plain");
    ASSERT_TRUE(read.has_value());
    EXPECT_EQ((*read)["contents"][0], json({{"uri", "mem://plain"}, {"text", "body"}}));
}

TEST(CatalogTest, ThrowingReaderIsContained) {
    Catalog catalog;
    catalog.add_resource({"mem://boom", "boom", "", std::nullopt},
                         []() -> tl::expected<std::string, ToolError> { throw std::runtime_error("disk gone"); });

    ToolResult read;
    EXPECT_NO_THROW(read = catalog.read_resource("mem://boom"));
    ASSERT_FALSE(read.has_value());
    EXPECT_EQ(read.error().code, error::InternalError);
    EXPECT_EQ(read.error().message, "Internal error: disk gone");
}

TEST(CatalogTest, PromptMustRenderMessageArray) {
    Catalog catalog;
    catalog.add_prompt({"bad", "Renders an object", {}},
                       [](const json&) -> ToolResult { return json::object(); });

    ToolResult rendered = catalog.get_prompt("bad", json::object());
    ASSERT_FALSE(rendered.has_value());
    EXPECT_EQ(rendered.error().code, error::InternalError);
}

TEST(CatalogTest, PromptFailureIsPassedThrough) {
    Catalog catalog;
    catalog.add_prompt({"quota", "Fails", {{"topic", "Topic", false}}},
                       [](const json&) -> ToolResult {
                           return tl::unexpected(ToolError{-32010, "quota exceeded"});
                       });

    ToolResult rendered = catalog.get_prompt("quota", json::object());
    ASSERT_FALSE(rendered.has_value());
    EXPECT_EQ(rendered.error().code, -32010);
}

TEST(CatalogTest, OptionalPromptArgumentsMayBeOmitted) {
    Catalog catalog;
    catalog.add_prompt({"greet", "Greets", {{"name", "Who", false}}},
                       [](const json& args) -> ToolResult {
                           std::string who = args.value("name", std::string("world"));
                           return json::array({{{"role", "user"},
                                                {"content", {{"type", "text"}, {"text", "Hello " + who}}}}});
                       });

    ToolResult rendered = catalog.get_prompt("greet", json::object());
    ASSERT_TRUE(rendered.has_value());
    EXPECT_EQ((*rendered)["messages"][0]["content"]["text"], "Hello world");
}
