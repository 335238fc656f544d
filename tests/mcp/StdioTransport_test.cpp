#include "mcp/StdioTransport.hpp"
#include <gtest/gtest.h>
#include <sstream>

using namespace mcprt;

TEST(StdioTransportTest, ReadsLinesUntilEof) {
    std::istringstream in("first\nsecond\n");
    std::ostringstream out;
    StdioTransport transport(in, out);

    EXPECT_TRUE(transport.is_open());
    EXPECT_EQ(transport.read_line(), "first");
    EXPECT_EQ(transport.read_line(), "second");
    EXPECT_FALSE(transport.read_line().has_value());
    EXPECT_FALSE(transport.is_open());
}

TEST(StdioTransportTest, LastLineWithoutNewlineIsDelivered) {
    std::istringstream in("{\"id\":1}");
    std::ostringstream out;
    StdioTransport transport(in, out);

    EXPECT_EQ(transport.read_line(), "{\"id\":1}");
    EXPECT_FALSE(transport.read_line().has_value());
}

TEST(StdioTransportTest, WritesOneLinePerMessage) {
    std::istringstream in;
    std::ostringstream out;
    StdioTransport transport(in, out);

    transport.write_line("{\"a\":1}");
    transport.write_line("{\"b\":2}");
    EXPECT_EQ(out.str(), "{\"a\":1}\n{\"b\":2}\n");
}

TEST(StdioTransportTest, BrokenOutputThrows) {
    std::istringstream in;
    std::ostringstream out;
    out.setstate(std::ios::badbit);
    StdioTransport transport(in, out);

    EXPECT_THROW(transport.write_line("{}"), std::runtime_error);
    EXPECT_FALSE(transport.is_open());
}

TEST(StdioTransportTest, UntiesInputFromOutput) {
    std::istringstream in;
    std::ostringstream out;
    in.tie(&out);
    StdioTransport transport(in, out);
    EXPECT_EQ(in.tie(), nullptr);
}
