#include "core/Logging.hpp"
#include <gtest/gtest.h>

using namespace mcprt;

TEST(LoggingTest, ParsesKnownLevels) {
    EXPECT_EQ(parse_log_level("trace"), spdlog::level::trace);
    EXPECT_EQ(parse_log_level("debug"), spdlog::level::debug);
    EXPECT_EQ(parse_log_level("info"), spdlog::level::info);
    EXPECT_EQ(parse_log_level("warn"), spdlog::level::warn);
    EXPECT_EQ(parse_log_level("error"), spdlog::level::err);
    EXPECT_EQ(parse_log_level("critical"), spdlog::level::critical);
    EXPECT_EQ(parse_log_level("off"), spdlog::level::off);
}

TEST(LoggingTest, RejectsUnknownLevels) {
    EXPECT_FALSE(parse_log_level("verbose").has_value());
    EXPECT_FALSE(parse_log_level("INFO").has_value());
    EXPECT_FALSE(parse_log_level("").has_value());
}

TEST(LoggingTest, DefaultLoggerWritesToStderr) {
    init_logging(spdlog::level::warn);

    auto logger = spdlog::default_logger();
    ASSERT_NE(logger, nullptr);
    EXPECT_EQ(logger->name(), "mcp");
    EXPECT_EQ(logger->level(), spdlog::level::warn);

    testing::internal::CaptureStdout();
    spdlog::warn("diagnostic line");
    logger->flush();
    EXPECT_EQ(testing::internal::GetCapturedStdout(), "");
}

TEST(LoggingTest, ReinitializingReusesLogger) {
    init_logging(spdlog::level::info);
    auto first = spdlog::default_logger();
    init_logging(spdlog::level::debug);

    EXPECT_EQ(spdlog::default_logger(), first);
    EXPECT_EQ(first->level(), spdlog::level::debug);
}
