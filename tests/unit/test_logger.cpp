#include <sstream>
#include <string>
#include <gtest/gtest.h>
#include "core/logging/logger.hpp"

namespace {

using turnloom::core::logging::LogLevel;
using turnloom::core::logging::Logger;
using turnloom::core::logging::parse_log_level;

// Restores the shared logger after each test.
class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override { Logger::get().set_stream(&out_); }

    void TearDown() override {
        Logger::get().set_stream(nullptr);
        Logger::get().set_min_level(LogLevel::INFO);
        Logger::get().set_context("");
    }

    std::ostringstream out_;
};

TEST_F(LoggerTest, FiltersBelowMinimumLevel) {
    Logger::get().set_min_level(LogLevel::WARN);
    TURNLOOM_LOG_INFO("hidden");
    TURNLOOM_LOG_ERROR("shown");
    const std::string text = out_.str();
    EXPECT_EQ(text.find("hidden"), std::string::npos);
    EXPECT_NE(text.find("[ERROR] shown"), std::string::npos);
}

TEST_F(LoggerTest, PrefixesContext) {
    Logger::get().set_context("proj/main");
    TURNLOOM_LOG_WARN("Store: slow write");
    EXPECT_NE(out_.str().find("[WARN ] [proj/main] Store: slow write"), std::string::npos);
}

TEST_F(LoggerTest, LinesStartWithUtcTimestamp) {
    TURNLOOM_LOG_INFO("tick");
    const std::string text = out_.str();
    ASSERT_GT(text.size(), 24u);
    EXPECT_EQ(text[4], '-');
    EXPECT_EQ(text[10], 'T');
    EXPECT_EQ(text[23], 'Z');
}

TEST(LogLevelTest, ParsesKnownNames) {
    EXPECT_TRUE(parse_log_level("debug") == LogLevel::DEBUG);
    EXPECT_TRUE(parse_log_level("error") == LogLevel::ERROR);
    EXPECT_FALSE(parse_log_level("loud").has_value());
}

}  // namespace
