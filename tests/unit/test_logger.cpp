#include <string>
#include <gtest/gtest.h>
#include "log.hpp"
#include "log_capture.hpp"

namespace {

TEST(LoggerTest, SinkReceivesLevelAndMessage) {
    LogCapture logs;
    LOG_INFO("hello");
    LOG_ERROR("broken");
    auto entries = logs.entries();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].first, LogLevel::INFO);
    EXPECT_EQ(entries[0].second, "hello");
    EXPECT_EQ(entries[1].first, LogLevel::ERROR);
}

TEST(LoggerTest, LevelFiltersLowerSeverities) {
    LogCapture logs;
    Logger::get().set_level(LogLevel::WARN);
    LOG_DEBUG("d");
    LOG_INFO("i");
    LOG_WARN("w");
    LOG_ERROR("e");
    auto entries = logs.entries();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].second, "w");
    EXPECT_EQ(entries[1].second, "e");
}

TEST(LoggerTest, LevelNames) {
    EXPECT_STREQ(Logger::level_name(LogLevel::DEBUG), "debug");
    EXPECT_STREQ(Logger::level_name(LogLevel::WARN), "warn");
}

}  // namespace
