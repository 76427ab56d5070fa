#include "core/clock.hpp"
#include "core/logging.hpp"
#include <gtest/gtest.h>
#include <iostream>
#include <sstream>
#include <string>

using namespace lockbox::core;

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        previousLevel_ = Log::level();
        previousBuffer_ = std::cerr.rdbuf(captured_.rdbuf());
    }

    void TearDown() override {
        std::cerr.rdbuf(previousBuffer_);
        Log::setLevel(previousLevel_);
    }

    std::ostringstream captured_;
    std::streambuf* previousBuffer_ = nullptr;
    LogLevel previousLevel_ = LogLevel::Info;
};

TEST_F(LoggingTest, ParsesLevelNames) {
    EXPECT_EQ(Log::parseLevel("debug"), LogLevel::Debug);
    EXPECT_EQ(Log::parseLevel("INFO"), LogLevel::Info);
    EXPECT_EQ(Log::parseLevel("warn"), LogLevel::Warning);
    EXPECT_EQ(Log::parseLevel("error"), LogLevel::Error);
    EXPECT_FALSE(Log::parseLevel("verbose").has_value());
}

TEST_F(LoggingTest, FiltersBelowLevel) {
    Log::setLevel(LogLevel::Warning);
    Log::info("test", "hidden");
    Log::warning("test", "shown");

    std::string output = captured_.str();
    EXPECT_EQ(output.find("hidden"), std::string::npos);
    EXPECT_NE(output.find("[warning] test: shown"), std::string::npos);
}

TEST(ClockTest, FormatsIso8601WithMilliseconds) {
    EXPECT_EQ(formatIso8601(fromEpochMillis(1714566600250)), "2024-05-01T12:30:00.250Z");
    EXPECT_EQ(formatIso8601(fromEpochMillis(0)), "1970-01-01T00:00:00.000Z");
    EXPECT_EQ(toEpochMillis(fromEpochMillis(1714566600250)), 1714566600250);
}
