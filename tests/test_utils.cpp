/**
 * @file test_utils.cpp
 * @brief Unit tests for logging and math helpers
 */

#include <gtest/gtest.h>
#include <ramp/utils/utils.hpp>
#include <cmath>
#include <string>
#include <utility>
#include <vector>

using namespace ramp::utils;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().setOutputCallback([this](LogLevel level, const char* msg) {
            records_.emplace_back(level, msg);
        });
    }

    void TearDown() override {
        Logger::instance().setOutputCallback(nullptr);
        Logger::instance().setLevel(LogLevel::Info);
    }

    std::vector<std::pair<LogLevel, std::string>> records_;
};

TEST_F(LoggerTest, DefaultLevelFiltersDebug) {
    RAMP_LOG_DEBUG("hidden %d", 1);
    RAMP_LOG_INFO("shown %d", 2);

    ASSERT_EQ(records_.size(), 1u);
    EXPECT_EQ(records_[0].first, LogLevel::Info);
    EXPECT_EQ(records_[0].second, "shown 2");
}

TEST_F(LoggerTest, LoweringLevelEnablesTrace) {
    Logger::instance().setLevel(LogLevel::Trace);
    RAMP_LOG_TRACE("t=%.2f", 0.5);

    ASSERT_EQ(records_.size(), 1u);
    EXPECT_EQ(records_[0].second, "t=0.50");
}

TEST_F(LoggerTest, OffSilencesEverything) {
    Logger::instance().setLevel(LogLevel::Off);
    RAMP_LOG_ERROR("error");
    RAMP_LOG_FATAL("fatal");

    EXPECT_TRUE(records_.empty());
}

TEST_F(LoggerTest, FatalBypassesLevel) {
    Logger::instance().setLevel(LogLevel::Fatal);
    RAMP_LOG_WARNING("warning");
    RAMP_LOG_FATAL("fatal %s", "message");

    ASSERT_EQ(records_.size(), 1u);
    EXPECT_EQ(records_[0].first, LogLevel::Fatal);
    EXPECT_EQ(records_[0].second, "fatal message");
}

TEST(LoggerLevelTest, LevelStrings) {
    EXPECT_STREQ(Logger::getLevelString(LogLevel::Warning), "WARN ");
    EXPECT_STREQ(Logger::getLevelString(LogLevel::Error), "ERROR");
}

TEST(MathUtilsTest, QuadraticRoots) {
    // x^2 - 3x + 2 = (x - 1)(x - 2)
    EXPECT_DOUBLE_EQ(solveQuadraticRoot(1.0, -3.0, 2.0, 1.0), 2.0);
    EXPECT_DOUBLE_EQ(solveQuadraticRoot(1.0, -3.0, 2.0, -1.0), 1.0);
    EXPECT_TRUE(std::isnan(solveQuadraticRoot(1.0, 0.0, 1.0, 1.0)));
}

TEST(MathUtilsTest, TimeToCover) {
    EXPECT_DOUBLE_EQ(timeToCover(8.0, 0.0, 1.0, 1.0), 4.0);
    EXPECT_DOUBLE_EQ(timeToCover(-8.0, 0.0, -1.0, -1.0), 4.0);
    EXPECT_DOUBLE_EQ(timeToCover(3.0, 1.5, 0.0, 1.0), 2.0);
    // Decelerating from 2 at 1: first reaches 1.5 after 1s
    EXPECT_DOUBLE_EQ(timeToCover(1.5, 2.0, -1.0, 1.0), 1.0);
    EXPECT_TRUE(std::isnan(timeToCover(5.0, 2.0, -1.0, 1.0)));
    EXPECT_TRUE(std::isnan(timeToCover(1.0, 0.0, 0.0, 1.0)));
}
