/**
 * logger_test.cpp - Logger threshold and sink tests
 */

#include "logging/logger.hpp"

#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

using namespace proxyvisor::logging;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        saved_level_ = Logger::level();
        Logger::set_sink([this](Level level, const std::string &line) { lines_.emplace_back(level, line); });
    }

    void TearDown() override {
        Logger::set_sink(nullptr);
        Logger::set_level(saved_level_);
    }

    Level saved_level_ = Level::LVL_INFO;
    std::vector<std::pair<Level, std::string>> lines_;
};

TEST_F(LoggerTest, DropsMessagesBelowThreshold) {
    Logger::set_level(Level::LVL_WARN);

    LOG_DEBUG("debug line");
    LOG_INFO("info line");
    LOG_WARN("warn line");
    LOG_ERROR("error line");

    ASSERT_EQ(lines_.size(), 2u);
    EXPECT_EQ(lines_[0].first, Level::LVL_WARN);
    EXPECT_EQ(lines_[1].first, Level::LVL_ERROR);
}

TEST_F(LoggerTest, FormatsLevelTagAndMessage) {
    Logger::set_level(Level::LVL_DEBUG);

    LOG_INFO("[Supervisor] started on port " << 8317);

    ASSERT_EQ(lines_.size(), 1u);
    const std::string &line = lines_[0].second;
    EXPECT_EQ(line.front(), '[');
    EXPECT_NE(line.find("[INFO]"), std::string::npos);
    EXPECT_NE(line.find("[Supervisor] started on port 8317"), std::string::npos);
}

TEST_F(LoggerTest, NoneSilencesEverything) {
    Logger::set_level(Level::LVL_NONE);

    LOG_ERROR("should not appear");

    EXPECT_TRUE(lines_.empty());
}

TEST(LoggerLevelTest, ParsesLevelNames) {
    EXPECT_EQ(string_to_level("debug"), Level::LVL_DEBUG);
    EXPECT_EQ(string_to_level("INFO"), Level::LVL_INFO);
    EXPECT_EQ(string_to_level("warning"), Level::LVL_WARN);
    EXPECT_EQ(string_to_level("Error"), Level::LVL_ERROR);
    EXPECT_EQ(string_to_level("off"), Level::LVL_NONE);
    EXPECT_EQ(string_to_level("verbose"), Level::LVL_INFO);
}

TEST(LoggerLevelTest, LevelNamesRoundTrip) {
    for (auto level : {Level::LVL_DEBUG, Level::LVL_INFO, Level::LVL_WARN, Level::LVL_ERROR, Level::LVL_NONE}) {
        EXPECT_EQ(string_to_level(level_to_string(level)), level);
    }
}
