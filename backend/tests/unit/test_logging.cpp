#include <gtest/gtest.h>
#include "utils/logging.hpp"

using namespace soksak::utils;

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        previous_ = Logger::getLevel();
    }

    void TearDown() override {
        Logger::setLevel(previous_);
    }

private:
    LogLevel previous_ = LogLevel::INFO;
};

TEST_F(LoggingTest, ParsesLevelNames) {
    EXPECT_EQ(Logger::parseLevel("DEBUG"), LogLevel::DEBUG);
    EXPECT_EQ(Logger::parseLevel("info"), LogLevel::INFO);
    EXPECT_EQ(Logger::parseLevel("Warn"), LogLevel::WARN);
    EXPECT_EQ(Logger::parseLevel("WARNING"), LogLevel::WARN);
    EXPECT_EQ(Logger::parseLevel("error"), LogLevel::ERROR);
}

TEST_F(LoggingTest, UnknownLevelFallsBackToInfo) {
    EXPECT_EQ(Logger::parseLevel("verbose"), LogLevel::INFO);
    EXPECT_EQ(Logger::parseLevel(""), LogLevel::INFO);
}

TEST_F(LoggingTest, LevelNamesRoundTrip) {
    for (auto level : {LogLevel::DEBUG, LogLevel::INFO, LogLevel::WARN, LogLevel::ERROR}) {
        EXPECT_EQ(Logger::parseLevel(Logger::levelToString(level)), level);
    }
}

TEST_F(LoggingTest, FiltersBelowConfiguredLevel) {
    Logger::setLevel(LogLevel::WARN);

    EXPECT_FALSE(Logger::isEnabled(LogLevel::DEBUG));
    EXPECT_FALSE(Logger::isEnabled(LogLevel::INFO));
    EXPECT_TRUE(Logger::isEnabled(LogLevel::WARN));
    EXPECT_TRUE(Logger::isEnabled(LogLevel::ERROR));

    Logger::setLevel(LogLevel::DEBUG);
    EXPECT_TRUE(Logger::isEnabled(LogLevel::DEBUG));
}

TEST_F(LoggingTest, LoggingNeverThrows) {
    Logger::setLevel(LogLevel::DEBUG);
    EXPECT_NO_THROW(Logger::debug("debug message"));
    EXPECT_NO_THROW(Logger::info("info message"));
    EXPECT_NO_THROW(Logger::warn("warn message"));
    EXPECT_NO_THROW(Logger::error("error message"));
    EXPECT_NO_THROW(Logger::initialize());
}
