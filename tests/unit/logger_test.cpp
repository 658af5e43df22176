#include "logging/logger.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <string>

using namespace hwenergy::logging;

class LoggerTest : public ::testing::Test {
protected:
    std::ostringstream captured;
    Level saved_level = Level::LVL_INFO;

    void SetUp() override {
        saved_level = Logger::level();
        Logger::set_output(&captured);
    }

    void TearDown() override {
        Logger::set_output(nullptr);
        Logger::set_level(saved_level);
    }
};

TEST_F(LoggerTest, MessagesBelowThresholdAreDropped) {
    Logger::set_level(Level::LVL_WARN);
    LOG_INFO("hidden");
    LOG_WARN("shown " << 42);

    std::string out = captured.str();
    EXPECT_EQ(out.find("hidden"), std::string::npos);
    EXPECT_NE(out.find("[WARN]  shown 42"), std::string::npos);
}

TEST_F(LoggerTest, DebugLinesCarryFileAndLine) {
    Logger::set_level(Level::LVL_DEBUG);
    LOG_DEBUG("detail");

    std::string out = captured.str();
    EXPECT_NE(out.find("[DEBUG] detail"), std::string::npos);
    EXPECT_NE(out.find("(logger_test.cpp:"), std::string::npos);
}

TEST_F(LoggerTest, EveryMacroWritesItsLevel) {
    Logger::set_level(Level::LVL_DEBUG);
    int level = 3;  // same name as Logger::level() must not disturb the macros
    LOG_DEBUG("d" << level);
    LOG_INFO("i" << level);
    LOG_WARN("w" << level);
    LOG_ERROR("e" << level);

    std::string out = captured.str();
    EXPECT_NE(out.find("[DEBUG] d3"), std::string::npos);
    EXPECT_NE(out.find("[INFO]  i3"), std::string::npos);
    EXPECT_NE(out.find("[WARN]  w3"), std::string::npos);
    EXPECT_NE(out.find("[ERROR] e3"), std::string::npos);
}

TEST_F(LoggerTest, SuppressedMessageIsNotFormatted) {
    Logger::set_level(Level::LVL_ERROR);
    int evaluated = 0;
    LOG_DEBUG("count " << ++evaluated);
    LOG_INFO("count " << ++evaluated);
    EXPECT_EQ(evaluated, 0);
    EXPECT_TRUE(captured.str().empty());
}

TEST_F(LoggerTest, NoneSilencesErrors) {
    Logger::set_level(Level::LVL_NONE);
    LOG_ERROR("nothing");
    EXPECT_TRUE(captured.str().empty());
}

TEST(LogLevelParseTest, CaseInsensitive) {
    EXPECT_EQ(string_to_level("debug"), Level::LVL_DEBUG);
    EXPECT_EQ(string_to_level("INFO"), Level::LVL_INFO);
    EXPECT_EQ(string_to_level("Warn"), Level::LVL_WARN);
    EXPECT_EQ(string_to_level("error"), Level::LVL_ERROR);
    EXPECT_FALSE(string_to_level("verbose").has_value());
    EXPECT_FALSE(string_to_level("").has_value());
}

TEST(LogLevelParseTest, LevelToStringRoundTrips) {
    for (Level level : {Level::LVL_DEBUG, Level::LVL_INFO, Level::LVL_WARN, Level::LVL_ERROR}) {
        EXPECT_EQ(string_to_level(level_to_string(level)), level);
    }
}
