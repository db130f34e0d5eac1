#include "logging/logger.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <string>

using namespace corral::logging;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        saved_level = Logger::level();
        Logger::set_sink(&out);
    }

    void TearDown() override {
        Logger::set_sink(nullptr);
        Logger::set_level(saved_level);
    }

    std::ostringstream out;
    Level saved_level = Level::LVL_INFO;
};

TEST_F(LoggerTest, ThresholdFiltersLowerLevels) {
    Logger::set_level(Level::LVL_WARN);

    LOG_INFO("[Test] hidden");
    LOG_WARN("[Test] shown " << 42);

    std::string text = out.str();
    EXPECT_EQ(text.find("hidden"), std::string::npos);
    EXPECT_NE(text.find("[WARN]  [Test] shown 42"), std::string::npos);
}

TEST_F(LoggerTest, DebugLinesCarrySourceLocation) {
    Logger::set_level(Level::LVL_DEBUG);

    LOG_DEBUG("[Test] detail");

    std::string text = out.str();
    EXPECT_NE(text.find("[DEBUG] [Test] detail"), std::string::npos);
    EXPECT_NE(text.find("logger_test.cpp:"), std::string::npos);
}

TEST_F(LoggerTest, NoneSilencesEverything) {
    Logger::set_level(Level::LVL_NONE);

    LOG_ERROR("[Test] nothing");

    EXPECT_TRUE(out.str().empty());
}

TEST_F(LoggerTest, MessageNotBuiltWhenDisabled) {
    Logger::set_level(Level::LVL_ERROR);

    int evaluated = 0;
    auto count = [&evaluated]() {
        ++evaluated;
        return "x";
    };
    LOG_DEBUG(count());
    LOG_ERROR(count());

    EXPECT_EQ(evaluated, 1);
}

TEST_F(LoggerTest, LevelStringConversion) {
    EXPECT_EQ(string_to_level("debug"), Level::LVL_DEBUG);
    EXPECT_EQ(string_to_level("WARN"), Level::LVL_WARN);
    EXPECT_EQ(string_to_level("none"), Level::LVL_NONE);
    EXPECT_EQ(string_to_level("bogus"), Level::LVL_INFO);
    EXPECT_EQ(level_to_string(Level::LVL_ERROR), "error");
}
