#include <gtest/gtest.h>
#include "parley/log.hpp"
#include "parley/types.hpp"
#include <string>
#include <utility>
#include <vector>

using namespace parley;

class LoggerTest : public ::testing::Test {
protected:
    Logger make_logger(LogLevel level) {
        return Logger(level, [this](LogLevel l, std::string_view message) {
            captured.emplace_back(l, std::string(message));
        });
    }

    std::vector<std::pair<LogLevel, std::string>> captured;
};

TEST_F(LoggerTest, FiltersBelowLevel) {
    auto logger = make_logger(LogLevel::Warn);

    logger.debug("debug");
    logger.info("info");
    logger.warn("warn");
    logger.error("error");

    ASSERT_EQ(captured.size(), 2u);
    EXPECT_EQ(captured[0].first, LogLevel::Warn);
    EXPECT_EQ(captured[0].second, "warn");
    EXPECT_EQ(captured[1].first, LogLevel::Error);
}

TEST_F(LoggerTest, DebugLevelPassesEverything) {
    auto logger = make_logger(LogLevel::Debug);

    logger.debug("a");
    logger.info("b");
    logger.warn("c");
    logger.error("d");

    EXPECT_EQ(captured.size(), 4u);
}

TEST_F(LoggerTest, OffSilencesEverything) {
    auto logger = make_logger(LogLevel::Off);

    logger.error("error");
    logger.log(LogLevel::Off, "off");

    EXPECT_TRUE(captured.empty());
    EXPECT_FALSE(logger.enabled(LogLevel::Error));
}

TEST_F(LoggerTest, DefaultLoggerIsWarn) {
    Logger logger;
    EXPECT_EQ(logger.level(), LogLevel::Warn);
    EXPECT_FALSE(logger.enabled(LogLevel::Info));
    EXPECT_TRUE(logger.enabled(LogLevel::Warn));
}

TEST_F(LoggerTest, ConfigBuildsLogger) {
    Config config;
    config.log_level = LogLevel::Info;
    config.on_log = [this](LogLevel l, std::string_view message) {
        captured.emplace_back(l, std::string(message));
    };

    auto logger = config.make_logger();
    logger.debug("hidden");
    logger.info("shown");

    ASSERT_EQ(captured.size(), 1u);
    EXPECT_EQ(captured[0].second, "shown");
}

TEST(LogLevelTest, StringConversion) {
    EXPECT_STREQ(log_level_to_string(LogLevel::Debug), "debug");
    EXPECT_STREQ(log_level_to_string(LogLevel::Error), "error");

    EXPECT_EQ(log_level_from_string("info"), LogLevel::Info);
    EXPECT_EQ(log_level_from_string("off"), LogLevel::Off);
    EXPECT_FALSE(log_level_from_string("verbose").has_value());
}
