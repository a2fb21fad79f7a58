/**
 * @file test_logger.cpp
 * @brief Unit tests for LOG_LEVEL handling
 */

#include <gtest/gtest.h>
#include "logger.h"

using certsync::common::Logger;

TEST(LoggerTest, LevelNamesCaseInsensitive) {
    EXPECT_EQ(Logger::parseLevel("TRACE"), spdlog::level::trace);
    EXPECT_EQ(Logger::parseLevel("Debug"), spdlog::level::debug);
    EXPECT_EQ(Logger::parseLevel("INFO"), spdlog::level::info);
    EXPECT_EQ(Logger::parseLevel("warn"), spdlog::level::warn);
    EXPECT_EQ(Logger::parseLevel("WARNING"), spdlog::level::warn);
    EXPECT_EQ(Logger::parseLevel("error"), spdlog::level::err);
    EXPECT_EQ(Logger::parseLevel("CRITICAL"), spdlog::level::critical);
}

TEST(LoggerTest, UnknownLevelIsInfo) {
    EXPECT_EQ(Logger::parseLevel("verbose"), spdlog::level::info);
    EXPECT_EQ(Logger::parseLevel(""), spdlog::level::info);
}

TEST(LoggerTest, InitializeInstallsDefaultLogger) {
    Logger::initialize("cert-sync-test", "ERROR");
    EXPECT_EQ(spdlog::default_logger()->name(), "cert-sync-test");
    EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::err);
    Logger::flush();
}
