/**
 * @file LoggerTest.cpp
 * @brief Level parsing, filtering, and the session lifecycle of the file logger.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "Logger.h"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

TEST(LoggerTest, ParseLevelIsCaseInsensitive) {
    Logger::Level lvl = Logger::Level::Info;
    EXPECT_TRUE(Logger::parseLevel("DEBUG", lvl));
    EXPECT_EQ(lvl, Logger::Level::Debug);
    EXPECT_TRUE(Logger::parseLevel("Warning", lvl));
    EXPECT_EQ(lvl, Logger::Level::Warn);
    EXPECT_TRUE(Logger::parseLevel("off", lvl));
    EXPECT_EQ(lvl, Logger::Level::None);
    EXPECT_FALSE(Logger::parseLevel("loud", lvl));
    EXPECT_EQ(lvl, Logger::Level::None);
}

TEST(LoggerTest, SilentUntilInitialized) {
    ASSERT_FALSE(Logger::isOpen());
    EXPECT_FALSE(Logger::enabled(Logger::Level::Error));
    Logger::error("dropped");
}

TEST(LoggerTest, WritesFilteredSession) {
    const std::string path = ::testing::TempDir() + "droplets_logger_test.log";
    std::remove(path.c_str());

    Logger::init(path);
    ASSERT_TRUE(Logger::isOpen());
    Logger::setLevel(Logger::Level::Warn);
    EXPECT_EQ(Logger::level(), Logger::Level::Warn);
    EXPECT_FALSE(Logger::enabled(Logger::Level::Info));
    EXPECT_TRUE(Logger::enabled(Logger::Level::Error));

    Logger::info("quiet message");
    Logger::warn("pool saturated");
    Logger::logException("scene load", std::runtime_error("bad magic"));
    Logger::shutdown();
    Logger::setLevel(Logger::Level::Info);
    EXPECT_FALSE(Logger::isOpen());

    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    const std::string text = ss.str();
    EXPECT_NE(text.find("session start"), std::string::npos);
    EXPECT_NE(text.find("[WARN]"), std::string::npos);
    EXPECT_NE(text.find("pool saturated"), std::string::npos);
    EXPECT_NE(text.find("scene load: bad magic"), std::string::npos);
    EXPECT_EQ(text.find("quiet message"), std::string::npos);
    EXPECT_NE(text.find("session end"), std::string::npos);
    std::remove(path.c_str());
}
