/**
 * @file test_logger.cpp
 * @brief Unit tests for the spdlog setup wrapper
 */

#include <gtest/gtest.h>
#include <uuidkit/config_manager.h>
#include <uuidkit/logger.h>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>

using namespace uuidkit;

TEST(LoggerTest, ParseLevel) {
    EXPECT_EQ(Logger::parseLevel("trace"), spdlog::level::trace);
    EXPECT_EQ(Logger::parseLevel("debug"), spdlog::level::debug);
    EXPECT_EQ(Logger::parseLevel("info"), spdlog::level::info);
    EXPECT_EQ(Logger::parseLevel("warn"), spdlog::level::warn);
    EXPECT_EQ(Logger::parseLevel("error"), spdlog::level::err);
    EXPECT_EQ(Logger::parseLevel("critical"), spdlog::level::critical);
    EXPECT_EQ(Logger::parseLevel("off"), spdlog::level::off);
    EXPECT_EQ(Logger::parseLevel("verbose"), spdlog::level::info);
}

TEST(LoggerTest, InitializeWritesToRotatingFile) {
    std::string path = "/tmp/uuidkit_logger_test_" + std::to_string(::getpid()) + ".log";
    std::remove(path.c_str());

    Logger::initialize("uuidkit-test", "debug", true, path);
    EXPECT_EQ(spdlog::default_logger()->name(), "uuidkit-test");
    EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::debug);

    spdlog::warn("rotating sink probe");
    Logger::flush();

    std::ifstream in(path);
    ASSERT_TRUE(in.good());
    std::stringstream contents;
    contents << in.rdbuf();
    EXPECT_NE(contents.str().find("rotating sink probe"), std::string::npos);
    EXPECT_NE(contents.str().find("[uuidkit-test]"), std::string::npos);

    Logger::initialize("uuidkit-test");
    std::remove(path.c_str());
}

TEST(LoggerTest, InitializeFromConfigUsesLogLevelKey) {
    ConfigManager& config = ConfigManager::getInstance();
    config.set(ConfigManager::LOG_LEVEL, "error");

    Logger::initializeFromConfig("uuidkit-config");
    EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::err);

    config.unset(ConfigManager::LOG_LEVEL);
    Logger::setLevel("info");
    EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::info);
}

TEST(LoggerTest, UnwritableFileKeepsPreviousLogger) {
    Logger::initialize("uuidkit-before");
    Logger::initialize("uuidkit-after", "info", true, "/proc/uuidkit-no-such-dir/out.log");
    EXPECT_EQ(spdlog::default_logger()->name(), "uuidkit-before");
}

TEST(LoggerTest, EmptyFilePathSkipsFileSink) {
    Logger::initialize("uuidkit-console", "warn", true, "");
    EXPECT_EQ(spdlog::default_logger()->name(), "uuidkit-console");
    EXPECT_EQ(spdlog::default_logger()->sinks().size(), 1u);
    Logger::setLevel("info");
}
