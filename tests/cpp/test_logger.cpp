/**
 * @file test_logger.cpp
 * @brief Unit tests for the logging facade
 */

#include "logging/logger.h"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <iterator>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace speaker_remote::logging;

class LoggerTest : public ::testing::Test {
   protected:
    void SetUp() override {
        tempDir = fs::temp_directory_path() /
                  ("speaker_remote_logger_test_" + std::to_string(getpid()));
        fs::create_directories(tempDir);
    }

    void TearDown() override {
        shutdown();
        fs::remove_all(tempDir);
    }

    fs::path writeFile(const std::string& name, const std::string& content) {
        auto path = tempDir / name;
        std::ofstream file(path);
        file << content;
        return path;
    }

    fs::path tempDir;
};

// ============================================================
// Level conversion
// ============================================================

TEST_F(LoggerTest, StringToLevel) {
    EXPECT_EQ(stringToLevel("trace"), LogLevel::Trace);
    EXPECT_EQ(stringToLevel("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(stringToLevel("Warning"), LogLevel::Warn);
    EXPECT_EQ(stringToLevel("err"), LogLevel::Error);
    EXPECT_EQ(stringToLevel("fatal"), LogLevel::Critical);
    EXPECT_EQ(stringToLevel("none"), LogLevel::Off);
    EXPECT_EQ(stringToLevel("loud"), LogLevel::Info);
}

TEST_F(LoggerTest, LevelToString) {
    EXPECT_EQ(levelToString(LogLevel::Debug), "debug");
    EXPECT_EQ(levelToString(LogLevel::Warn), "warn");
    EXPECT_EQ(levelToString(LogLevel::Off), "off");
}

// ============================================================
// parseLogConfig
// ============================================================

TEST_F(LoggerTest, ParseLogConfig) {
    LogConfig config;
    ASSERT_TRUE(parseLogConfig(
        R"({"level": "debug", "filePath": "/var/log/speaker_remote.log", "maxBackups": 5,
            "coloredOutput": false, "unknown": 1})",
        config));

    EXPECT_EQ(config.level, LogLevel::Debug);
    EXPECT_EQ(config.filePath, "/var/log/speaker_remote.log");
    EXPECT_EQ(config.maxBackups, 5u);
    EXPECT_FALSE(config.coloredOutput);
    EXPECT_TRUE(config.consoleOutput);
}

TEST_F(LoggerTest, ParseLogConfigRejectsInvalid) {
    LogConfig config;
    EXPECT_FALSE(parseLogConfig("not json", config));
    EXPECT_FALSE(parseLogConfig("[1, 2]", config));
    EXPECT_FALSE(parseLogConfig(R"({"maxBackups": "many"})", config));
}

// ============================================================
// Initialization
// ============================================================

TEST_F(LoggerTest, InitializeSetsLevel) {
    LogConfig config;
    config.level = LogLevel::Warn;
    ASSERT_TRUE(initialize(config));
    EXPECT_EQ(getLevel(), LogLevel::Warn);

    setLevel(LogLevel::Trace);
    EXPECT_EQ(getLevel(), LogLevel::Trace);
}

TEST_F(LoggerTest, InitializeFromConfigReadsLoggingSection) {
    auto path = writeFile("config.json", R"({"receiver": {"name": "TV"},
                                             "logging": {"level": "error"}})");
    ASSERT_TRUE(initializeFromConfig(path.string()));
    EXPECT_EQ(getLevel(), LogLevel::Error);
}

TEST_F(LoggerTest, VerboseOverridesConfiguredLevel) {
    auto path = writeFile("config.json", R"({"logging": {"level": "error"}})");
    ASSERT_TRUE(initializeFromConfig(path.string(), true));
    EXPECT_EQ(getLevel(), LogLevel::Debug);
}

TEST_F(LoggerTest, MissingConfigFallsBackToDefaults) {
    ASSERT_TRUE(initializeFromConfig((tempDir / "absent.json").string()));
    EXPECT_EQ(getLevel(), LogLevel::Info);
}

TEST_F(LoggerTest, FileSinkWritesMessages) {
    LogConfig config;
    config.consoleOutput = false;
    config.filePath = (tempDir / "daemon.log").string();
    ASSERT_TRUE(initialize(config));

    LOG_INFO("Receiver state changed to {}", "PLAYING");
    flush();

    std::ifstream file(config.filePath);
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    EXPECT_NE(content.find("Receiver state changed to PLAYING"), std::string::npos);
}

TEST_F(LoggerTest, EveryNLogsFirstOfEachBurst) {
    LogConfig config;
    config.consoleOutput = false;
    config.filePath = (tempDir / "burst.log").string();
    ASSERT_TRUE(initialize(config));

    for (int i = 0; i < 10; ++i) {
        LOG_EVERY_N(WARN, 4, "burst {}", i);
    }
    flush();

    std::ifstream file(config.filePath);
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    EXPECT_NE(content.find("burst 0"), std::string::npos);
    EXPECT_NE(content.find("burst 4"), std::string::npos);
    EXPECT_NE(content.find("burst 8"), std::string::npos);
    EXPECT_EQ(content.find("burst 1"), std::string::npos);
}
