/*
 * test_log_config.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file test_log_config.cpp
 * @brief Tests for logger setup
 */

#include <gtest/gtest.h>
#include "logging/log_config.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

using namespace warden::logging;
namespace fs = std::filesystem;

// =============================================================================
// Level Parsing
// =============================================================================

class LogLevelTest : public ::testing::Test {};

TEST_F(LogLevelTest, ParseKnownNames) {
    EXPECT_EQ(parseLogLevel("trace"), LogLevel::TRACE);
    EXPECT_EQ(parseLogLevel("debug"), LogLevel::DEBUG);
    EXPECT_EQ(parseLogLevel("info"), LogLevel::INFO);
    EXPECT_EQ(parseLogLevel("warn"), LogLevel::WARN);
    EXPECT_EQ(parseLogLevel("warning"), LogLevel::WARN);
    EXPECT_EQ(parseLogLevel("err"), LogLevel::ERROR);
    EXPECT_EQ(parseLogLevel("off"), LogLevel::OFF);
}

TEST_F(LogLevelTest, ParseUnknownName) {
    EXPECT_FALSE(parseLogLevel("verbose").has_value());
    EXPECT_FALSE(parseLogLevel("").has_value());
}

TEST_F(LogLevelTest, FromConfig) {
    warden::config::LoggingConfig cfg;
    cfg.level = "debug";
    cfg.fileOutput = true;
    cfg.logFilePath = "/tmp/x.log";

    auto out = LoggerConfig::fromConfig(cfg);
    EXPECT_EQ(out.level, LogLevel::DEBUG);
    EXPECT_TRUE(out.file_output);
    EXPECT_EQ(out.log_file_path, "/tmp/x.log");
}

TEST_F(LogLevelTest, FromConfigFallsBackToInfo) {
    warden::config::LoggingConfig cfg;
    cfg.level = "loud";
    EXPECT_EQ(LoggerConfig::fromConfig(cfg).level, LogLevel::INFO);
}

// =============================================================================
// LogConfig
// =============================================================================

class LogConfigTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        logDir_ = fs::temp_directory_path() / "warden_log_config_test";
        fs::remove_all(logDir_);

        LoggerConfig cfg;
        cfg.level = LogLevel::DEBUG;
        cfg.console_output = false;
        cfg.file_output = true;
        cfg.log_file_path = (logDir_ / "warden.log").string();
        LogConfig::initialize(cfg);
    }

    static void TearDownTestSuite() {
        std::error_code ec;
        fs::remove_all(logDir_, ec);
    }

    static std::string readLog() {
        LogConfig::flushAll();
        std::ifstream in(logDir_ / "warden.log");
        return std::string(std::istreambuf_iterator<char>(in),
                           std::istreambuf_iterator<char>());
    }

    static inline fs::path logDir_;
};

TEST_F(LogConfigTest, Initialized) {
    EXPECT_TRUE(LogConfig::isInitialized());
    EXPECT_TRUE(fs::exists(logDir_));
}

TEST_F(LogConfigTest, DefaultLoggerIsInstalled) {
    EXPECT_EQ(spdlog::default_logger()->name(), std::string(kDefaultLogger));
}

TEST_F(LogConfigTest, GetLoggerIsCached) {
    auto first = LogConfig::getLogger("warden.test");
    auto second = LogConfig::getLogger("warden.test");
    EXPECT_EQ(first.get(), second.get());
}

TEST_F(LogConfigTest, AuditRecordsReachTheFile) {
    LogConfig::audit()->info("execution correlation_id=abc state=COMPLETED");
    auto contents = readLog();
    EXPECT_NE(contents.find("[warden.audit]"), std::string::npos);
    EXPECT_NE(contents.find("correlation_id=abc"), std::string::npos);
}

TEST_F(LogConfigTest, GlobalLevelFiltersRecords) {
    auto logger = LogConfig::getLogger("warden.level");
    LogConfig::setGlobalLevel(LogLevel::ERROR);
    logger->info("filtered-out-record");
    LogConfig::setGlobalLevel(LogLevel::DEBUG);
    logger->info("kept-record");

    auto contents = readLog();
    EXPECT_EQ(contents.find("filtered-out-record"), std::string::npos);
    EXPECT_NE(contents.find("kept-record"), std::string::npos);
}

TEST_F(LogConfigTest, SecondInitializeIsIgnored) {
    LoggerConfig other;
    other.file_output = false;
    LogConfig::initialize(other);
    EXPECT_TRUE(LogConfig::isInitialized());

    spdlog::info("still-logging-to-file");
    EXPECT_NE(readLog().find("still-logging-to-file"), std::string::npos);
}
