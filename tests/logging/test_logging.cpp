/*
 * test_logging.cpp - Tests for logging setup
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include "logging/logging.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>

using namespace runway::logging;
namespace fs = std::filesystem;

// ============================================================================
// Level Conversion
// ============================================================================

TEST(LogLevelTest, FromStringIsCaseInsensitive) {
    EXPECT_EQ(levelFromString("DEBUG"), spdlog::level::debug);
    EXPECT_EQ(levelFromString("Trace"), spdlog::level::trace);
    EXPECT_EQ(levelFromString("critical"), spdlog::level::critical);
    EXPECT_EQ(levelFromString("off"), spdlog::level::off);
}

TEST(LogLevelTest, AliasesAndUnknownNames) {
    EXPECT_EQ(levelFromString("warning"), spdlog::level::warn);
    EXPECT_EQ(levelFromString("err"), spdlog::level::err);
    EXPECT_EQ(levelFromString("error"), spdlog::level::err);
    EXPECT_EQ(levelFromString("loud"), spdlog::level::info);
    EXPECT_EQ(levelFromString(""), spdlog::level::info);
}

TEST(LogLevelTest, ToString) {
    EXPECT_EQ(levelToString(spdlog::level::warn), "warning");
    EXPECT_EQ(levelToString(spdlog::level::info), "info");
    EXPECT_EQ(levelFromString(levelToString(spdlog::level::err)),
              spdlog::level::err);
}

// ============================================================================
// Configuration
// ============================================================================

TEST(LoggingConfigTest, JsonOverlay) {
    LoggingConfig base;
    base.filePath = "logs/a.log";
    auto cfg = LoggingConfig::fromJson({{"level", "debug"}, {"maxFiles", 2}},
                                       base);
    EXPECT_EQ(cfg.level, spdlog::level::debug);
    EXPECT_EQ(cfg.maxFiles, 2u);
    EXPECT_EQ(cfg.filePath, "logs/a.log");
    EXPECT_TRUE(cfg.enableConsole);

    auto restored = LoggingConfig::fromJson(cfg.toJson());
    EXPECT_EQ(restored.level, cfg.level);
    EXPECT_EQ(restored.pattern, cfg.pattern);
}

// ============================================================================
// Initialization
// ============================================================================

class LoggingInitTest : public ::testing::Test {
protected:
    void TearDown() override {
        initializeLogging(LoggingConfig{});
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    fs::path dir = fs::temp_directory_path() / "runway_logging_test";
};

TEST_F(LoggingInitTest, InstallsDefaultLoggerWithLevel) {
    LoggingConfig cfg;
    cfg.level = spdlog::level::warn;
    initializeLogging(cfg);
    auto logger = spdlog::default_logger();
    ASSERT_NE(logger, nullptr);
    EXPECT_EQ(logger->name(), "runway");
    EXPECT_EQ(logger->level(), spdlog::level::warn);
}

TEST_F(LoggingInitTest, FileSinkCreatesDirectoryAndWrites) {
    LoggingConfig cfg;
    cfg.enableConsole = false;
    cfg.filePath = (dir / "nested" / "runway.log").string();
    initializeLogging(cfg);

    spdlog::warn("file sink check");
    spdlog::default_logger()->flush();

    std::ifstream in(cfg.filePath);
    std::string contents((std::istreambuf_iterator<char>(in)),
                         std::istreambuf_iterator<char>());
    EXPECT_NE(contents.find("file sink check"), std::string::npos);
}

TEST_F(LoggingInitTest, ReinitializeReplacesLogger) {
    initializeLogging(LoggingConfig{});
    initializeLogging(LoggingConfig{});
    EXPECT_EQ(spdlog::default_logger()->name(), "runway");
}

TEST_F(LoggingInitTest, UncreatableLogDirectoryThrowsSpdlogException) {
    fs::create_directories(dir);
    const auto blocker = dir / "blocker";
    std::ofstream(blocker) << "not a directory";

    LoggingConfig cfg;
    cfg.enableConsole = false;
    cfg.filePath = (blocker / "sub" / "runway.log").string();
    EXPECT_THROW(initializeLogging(cfg), spdlog::spdlog_ex);

    cfg.filePath = "/proc/self/runway_missing/x/runway.log";
    EXPECT_THROW(initializeLogging(cfg), spdlog::spdlog_ex);
}
