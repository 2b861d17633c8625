/*
 * test_service_config.cpp - Tests for service configuration loading
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include "config/exception.hpp"
#include "config/service_config.hpp"

#include <filesystem>
#include <fstream>
#include <map>
#include <vector>

using namespace runway::config;
namespace fs = std::filesystem;

namespace {

auto fakeEnv(std::map<std::string, std::string> vars) -> EnvLookup {
    return [vars = std::move(vars)](std::string_view name)
               -> std::optional<std::string> {
        if (auto it = vars.find(std::string(name)); it != vars.end()) {
            return it->second;
        }
        return std::nullopt;
    };
}

auto parse(std::vector<const char*> args) -> CommandLineOptions {
    args.insert(args.begin(), "runway");
    return parseCommandLine(static_cast<int>(args.size()), args.data());
}

}  // namespace

// ============================================================================
// Defaults and JSON
// ============================================================================

TEST(ServiceConfigTest, Defaults) {
    ServiceConfig cfg;
    EXPECT_EQ(cfg.host, "0.0.0.0");
    EXPECT_EQ(cfg.port, 8004);
    EXPECT_GE(cfg.threadCount, 2u);
    EXPECT_TRUE(cfg.tempRoot.empty());
    EXPECT_EQ(cfg.defaultTimeoutSeconds, 10u);
    EXPECT_EQ(cfg.compileTimeoutSeconds, 60u);
    EXPECT_EQ(cfg.maxOutputBytes, 1024u * 1024u);
    EXPECT_EQ(cfg.killGraceMillis, 200u);
}

TEST(ServiceConfigTest, SerializeRoundTripsThroughDeserialize) {
    ServiceConfig cfg;
    cfg.port = 9000;
    cfg.tempRoot = "/var/tmp/runway";
    cfg.logging.level = spdlog::level::debug;

    auto restored = ServiceConfig::deserialize(cfg.serialize());
    EXPECT_EQ(restored.port, 9000);
    EXPECT_EQ(restored.tempRoot, fs::path("/var/tmp/runway"));
    EXPECT_EQ(restored.logging.level, spdlog::level::debug);
}

TEST(ServiceConfigTest, DeserializeKeepsBaseForMissingKeys) {
    ServiceConfig base;
    base.host = "127.0.0.1";
    auto cfg = ServiceConfig::deserialize({{"port", 8100}}, base);
    EXPECT_EQ(cfg.host, "127.0.0.1");
    EXPECT_EQ(cfg.port, 8100);
}

TEST(ServiceConfigTest, DeserializeRejectsBadValues) {
    EXPECT_THROW((void)ServiceConfig::deserialize({{"port", 70000}}),
                 InvalidConfigException);
    EXPECT_THROW((void)ServiceConfig::deserialize({{"port", "eighty"}}),
                 InvalidConfigException);
    EXPECT_THROW((void)ServiceConfig::deserialize({{"threadCount", 0}}),
                 InvalidConfigException);
    EXPECT_THROW((void)ServiceConfig::deserialize(nlohmann::json::array()),
                 InvalidConfigException);
}

TEST(ServiceConfigTest, DeserializeRejectsOutOfRangeThreadCount) {
    EXPECT_THROW((void)ServiceConfig::deserialize({{"threadCount", 65536}}),
                 InvalidConfigException);
    EXPECT_THROW((void)ServiceConfig::deserialize({{"threadCount", 70000}}),
                 InvalidConfigException);
    EXPECT_THROW((void)ServiceConfig::deserialize({{"threadCount", -1}}),
                 InvalidConfigException);
    EXPECT_THROW((void)ServiceConfig::deserialize({{"threadCount", 2.5}}),
                 InvalidConfigException);
    EXPECT_EQ(ServiceConfig::deserialize({{"threadCount", 65535}}).threadCount,
              65535u);
}

TEST(ServiceConfigTest, DeserializeRejectsNegativeLimits) {
    for (const char* key : {"defaultTimeoutSeconds", "compileTimeoutSeconds",
                            "maxOutputBytes", "killGraceMillis"}) {
        EXPECT_THROW((void)ServiceConfig::deserialize({{key, -1}}),
                     InvalidConfigException)
            << key;
    }
}

TEST(ServiceConfigTest, DeserializeRejectsTimeoutsBeyondOneDay) {
    EXPECT_THROW(
        (void)ServiceConfig::deserialize({{"defaultTimeoutSeconds", 86401}}),
        InvalidConfigException);
    EXPECT_THROW((void)ServiceConfig::deserialize(
                     {{"compileTimeoutSeconds", 10000000000ULL}}),
                 InvalidConfigException);
    EXPECT_THROW(
        (void)ServiceConfig::deserialize({{"killGraceMillis", 60001}}),
        InvalidConfigException);
    auto cfg = ServiceConfig::deserialize(
        {{"defaultTimeoutSeconds", 86400}, {"killGraceMillis", 60000}});
    EXPECT_EQ(cfg.defaultTimeoutSeconds, 86400u);
    EXPECT_EQ(cfg.killGraceMillis, 60000u);
}

TEST(ServiceConfigTest, OrchestratorOptionsMirrorConfig) {
    ServiceConfig cfg;
    cfg.tempRoot = "/scratch";
    cfg.defaultTimeoutSeconds = 5;
    cfg.compileTimeoutSeconds = 0;
    cfg.maxOutputBytes = 64;
    cfg.killGraceMillis = 50;

    auto options = cfg.orchestratorOptions();
    EXPECT_EQ(options.tempRoot, fs::path("/scratch"));
    EXPECT_EQ(options.defaultTimeoutSeconds, 5u);
    EXPECT_EQ(options.compileTimeoutSeconds, 0u);
    EXPECT_EQ(options.maxOutputBytes, 64u);
    EXPECT_EQ(options.killGrace, std::chrono::milliseconds(50));
}

// ============================================================================
// File Loading
// ============================================================================

class ServiceConfigFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        path = fs::temp_directory_path() /
               ("runway_config_" + std::to_string(::testing::UnitTest::GetInstance()
                                                      ->random_seed()) +
                "_" + ::testing::UnitTest::GetInstance()
                          ->current_test_info()
                          ->name() +
                ".json");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove(path, ec);
    }

    void write(const std::string& text) {
        std::ofstream out(path);
        out << text;
    }

    fs::path path;
};

TEST_F(ServiceConfigFileTest, MergeFileOverlaysValues) {
    write(R"({"port": 8123, "logging": {"level": "warn"}})");
    ServiceConfig cfg;
    cfg.mergeFile(path);
    EXPECT_EQ(cfg.port, 8123);
    EXPECT_EQ(cfg.logging.level, spdlog::level::warn);
    EXPECT_EQ(cfg.host, "0.0.0.0");
}

TEST_F(ServiceConfigFileTest, MalformedFileThrowsIoException) {
    write("{ not json");
    ServiceConfig cfg;
    EXPECT_THROW(cfg.mergeFile(path), ConfigIOException);
}

TEST_F(ServiceConfigFileTest, MissingFileThrowsIoException) {
    ServiceConfig cfg;
    EXPECT_THROW(cfg.mergeFile(path.string() + ".missing"), ConfigIOException);
}

// ============================================================================
// Environment
// ============================================================================

TEST(ServiceConfigEnvTest, ReadsAllVariables) {
    ServiceConfig cfg;
    cfg.mergeEnvironment(fakeEnv({{"HOST", "127.0.0.1"},
                                  {"PORT", "9100"},
                                  {"EXEC_THREADS", "3"},
                                  {"EXEC_TEMP_ROOT", "/srv/tmp"},
                                  {"EXEC_DEFAULT_TIMEOUT", "20"},
                                  {"EXEC_COMPILE_TIMEOUT", "90"},
                                  {"EXEC_MAX_OUTPUT_BYTES", "2048"},
                                  {"EXEC_KILL_GRACE_MS", "10"},
                                  {"LOG_LEVEL", "DEBUG"},
                                  {"LOG_FILE", "/tmp/runway.log"}}));
    EXPECT_EQ(cfg.host, "127.0.0.1");
    EXPECT_EQ(cfg.port, 9100);
    EXPECT_EQ(cfg.threadCount, 3u);
    EXPECT_EQ(cfg.tempRoot, fs::path("/srv/tmp"));
    EXPECT_EQ(cfg.defaultTimeoutSeconds, 20u);
    EXPECT_EQ(cfg.compileTimeoutSeconds, 90u);
    EXPECT_EQ(cfg.maxOutputBytes, 2048u);
    EXPECT_EQ(cfg.killGraceMillis, 10u);
    EXPECT_EQ(cfg.logging.level, spdlog::level::debug);
    EXPECT_EQ(cfg.logging.filePath, "/tmp/runway.log");
}

TEST(ServiceConfigEnvTest, InvalidPortNamesVariable) {
    ServiceConfig cfg;
    try {
        cfg.mergeEnvironment(fakeEnv({{"PORT", "80x"}}));
        FAIL() << "expected InvalidConfigException";
    } catch (const InvalidConfigException& e) {
        EXPECT_NE(std::string(e.what()).find("PORT"), std::string::npos);
    }
    EXPECT_THROW(cfg.mergeEnvironment(fakeEnv({{"PORT", "0"}})),
                 InvalidConfigException);
    EXPECT_THROW(cfg.mergeEnvironment(fakeEnv({{"EXEC_DEFAULT_TIMEOUT", "-1"}})),
                 InvalidConfigException);
}

TEST(ServiceConfigEnvTest, EmptyEnvironmentChangesNothing) {
    ServiceConfig cfg;
    cfg.mergeEnvironment(fakeEnv({}));
    EXPECT_EQ(cfg.port, 8004);
}

// ============================================================================
// Command Line
// ============================================================================

TEST(CommandLineTest, ParsesSeparateAndInlineValues) {
    auto options = parse({"--port", "9001", "--host=::1", "--config", "a.json"});
    EXPECT_FALSE(options.showHelp);
    ASSERT_TRUE(options.configFile.has_value());
    EXPECT_EQ(*options.configFile, fs::path("a.json"));
    ASSERT_EQ(options.overrides.size(), 2u);
    EXPECT_EQ(options.overrides[0].first, "--port");
    EXPECT_EQ(options.overrides[1].second, "::1");
}

TEST(CommandLineTest, Help) {
    EXPECT_TRUE(parse({"--help"}).showHelp);
    EXPECT_TRUE(parse({"-h"}).showHelp);
    EXPECT_NE(usage("runway").find("--temp-root"), std::string::npos);
}

TEST(CommandLineTest, RejectsUnknownAndIncompleteFlags) {
    EXPECT_THROW((void)parse({"--bogus"}), InvalidConfigException);
    EXPECT_THROW((void)parse({"--port"}), InvalidConfigException);
}

TEST(CommandLineTest, FlagsOverrideEnvironment) {
    auto options = parse({"--port", "9300", "--log-level", "error"});
    auto cfg = loadServiceConfig(
        options, fakeEnv({{"PORT", "9200"}, {"LOG_LEVEL", "debug"},
                          {"HOST", "10.0.0.1"}}));
    EXPECT_EQ(cfg.port, 9300);
    EXPECT_EQ(cfg.logging.level, spdlog::level::err);
    EXPECT_EQ(cfg.host, "10.0.0.1");
}

TEST(CommandLineTest, InvalidFlagValueThrows) {
    auto options = parse({"--threads", "0"});
    EXPECT_THROW((void)loadServiceConfig(options, fakeEnv({})),
                 InvalidConfigException);
}

TEST(CommandLineTest, ThreadCountAboveCrowLimitThrows) {
    EXPECT_THROW((void)loadServiceConfig(parse({"--threads", "65536"}),
                                         fakeEnv({})),
                 InvalidConfigException);
    EXPECT_THROW(
        (void)loadServiceConfig({}, fakeEnv({{"EXEC_THREADS", "100000"}})),
        InvalidConfigException);
    auto cfg = loadServiceConfig(parse({"--threads", "65535"}), fakeEnv({}));
    EXPECT_EQ(cfg.threadCount, 65535u);
}

TEST(CommandLineTest, EnvironmentTimeoutBeyondOneDayThrows) {
    EXPECT_THROW((void)loadServiceConfig(
                     {}, fakeEnv({{"EXEC_DEFAULT_TIMEOUT", "10000000000"}})),
                 InvalidConfigException);
    EXPECT_THROW((void)loadServiceConfig(
                     {}, fakeEnv({{"EXEC_KILL_GRACE_MS",
                                   "18446744073709551615"}})),
                 InvalidConfigException);
}

TEST_F(ServiceConfigFileTest, EnvironmentOverridesFile) {
    write(R"({"port": 8500, "defaultTimeoutSeconds": 4})");
    CommandLineOptions options;
    options.configFile = path;
    auto cfg = loadServiceConfig(options, fakeEnv({{"PORT", "8600"}}));
    EXPECT_EQ(cfg.port, 8600);
    EXPECT_EQ(cfg.defaultTimeoutSeconds, 4u);
}
