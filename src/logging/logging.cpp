/*
 * logging.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "logging.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <memory>
#include <system_error>
#include <vector>

#include <fmt/format.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace runway::logging {

namespace {
constexpr auto kLoggerName = "runway";

void ensureDirectoryExists(const std::string& filePath) {
    std::filesystem::path path(filePath);
    if (!path.has_parent_path()) {
        return;
    }
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
        throw spdlog::spdlog_ex(
            fmt::format("cannot create log directory {}: {}",
                        path.parent_path().string(), ec.message()));
    }
}
}  // namespace

LoggingConfig::LoggingConfig() = default;

auto LoggingConfig::toJson() const -> nlohmann::json {
    return {{"level", levelToString(level)},
            {"pattern", pattern},
            {"enableConsole", enableConsole},
            {"filePath", filePath},
            {"maxFileSize", maxFileSize},
            {"maxFiles", maxFiles}};
}

auto LoggingConfig::fromJson(const nlohmann::json& j, LoggingConfig base)
    -> LoggingConfig {
    if (j.contains("level")) {
        base.level = levelFromString(j.at("level").get<std::string>());
    }
    base.pattern = j.value("pattern", base.pattern);
    base.enableConsole = j.value("enableConsole", base.enableConsole);
    base.filePath = j.value("filePath", base.filePath);
    base.maxFileSize = j.value("maxFileSize", base.maxFileSize);
    base.maxFiles = j.value("maxFiles", base.maxFiles);
    return base;
}

void initializeLogging(const LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.enableConsole) {
        auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console->set_level(config.level);
        sinks.push_back(std::move(console));
    }

    if (!config.filePath.empty()) {
        ensureDirectoryExists(config.filePath);
        auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.filePath, config.maxFileSize, config.maxFiles);
        file->set_level(config.level);
        sinks.push_back(std::move(file));
    }

    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(),
                                                   sinks.end());
    logger->set_level(config.level);
    logger->set_pattern(config.pattern);
    logger->flush_on(spdlog::level::warn);

    spdlog::drop(kLoggerName);
    spdlog::set_default_logger(std::move(logger));
    spdlog::debug("Logging initialized with {} sinks at level {}",
                  sinks.size(), levelToString(config.level));
}

void shutdownLogging() {
    if (auto logger = spdlog::default_logger()) {
        logger->flush();
    }
    spdlog::shutdown();
}

auto levelFromString(std::string level) -> spdlog::level::level_enum {
    std::ranges::transform(level, level.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (level == "warning") {
        return spdlog::level::warn;
    }
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "info") return spdlog::level::info;
    if (level == "warn") return spdlog::level::warn;
    if (level == "error" || level == "err") return spdlog::level::err;
    if (level == "critical") return spdlog::level::critical;
    if (level == "off") return spdlog::level::off;
    return spdlog::level::info;
}

auto levelToString(spdlog::level::level_enum level) -> std::string {
    auto view = spdlog::level::to_string_view(level);
    return std::string(view.data(), view.size());
}

}  // namespace runway::logging
