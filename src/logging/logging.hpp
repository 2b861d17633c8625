/*
 * logging.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file logging.hpp
 * @brief spdlog setup for the service: console and rotating file sinks
 * behind one default logger
 * @date 2024
 */

#ifndef RUNWAY_LOGGING_LOGGING_HPP
#define RUNWAY_LOGGING_LOGGING_HPP

#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace runway::logging {

/**
 * @brief Logging configuration
 */
struct LoggingConfig {
    spdlog::level::level_enum level{spdlog::level::info};
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%t] %v"};
    bool enableConsole{true};
    std::string filePath;                    ///< Empty disables the file sink
    std::size_t maxFileSize{10 * 1024 * 1024};  ///< 10MB per file
    std::size_t maxFiles{5};

    LoggingConfig();

    [[nodiscard]] auto toJson() const -> nlohmann::json;

    /**
     * @brief Overlay the keys present in `j` onto `base`
     */
    [[nodiscard]] static auto fromJson(const nlohmann::json& j,
                                       LoggingConfig base = {})
        -> LoggingConfig;
};

/**
 * @brief Install the "runway" logger as spdlog's default logger
 *
 * Safe to call again; the previous default logger is replaced.
 * @throws spdlog::spdlog_ex when the log file cannot be opened
 */
void initializeLogging(const LoggingConfig& config);

/**
 * @brief Flush and drop all loggers
 */
void shutdownLogging();

/**
 * @brief Convert level string to spdlog enum; unknown names map to info
 */
[[nodiscard]] auto levelFromString(std::string level)
    -> spdlog::level::level_enum;

/**
 * @brief Convert spdlog level enum to string
 */
[[nodiscard]] auto levelToString(spdlog::level::level_enum level)
    -> std::string;

}  // namespace runway::logging

#endif  // RUNWAY_LOGGING_LOGGING_HPP
