/*
 * service_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Description: Execution service configuration

**************************************************/

#ifndef RUNWAY_CONFIG_SERVICE_CONFIG_HPP
#define RUNWAY_CONFIG_SERVICE_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "exec/orchestrator.hpp"
#include "logging/logging.hpp"

namespace runway::config {

using json = nlohmann::json;

/**
 * @brief Environment lookup, injectable for tests
 */
using EnvLookup = std::function<std::optional<std::string>(std::string_view)>;

/**
 * @brief Reads the process environment
 */
[[nodiscard]] auto processEnvironment() -> EnvLookup;

/**
 * @brief Execution service configuration
 *
 * Sources, lowest precedence first: defaults, JSON file, environment,
 * command line.
 *
 * @example
 * ```json
 * {
 *   "host": "0.0.0.0",
 *   "port": 8004,
 *   "threadCount": 8,
 *   "tempRoot": "/tmp",
 *   "defaultTimeoutSeconds": 10,
 *   "compileTimeoutSeconds": 60,
 *   "maxOutputBytes": 1048576,
 *   "killGraceMillis": 200,
 *   "logging": {"level": "info", "filePath": "logs/runway.log"}
 * }
 * ```
 */
struct ServiceConfig {
    // ========================================================================
    // Network Settings
    // ========================================================================

    std::string host{"0.0.0.0"};  ///< Bind address
    int port{8004};               ///< Listen port
    std::size_t threadCount{defaultThreadCount()};  ///< HTTP worker threads

    // ========================================================================
    // Execution Settings
    // ========================================================================

    std::filesystem::path tempRoot;  ///< Empty selects the system temp dir
    std::uint64_t defaultTimeoutSeconds{exec::kDefaultTimeoutSeconds};
    std::uint64_t compileTimeoutSeconds{60};  ///< 0 = unbounded
    std::size_t maxOutputBytes{1024 * 1024};  ///< Per stream, 0 = unbounded
    std::uint64_t killGraceMillis{200};

    // ========================================================================
    // Logging
    // ========================================================================

    logging::LoggingConfig logging;

    ServiceConfig();

    [[nodiscard]] auto serialize() const -> json;

    /**
     * @brief Overlay the keys present in `j` onto `base`
     * @throws InvalidConfigException on out-of-range or mistyped values
     */
    [[nodiscard]] static auto deserialize(const json& j,
                                          ServiceConfig base = {})
        -> ServiceConfig;

    /**
     * @brief Load and overlay a JSON configuration file
     * @throws ConfigIOException when the file cannot be read or parsed
     */
    void mergeFile(const std::filesystem::path& path);

    /**
     * @brief Overlay HOST, PORT, EXEC_* and LOG_* variables
     * @throws InvalidConfigException naming the offending variable
     */
    void mergeEnvironment(const EnvLookup& env);

    /**
     * @brief Options understood by the execution core
     */
    [[nodiscard]] auto orchestratorOptions() const
        -> exec::OrchestratorOptions;

    [[nodiscard]] static auto defaultThreadCount() -> std::size_t;
};

/**
 * @brief Result of command-line parsing
 */
struct CommandLineOptions {
    bool showHelp{false};
    std::optional<std::filesystem::path> configFile;
    std::vector<std::pair<std::string, std::string>>
        overrides;  ///< Flag name and raw value, in argv order
};

/**
 * @brief Parse argv without applying it
 * @throws InvalidConfigException for unknown flags or missing values
 */
[[nodiscard]] auto parseCommandLine(int argc, const char* const* argv)
    -> CommandLineOptions;

/**
 * @brief Apply the flag overrides collected by parseCommandLine
 * @throws InvalidConfigException for invalid values
 */
void applyCommandLine(ServiceConfig& config, const CommandLineOptions& options);

/**
 * @brief Build the effective configuration from all sources
 */
[[nodiscard]] auto loadServiceConfig(const CommandLineOptions& options,
                                     const EnvLookup& env) -> ServiceConfig;

/**
 * @brief Usage text for --help
 */
[[nodiscard]] auto usage(std::string_view program) -> std::string;

}  // namespace runway::config

#endif  // RUNWAY_CONFIG_SERVICE_CONFIG_HPP
