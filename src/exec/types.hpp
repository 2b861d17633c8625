/*
 * types.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file types.hpp
 * @brief Request, response and error types shared by the execution core
 * @date 2024
 * @version 1.0.0
 */

#ifndef RUNWAY_EXEC_TYPES_HPP
#define RUNWAY_EXEC_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace runway::exec {

/// Timeout applied when a request carries `timeout == 0`.
inline constexpr std::uint64_t kDefaultTimeoutSeconds = 10;

/// Upper bound on any compile or run deadline. Keeps steady_clock arithmetic
/// in range.
inline constexpr std::uint64_t kMaxDeadlineSeconds = 24 * 60 * 60;

/// Upper bound on the SIGTERM to SIGKILL grace period.
inline constexpr std::uint64_t kMaxKillGraceMillis = 60 * 1000;

/// Exit code reported when no child status exists.
inline constexpr int kSyntheticExitCode = 1;

/**
 * @brief A code submission accepted by the service
 */
struct ExecutionRequest {
    std::string code;                ///< Source text to run
    std::string language;            ///< Language tag, lowercase
    std::uint64_t timeoutSeconds{0};  ///< 0 selects the default
};

/**
 * @brief Terminal outcome of an execution, returned for every request
 */
struct ExecutionResponse {
    std::string stdoutText;
    std::string stderrText;
    int exitCode{0};
    double executionTimeMs{0.0};  ///< Wall clock, compile included
};

/**
 * @brief In-band failure categories
 */
enum class ExecError {
    UnsupportedLanguage,  ///< Tag outside the supported set
    CompileError,         ///< Compiler exited non-zero
    Timeout,              ///< Run deadline expired
    ServiceError          ///< Host-side failure (temp dir, spawn, missing tool)
};

/**
 * @brief Get string representation of ExecError
 */
[[nodiscard]] constexpr std::string_view execErrorToString(
    ExecError error) noexcept {
    switch (error) {
        case ExecError::UnsupportedLanguage: return "UnsupportedLanguage";
        case ExecError::CompileError: return "CompileError";
        case ExecError::Timeout: return "Timeout";
        case ExecError::ServiceError: return "ServiceError";
    }
    return "Unknown";
}

/**
 * @brief Failure with the message that becomes the response stderr
 */
struct ExecFailure {
    ExecError kind{ExecError::ServiceError};
    std::string message;

    [[nodiscard]] static auto unsupportedLanguage(std::string_view tag)
        -> ExecFailure {
        return {ExecError::UnsupportedLanguage,
                "Unsupported language: " + std::string(tag)};
    }

    [[nodiscard]] static auto compileError(std::string_view compilerStderr)
        -> ExecFailure {
        return {ExecError::CompileError,
                "Compilation error:\n" + std::string(compilerStderr)};
    }

    [[nodiscard]] static auto timeout(std::uint64_t seconds) -> ExecFailure {
        return {ExecError::Timeout,
                "Execution timeout (" + std::to_string(seconds) + "s)"};
    }

    [[nodiscard]] static auto service(std::string message) -> ExecFailure {
        return {ExecError::ServiceError, std::move(message)};
    }
};

/**
 * @brief Result type for execution core operations
 */
template <typename T>
using Result = std::expected<T, ExecFailure>;

/**
 * @brief A fully expanded process invocation
 */
struct CommandLine {
    std::vector<std::string> argv;
    std::filesystem::path workingDirectory;  ///< Empty inherits the service cwd
};

/**
 * @brief Limits applied by the process runner to one spawned child
 */
struct RunLimits {
    std::chrono::seconds deadline{0};  ///< 0 = no deadline
    std::size_t maxOutputBytes{0};     ///< Per stream, 0 = unbounded
    std::chrono::milliseconds killGrace{200};
};

}  // namespace runway::exec

#endif  // RUNWAY_EXEC_TYPES_HPP
