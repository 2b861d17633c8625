/*
 * process_runner.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file process_runner.hpp
 * @brief Child process spawning with captured output and a wall-clock
 * deadline
 * @date 2024
 * @version 1.0.0
 */

#ifndef RUNWAY_EXEC_PROCESS_RUNNER_HPP
#define RUNWAY_EXEC_PROCESS_RUNNER_HPP

#include <chrono>
#include <expected>
#include <string>
#include <string_view>

#include "types.hpp"

namespace runway::exec {

/**
 * @brief Error codes for the process runner
 */
enum class RunnerError {
    SpawnFailed,  ///< pipe/fork/exec failed; the program did not start
    Timeout,      ///< Deadline expired, the child was killed
    IoError,      ///< Reading the child's output failed
    WaitFailed    ///< waitpid reported an error
};

/**
 * @brief Get string representation of RunnerError
 */
[[nodiscard]] constexpr std::string_view runnerErrorToString(
    RunnerError error) noexcept {
    switch (error) {
        case RunnerError::SpawnFailed: return "Spawn failed";
        case RunnerError::Timeout: return "Timeout";
        case RunnerError::IoError: return "I/O error";
        case RunnerError::WaitFailed: return "Wait failed";
    }
    return "Unknown error";
}

struct RunnerFailure {
    RunnerError code{RunnerError::SpawnFailed};
    std::string reason;
};

/**
 * @brief Output of a child that terminated on its own
 */
struct ProcessOutput {
    std::string stdoutText;  ///< Lossily decoded UTF-8
    std::string stderrText;  ///< Lossily decoded UTF-8
    int exitCode{0};         ///< Exit status, or 1 when signal-terminated
    bool stdoutTruncated{false};
    bool stderrTruncated{false};
    std::chrono::milliseconds elapsed{0};
};

using RunOutcome = std::expected<ProcessOutput, RunnerFailure>;

/// Appended to a stream that hit RunLimits::maxOutputBytes.
inline constexpr std::string_view kTruncationMarker = "\n[output truncated]";

/**
 * @brief Spawns one child per call and harvests it
 *
 * stdin is bound to /dev/null. The child leads its own process group so the
 * deadline kill reaches anything it forks. The calling thread blocks in
 * poll(2) until the child exits or the deadline passes; other requests are
 * served by the remaining server workers.
 */
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    /**
     * @brief Run a command to completion or deadline
     * @param command argv and working directory; argv[0] is looked up on PATH
     * unless it contains a slash
     * @param limits Deadline, output cap and kill grace period
     */
    [[nodiscard]] virtual auto run(const CommandLine& command,
                                   const RunLimits& limits) -> RunOutcome;
};

}  // namespace runway::exec

#endif  // RUNWAY_EXEC_PROCESS_RUNNER_HPP
