/*
 * orchestrator.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "orchestrator.hpp"

#include <algorithm>
#include <cstdint>
#include <exception>
#include <optional>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace runway::exec {

ExecutionOrchestrator::ExecutionOrchestrator(
    OrchestratorOptions options,
    std::shared_ptr<const ToolchainRegistry> registry,
    std::shared_ptr<ProcessRunner> runner)
    : options_(std::move(options)),
      registry_(registry ? std::move(registry)
                         : std::make_shared<const ToolchainRegistry>()),
      runner_(runner ? std::move(runner) : std::make_shared<ProcessRunner>()),
      workspaces_(options_.tempRoot) {
    if (options_.defaultTimeoutSeconds == 0) {
        options_.defaultTimeoutSeconds = kDefaultTimeoutSeconds;
    }
    options_.defaultTimeoutSeconds =
        std::min(options_.defaultTimeoutSeconds, kMaxDeadlineSeconds);
    options_.compileTimeoutSeconds =
        std::min(options_.compileTimeoutSeconds, kMaxDeadlineSeconds);
    options_.killGrace = std::clamp(
        options_.killGrace, std::chrono::milliseconds(0),
        std::chrono::milliseconds(
            static_cast<std::int64_t>(kMaxKillGraceMillis)));
    spdlog::info(
        "ExecutionOrchestrator: temp root {}, default timeout {}s, compile "
        "timeout {}s, output cap {} bytes",
        workspaces_.root().string(), options_.defaultTimeoutSeconds,
        options_.compileTimeoutSeconds, options_.maxOutputBytes);
}

auto ExecutionOrchestrator::effectiveTimeout(
    const ExecutionRequest& request) const noexcept -> std::uint64_t {
    if (request.timeoutSeconds == 0) {
        return options_.defaultTimeoutSeconds;
    }
    return std::min(request.timeoutSeconds, kMaxDeadlineSeconds);
}

auto ExecutionOrchestrator::execute(const ExecutionRequest& request) const
    -> ExecutionResponse {
    const auto start = std::chrono::steady_clock::now();
    spdlog::info("Executing {} code ({} bytes)", request.language,
                 request.code.size());

    ExecutionResponse response;
    Result<RunResult> result = std::unexpected(ExecFailure::service(""));
    try {
        result = runPipeline(request);
    } catch (const std::exception& e) {
        spdlog::error("ExecutionOrchestrator: unexpected failure: {}",
                      e.what());
        result = std::unexpected(ExecFailure::service(
            fmt::format("Internal error: {}", e.what())));
    }

    if (result) {
        response.stdoutText = std::move(result->stdoutText);
        response.stderrText = std::move(result->stderrText);
        response.exitCode = result->exitCode;
    } else {
        const auto& failure = result.error();
        if (failure.kind == ExecError::ServiceError) {
            spdlog::error("ExecutionOrchestrator: {} request failed: {}",
                          request.language, failure.message);
        } else {
            spdlog::info("ExecutionOrchestrator: {} request ended with {}",
                         request.language, execErrorToString(failure.kind));
        }
        response.stderrText = failure.message;
        response.exitCode = kSyntheticExitCode;
    }

    response.executionTimeMs =
        std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - start)
            .count();
    return response;
}

auto ExecutionOrchestrator::runPipeline(const ExecutionRequest& request) const
    -> Result<RunResult> {
    auto resolved = registry_->resolve(request.language);
    if (!resolved) {
        return std::unexpected(resolved.error());
    }
    const auto& adapter = *resolved;
    const auto& descriptor = adapter->descriptor();

    // Released on every path out of this function.
    std::optional<Workspace> workspace;
    if (adapter->needsWorkspace()) {
        auto acquired = workspaces_.acquire(descriptor.language);
        if (!acquired) {
            return std::unexpected(acquired.error());
        }
        workspace.emplace(std::move(*acquired));
    }
    const Workspace* workspacePtr = workspace ? &*workspace : nullptr;

    auto unit = adapter->materialize(request.code, workspacePtr);
    if (!unit) {
        return std::unexpected(unit.error());
    }

    if (adapter->hasCompileStep()) {
        if (!workspace) {
            return std::unexpected(ExecFailure::service(fmt::format(
                "{} toolchain compiles but has no workspace",
                descriptor.toolName)));
        }
        RunLimits compileLimits;
        compileLimits.deadline =
            std::chrono::seconds(
                static_cast<std::int64_t>(options_.compileTimeoutSeconds));
        compileLimits.maxOutputBytes = options_.maxOutputBytes;
        compileLimits.killGrace = options_.killGrace;
        if (auto compiled =
                adapter->compile(*unit, *workspace, *runner_, compileLimits);
            !compiled) {
            return std::unexpected(compiled.error());
        }
    }

    const auto timeout = effectiveTimeout(request);
    RunLimits runLimits;
    runLimits.deadline =
        std::chrono::seconds(static_cast<std::int64_t>(timeout));
    runLimits.maxOutputBytes = options_.maxOutputBytes;
    runLimits.killGrace = options_.killGrace;

    auto command = adapter->runCommand(request.code, *unit, workspacePtr);
    auto outcome = runner_->run(command, runLimits);
    if (!outcome) {
        const auto& failure = outcome.error();
        switch (failure.code) {
            case RunnerError::Timeout:
                return std::unexpected(ExecFailure::timeout(timeout));
            case RunnerError::SpawnFailed:
                return std::unexpected(ExecFailure::service(fmt::format(
                    "Failed to execute {}: {}", descriptor.toolName,
                    failure.reason)));
            case RunnerError::IoError:
            case RunnerError::WaitFailed:
                break;
        }
        return std::unexpected(ExecFailure::service(
            fmt::format("Process error: {}", failure.reason)));
    }

    return RunResult{std::move(outcome->stdoutText),
                     std::move(outcome->stderrText), outcome->exitCode};
}

}  // namespace runway::exec
