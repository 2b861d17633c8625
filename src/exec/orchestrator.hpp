/*
 * orchestrator.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file orchestrator.hpp
 * @brief Request driver: workspace, compile, run, cleanup, respond
 * @date 2024
 * @version 1.0.0
 */

#ifndef RUNWAY_EXEC_ORCHESTRATOR_HPP
#define RUNWAY_EXEC_ORCHESTRATOR_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>

#include "process_runner.hpp"
#include "toolchain/registry.hpp"
#include "types.hpp"
#include "workspace.hpp"

namespace runway::exec {

/**
 * @brief Tunables of the execution pipeline
 */
struct OrchestratorOptions {
    std::filesystem::path tempRoot;  ///< Empty selects the system temp dir
    std::uint64_t defaultTimeoutSeconds{kDefaultTimeoutSeconds};
    std::uint64_t compileTimeoutSeconds{60};  ///< 0 = unbounded
    std::size_t maxOutputBytes{1024 * 1024};  ///< Per stream, 0 = unbounded
    std::chrono::milliseconds killGrace{200};
};

/**
 * @brief Executes one request end to end
 *
 * Holds no per-request state; execute() may be called concurrently from any
 * number of threads. Every failure is folded into the returned response.
 */
class ExecutionOrchestrator {
public:
    explicit ExecutionOrchestrator(
        OrchestratorOptions options = {},
        std::shared_ptr<const ToolchainRegistry> registry = nullptr,
        std::shared_ptr<ProcessRunner> runner = nullptr);

    /**
     * @brief Run a request and stamp its wall-clock duration
     */
    [[nodiscard]] auto execute(const ExecutionRequest& request) const
        -> ExecutionResponse;

    /**
     * @brief Deadline applied to the run phase of a request
     */
    [[nodiscard]] auto effectiveTimeout(const ExecutionRequest& request) const
        noexcept -> std::uint64_t;

    [[nodiscard]] auto registry() const noexcept -> const ToolchainRegistry& {
        return *registry_;
    }

    [[nodiscard]] auto workspaces() const noexcept -> const WorkspaceManager& {
        return workspaces_;
    }

private:
    struct RunResult {
        std::string stdoutText;
        std::string stderrText;
        int exitCode{0};
    };

    [[nodiscard]] auto runPipeline(const ExecutionRequest& request) const
        -> Result<RunResult>;

    OrchestratorOptions options_;
    std::shared_ptr<const ToolchainRegistry> registry_;
    std::shared_ptr<ProcessRunner> runner_;
    WorkspaceManager workspaces_;
};

}  // namespace runway::exec

#endif  // RUNWAY_EXEC_ORCHESTRATOR_HPP
