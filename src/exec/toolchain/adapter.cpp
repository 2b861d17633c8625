/*
 * adapter.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "adapter.hpp"

#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace runway::exec {

auto replaceAll(std::string text, std::string_view from, std::string_view to)
    -> std::string {
    if (from.empty()) {
        return text;
    }
    std::size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
    return text;
}

DescriptorAdapter::DescriptorAdapter(ToolchainDescriptor descriptor)
    : descriptor_(std::move(descriptor)) {}

auto DescriptorAdapter::needsWorkspace() const noexcept -> bool {
    return descriptor_.source != SourceStrategy::Inline;
}

auto DescriptorAdapter::hasCompileStep() const noexcept -> bool {
    return !descriptor_.compileArgv.empty();
}

auto DescriptorAdapter::sourceFileName(std::string_view /*code*/) const
    -> std::string {
    return descriptor_.sourceName;
}

auto DescriptorAdapter::materialize(std::string_view code,
                                    const Workspace* workspace) const
    -> Result<SourceUnit> {
    if (!needsWorkspace()) {
        // Inline code travels as one argv element, which cannot hold a NUL.
        if (code.find('\0') != std::string_view::npos) {
            return std::unexpected(ExecFailure::service(fmt::format(
                "Failed to execute {}: code contains a NUL byte",
                descriptor_.toolName)));
        }
        return SourceUnit{};
    }
    if (workspace == nullptr || !workspace->valid()) {
        return std::unexpected(ExecFailure::service(fmt::format(
            "Failed to write source: no workspace for {}",
            descriptor_.language)));
    }

    SourceUnit unit;
    unit.fileName = sourceFileName(code);
    unit.stem = std::filesystem::path(unit.fileName).stem().string();

    auto written = workspace->writeFile(unit.fileName, code);
    if (!written) {
        return std::unexpected(written.error());
    }
    unit.file = std::move(*written);
    spdlog::debug("{} adapter: wrote {} ({} bytes)", descriptor_.toolName,
                  unit.file.string(), code.size());
    return unit;
}

auto DescriptorAdapter::compile(const SourceUnit& unit,
                                const Workspace& workspace,
                                ProcessRunner& runner,
                                const RunLimits& limits) const
    -> Result<void> {
    if (!hasCompileStep()) {
        return {};
    }

    auto command = expand(descriptor_.compileArgv, {}, unit, &workspace);
    // The compiler always runs inside the workspace so relative outputs
    // such as "-o main" land there.
    command.workingDirectory = workspace.path();

    spdlog::debug("{} adapter: compiling {}", descriptor_.toolName,
                  unit.fileName);
    auto outcome = runner.run(command, limits);
    if (!outcome) {
        const auto& failure = outcome.error();
        switch (failure.code) {
            case RunnerError::SpawnFailed:
                return std::unexpected(ExecFailure::service(
                    fmt::format("{} compiler not available: {}",
                                descriptor_.toolName, failure.reason)));
            case RunnerError::Timeout:
                return std::unexpected(ExecFailure::service(fmt::format(
                    "Compilation timeout ({}s)", limits.deadline.count())));
            case RunnerError::IoError:
            case RunnerError::WaitFailed:
                break;
        }
        return std::unexpected(ExecFailure::service(
            fmt::format("{} compiler failed: {}", descriptor_.toolName,
                        failure.reason)));
    }

    if (outcome->exitCode != 0) {
        spdlog::info("{} adapter: compilation failed with exit code {}",
                     descriptor_.toolName, outcome->exitCode);
        return std::unexpected(ExecFailure::compileError(outcome->stderrText));
    }
    return {};
}

auto DescriptorAdapter::runCommand(std::string_view code,
                                   const SourceUnit& unit,
                                   const Workspace* workspace) const
    -> CommandLine {
    return expand(descriptor_.runArgv, code, unit, workspace);
}

auto DescriptorAdapter::expand(const std::vector<std::string>& argvTemplate,
                               std::string_view code, const SourceUnit& unit,
                               const Workspace* workspace) const
    -> CommandLine {
    CommandLine command;
    command.argv.reserve(argvTemplate.size());
    for (const auto& arg : argvTemplate) {
        // The code is substituted only as a whole argument, so its text is
        // never scanned for further placeholders.
        if (arg == placeholder::kCode) {
            command.argv.emplace_back(code);
            continue;
        }
        auto expanded = replaceAll(arg, placeholder::kSource, unit.fileName);
        command.argv.push_back(
            replaceAll(std::move(expanded), placeholder::kStem, unit.stem));
    }
    if (descriptor_.workdir == WorkdirPolicy::Workspace &&
        workspace != nullptr) {
        command.workingDirectory = workspace->path();
    }
    return command;
}

}  // namespace runway::exec
