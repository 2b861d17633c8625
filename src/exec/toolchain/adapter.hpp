/*
 * adapter.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file adapter.hpp
 * @brief Toolchain adapter interface and the descriptor-driven adapter
 * @date 2024
 * @version 1.0.0
 */

#ifndef RUNWAY_EXEC_TOOLCHAIN_ADAPTER_HPP
#define RUNWAY_EXEC_TOOLCHAIN_ADAPTER_HPP

#include <filesystem>
#include <string>
#include <string_view>

#include "../process_runner.hpp"
#include "../types.hpp"
#include "../workspace.hpp"
#include "descriptor.hpp"

namespace runway::exec {

/**
 * @brief Sources materialized for one request
 */
struct SourceUnit {
    std::filesystem::path file;  ///< Empty for inline languages
    std::string fileName;        ///< Base name, e.g. "main.rs"
    std::string stem;            ///< Base name without extension
};

/**
 * @brief Abstract interface for language toolchains
 *
 * The orchestrator drives every language through the same sequence:
 * materialize, compile (when hasCompileStep()), then runCommand.
 */
class IToolchainAdapter {
public:
    virtual ~IToolchainAdapter() = default;

    [[nodiscard]] virtual auto descriptor() const noexcept
        -> const ToolchainDescriptor& = 0;

    /**
     * @brief Whether materialize() needs an on-disk workspace
     */
    [[nodiscard]] virtual auto needsWorkspace() const noexcept -> bool = 0;

    [[nodiscard]] virtual auto hasCompileStep() const noexcept -> bool = 0;

    /**
     * @brief Write the code into the workspace
     * @param code Submitted source text
     * @param workspace Target directory; may be null when needsWorkspace()
     * is false
     */
    [[nodiscard]] virtual auto materialize(std::string_view code,
                                           const Workspace* workspace) const
        -> Result<SourceUnit> = 0;

    /**
     * @brief Run the compile step
     * @return Nothing on success; CompileError with "Compilation error:\n"
     * prefixed compiler stderr, or ServiceError when the compiler could not
     * run
     */
    [[nodiscard]] virtual auto compile(const SourceUnit& unit,
                                       const Workspace& workspace,
                                       ProcessRunner& runner,
                                       const RunLimits& limits) const
        -> Result<void> = 0;

    /**
     * @brief Build the invocation that runs the program
     */
    [[nodiscard]] virtual auto runCommand(std::string_view code,
                                          const SourceUnit& unit,
                                          const Workspace* workspace) const
        -> CommandLine = 0;
};

/**
 * @brief Adapter that interprets a ToolchainDescriptor
 */
class DescriptorAdapter : public IToolchainAdapter {
public:
    explicit DescriptorAdapter(ToolchainDescriptor descriptor);

    [[nodiscard]] auto descriptor() const noexcept
        -> const ToolchainDescriptor& override {
        return descriptor_;
    }

    [[nodiscard]] auto needsWorkspace() const noexcept -> bool override;
    [[nodiscard]] auto hasCompileStep() const noexcept -> bool override;

    [[nodiscard]] auto materialize(std::string_view code,
                                   const Workspace* workspace) const
        -> Result<SourceUnit> override;

    [[nodiscard]] auto compile(const SourceUnit& unit,
                               const Workspace& workspace,
                               ProcessRunner& runner,
                               const RunLimits& limits) const
        -> Result<void> override;

    [[nodiscard]] auto runCommand(std::string_view code, const SourceUnit& unit,
                                  const Workspace* workspace) const
        -> CommandLine override;

protected:
    /**
     * @brief File name the code is written to
     */
    [[nodiscard]] virtual auto sourceFileName(std::string_view code) const
        -> std::string;

private:
    [[nodiscard]] auto expand(const std::vector<std::string>& argvTemplate,
                              std::string_view code, const SourceUnit& unit,
                              const Workspace* workspace) const -> CommandLine;

    ToolchainDescriptor descriptor_;
};

/**
 * @brief Replace every occurrence of `from` in `text`
 */
[[nodiscard]] auto replaceAll(std::string text, std::string_view from,
                              std::string_view to) -> std::string;

}  // namespace runway::exec

#endif  // RUNWAY_EXEC_TOOLCHAIN_ADAPTER_HPP
