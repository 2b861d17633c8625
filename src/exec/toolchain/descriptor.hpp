/*
 * descriptor.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file descriptor.hpp
 * @brief Static per-language toolchain description
 * @date 2024
 * @version 1.0.0
 */

#ifndef RUNWAY_EXEC_TOOLCHAIN_DESCRIPTOR_HPP
#define RUNWAY_EXEC_TOOLCHAIN_DESCRIPTOR_HPP

#include <string>
#include <string_view>
#include <vector>

namespace runway::exec {

/**
 * @brief How the submitted code reaches the toolchain
 */
enum class SourceStrategy {
    Inline,          ///< Passed as an interpreter argument, nothing on disk
    FixedName,       ///< Written to ToolchainDescriptor::sourceName
    PublicClassName  ///< Written to `{ClassName}{sourceName}`
};

/**
 * @brief Where compile and run commands execute
 */
enum class WorkdirPolicy {
    Inherit,   ///< Service working directory
    Workspace  ///< The request's workspace
};

/**
 * @brief Argument template placeholders expanded by the adapter
 */
namespace placeholder {
inline constexpr std::string_view kCode = "{code}";      ///< Submitted source text
inline constexpr std::string_view kSource = "{source}";  ///< Source file name
inline constexpr std::string_view kStem = "{stem}";      ///< Source name without extension
}  // namespace placeholder

/**
 * @brief Immutable description of one language's toolchain
 */
struct ToolchainDescriptor {
    std::string language;           ///< Canonical tag, also the workspace prefix
    std::vector<std::string> tags;  ///< All accepted request tags
    std::string toolName;           ///< Human name used in diagnostics
    SourceStrategy source{SourceStrategy::Inline};
    std::string sourceName;  ///< File name, or extension for PublicClassName
    std::vector<std::string> compileArgv;  ///< Empty when there is no compile step
    std::vector<std::string> runArgv;
    WorkdirPolicy workdir{WorkdirPolicy::Inherit};
};

}  // namespace runway::exec

#endif  // RUNWAY_EXEC_TOOLCHAIN_DESCRIPTOR_HPP
