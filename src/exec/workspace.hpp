/*
 * workspace.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file workspace.hpp
 * @brief Ephemeral per-request directories
 * @date 2024
 * @version 1.0.0
 */

#ifndef RUNWAY_EXEC_WORKSPACE_HPP
#define RUNWAY_EXEC_WORKSPACE_HPP

#include <filesystem>
#include <string>
#include <string_view>

#include "types.hpp"

namespace runway::exec {

/**
 * @brief Owning handle to a unique temporary directory
 *
 * The directory tree is removed when the handle is released or destroyed,
 * whichever comes first. Release failures are logged and never reported.
 */
class Workspace {
public:
    Workspace() = default;
    explicit Workspace(std::filesystem::path path) noexcept;
    ~Workspace();

    Workspace(const Workspace&) = delete;
    Workspace& operator=(const Workspace&) = delete;
    Workspace(Workspace&& other) noexcept;
    Workspace& operator=(Workspace&& other) noexcept;

    [[nodiscard]] auto path() const noexcept -> const std::filesystem::path& {
        return path_;
    }

    [[nodiscard]] auto valid() const noexcept -> bool { return !path_.empty(); }

    /**
     * @brief Write a file inside the workspace
     * @param name Relative file name
     * @param content Bytes to write
     */
    [[nodiscard]] auto writeFile(std::string_view name,
                                 std::string_view content) const
        -> Result<std::filesystem::path>;

    /**
     * @brief Remove the directory tree now. Idempotent.
     */
    void release() noexcept;

private:
    std::filesystem::path path_;
};

/**
 * @brief Creates workspaces named `{root}/{tag}_{128-bit hex token}`
 */
class WorkspaceManager {
public:
    explicit WorkspaceManager(std::filesystem::path tempRoot);

    /**
     * @brief Create a fresh workspace for one request
     * @param languageTag Prefix of the directory name
     * @return Owning workspace handle, or a service error when the OS
     * refuses directory creation
     */
    [[nodiscard]] auto acquire(std::string_view languageTag) const
        -> Result<Workspace>;

    [[nodiscard]] auto root() const noexcept -> const std::filesystem::path& {
        return root_;
    }

    /**
     * @brief Generate a 128-bit random token rendered as 32 hex digits
     */
    [[nodiscard]] static auto freshToken() -> std::string;

private:
    std::filesystem::path root_;
};

}  // namespace runway::exec

#endif  // RUNWAY_EXEC_WORKSPACE_HPP
