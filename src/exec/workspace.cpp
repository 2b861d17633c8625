/*
 * workspace.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "workspace.hpp"

#include <array>
#include <cstdint>
#include <fstream>
#include <random>
#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace runway::exec {

namespace fs = std::filesystem;

namespace {
constexpr int kMaxCreateAttempts = 3;
}

Workspace::Workspace(fs::path path) noexcept : path_(std::move(path)) {}

Workspace::~Workspace() { release(); }

Workspace::Workspace(Workspace&& other) noexcept
    : path_(std::exchange(other.path_, fs::path{})) {}

Workspace& Workspace::operator=(Workspace&& other) noexcept {
    if (this != &other) {
        release();
        path_ = std::exchange(other.path_, fs::path{});
    }
    return *this;
}

auto Workspace::writeFile(std::string_view name, std::string_view content) const
    -> Result<fs::path> {
    auto target = path_ / fs::path(name);
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
        return std::unexpected(ExecFailure::service(
            fmt::format("Failed to write source: cannot open {}",
                        target.string())));
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.close();
    if (!out) {
        return std::unexpected(ExecFailure::service(
            fmt::format("Failed to write source: {}", target.string())));
    }
    return target;
}

void Workspace::release() noexcept {
    if (path_.empty()) {
        return;
    }
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        spdlog::warn("Workspace: failed to remove {}: {}", path_.string(),
                     ec.message());
    } else {
        spdlog::debug("Workspace: removed {}", path_.string());
    }
    path_.clear();
}

WorkspaceManager::WorkspaceManager(fs::path tempRoot)
    : root_(std::move(tempRoot)) {
    if (root_.empty()) {
        root_ = fs::temp_directory_path();
    }
}

auto WorkspaceManager::acquire(std::string_view languageTag) const
    -> Result<Workspace> {
    std::error_code ec;
    for (int attempt = 0; attempt < kMaxCreateAttempts; ++attempt) {
        auto dir = root_ / fmt::format("{}_{}", languageTag, freshToken());
        if (fs::create_directory(dir, ec)) {
            fs::permissions(dir, fs::perms::owner_all,
                            fs::perm_options::replace, ec);
            if (ec) {
                spdlog::warn("Workspace: cannot restrict {}: {}", dir.string(),
                             ec.message());
            }
            spdlog::debug("Workspace: created {}", dir.string());
            return Workspace(std::move(dir));
        }
        if (ec) {
            break;
        }
        // create_directory returned false without error: name already taken.
    }

    spdlog::error("Workspace: cannot create directory under {}: {}",
                  root_.string(), ec ? ec.message() : "name collision");
    return std::unexpected(ExecFailure::service(fmt::format(
        "Failed to create temp dir: {}", ec ? ec.message() : "name collision")));
}

auto WorkspaceManager::freshToken() -> std::string {
    thread_local std::mt19937_64 engine{[] {
        std::random_device device;
        std::seed_seq seq{device(), device(), device(), device(),
                          device(), device(), device(), device()};
        return std::mt19937_64(seq);
    }()};
    std::array<std::uint64_t, 2> words{engine(), engine()};
    return fmt::format("{:016x}{:016x}", words[0], words[1]);
}

}  // namespace runway::exec
