/*
 * registry.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file registry.hpp
 * @brief Language tag to toolchain adapter lookup
 * @date 2024
 * @version 1.0.0
 */

#ifndef RUNWAY_EXEC_TOOLCHAIN_REGISTRY_HPP
#define RUNWAY_EXEC_TOOLCHAIN_REGISTRY_HPP

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "adapter.hpp"
#include "descriptor.hpp"

namespace runway::exec {

/**
 * @brief Factory for toolchain adapters
 */
class ToolchainAdapterFactory {
public:
    /**
     * @brief Create the adapter matching the descriptor's source strategy
     */
    static auto create(ToolchainDescriptor descriptor)
        -> std::shared_ptr<const IToolchainAdapter>;

    /**
     * @brief Descriptors for every supported language
     */
    [[nodiscard]] static auto builtinDescriptors()
        -> std::vector<ToolchainDescriptor>;
};

/**
 * @brief Immutable tag -> adapter table, safe to share between threads
 */
class ToolchainRegistry {
public:
    /**
     * @brief Registry holding the built-in languages
     */
    ToolchainRegistry();

    /**
     * @brief Registry holding exactly the given descriptors
     */
    explicit ToolchainRegistry(std::vector<ToolchainDescriptor> descriptors);

    /**
     * @brief Look up an adapter by exact, case-sensitive tag
     * @return The adapter, or UnsupportedLanguage naming the tag
     */
    [[nodiscard]] auto resolve(std::string_view tag) const
        -> Result<std::shared_ptr<const IToolchainAdapter>>;

    [[nodiscard]] auto contains(std::string_view tag) const -> bool;

    /**
     * @brief All accepted tags, sorted
     */
    [[nodiscard]] auto languages() const -> std::vector<std::string>;

private:
    void add(ToolchainDescriptor descriptor);

    std::unordered_map<std::string, std::shared_ptr<const IToolchainAdapter>>
        adapters_;
};

}  // namespace runway::exec

#endif  // RUNWAY_EXEC_TOOLCHAIN_REGISTRY_HPP
