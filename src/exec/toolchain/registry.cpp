/*
 * registry.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "registry.hpp"
#include "java_adapter.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace runway::exec {

auto ToolchainAdapterFactory::create(ToolchainDescriptor descriptor)
    -> std::shared_ptr<const IToolchainAdapter> {
    spdlog::debug("ToolchainAdapterFactory: creating adapter for {}",
                  descriptor.language);
    switch (descriptor.source) {
        case SourceStrategy::PublicClassName:
            return std::make_shared<JavaAdapter>(std::move(descriptor));
        case SourceStrategy::Inline:
        case SourceStrategy::FixedName:
            break;
    }
    return std::make_shared<DescriptorAdapter>(std::move(descriptor));
}

auto ToolchainAdapterFactory::builtinDescriptors()
    -> std::vector<ToolchainDescriptor> {
    using enum SourceStrategy;
    constexpr auto Inherit = WorkdirPolicy::Inherit;
    constexpr auto InWorkspace = WorkdirPolicy::Workspace;
    // clang-format off
    return {
        {"python", {"python"}, "Python", Inline, "",
         {}, {"python3", "-c", "{code}"}, Inherit},
        {"javascript", {"javascript", "typescript"}, "Node.js", Inline, "",
         {}, {"node", "-e", "{code}"}, Inherit},
        {"rust", {"rust"}, "Rust", FixedName, "main.rs",
         {"rustc", "{source}", "-o", "main"}, {"./main"}, InWorkspace},
        {"go", {"go"}, "Go", FixedName, "main.go",
         {}, {"go", "run", "{source}"}, InWorkspace},
        {"cpp", {"cpp", "c++"}, "C++", FixedName, "main.cpp",
         {"g++", "{source}", "-o", "main", "-std=c++17"}, {"./main"}, InWorkspace},
        {"c", {"c"}, "C", FixedName, "main.c",
         {"gcc", "{source}", "-o", "main"}, {"./main"}, InWorkspace},
        {"java", {"java"}, "Java", PublicClassName, ".java",
         {"javac", "{source}"}, {"java", "{stem}"}, InWorkspace},
        {"zig", {"zig"}, "Zig", FixedName, "main.zig",
         {"zig", "build-exe", "{source}"}, {"./main"}, InWorkspace},
        {"elixir", {"elixir"}, "Elixir", FixedName, "main.exs",
         {}, {"elixir", "{source}"}, InWorkspace},
        {"vlang", {"vlang", "v"}, "V", FixedName, "main.v",
         {}, {"v", "run", "{source}"}, InWorkspace},
    };
    // clang-format on
}

ToolchainRegistry::ToolchainRegistry()
    : ToolchainRegistry(ToolchainAdapterFactory::builtinDescriptors()) {}

ToolchainRegistry::ToolchainRegistry(
    std::vector<ToolchainDescriptor> descriptors) {
    for (auto& descriptor : descriptors) {
        add(std::move(descriptor));
    }
    spdlog::debug("ToolchainRegistry: {} language tags registered",
                  adapters_.size());
}

void ToolchainRegistry::add(ToolchainDescriptor descriptor) {
    auto tags = descriptor.tags;
    if (tags.empty()) {
        tags.push_back(descriptor.language);
    }
    auto adapter = ToolchainAdapterFactory::create(std::move(descriptor));
    for (auto& tag : tags) {
        adapters_.insert_or_assign(std::move(tag), adapter);
    }
}

auto ToolchainRegistry::resolve(std::string_view tag) const
    -> Result<std::shared_ptr<const IToolchainAdapter>> {
    auto it = adapters_.find(std::string(tag));
    if (it == adapters_.end()) {
        return std::unexpected(ExecFailure::unsupportedLanguage(tag));
    }
    return it->second;
}

auto ToolchainRegistry::contains(std::string_view tag) const -> bool {
    return adapters_.contains(std::string(tag));
}

auto ToolchainRegistry::languages() const -> std::vector<std::string> {
    std::vector<std::string> tags;
    tags.reserve(adapters_.size());
    for (const auto& [tag, adapter] : adapters_) {
        tags.push_back(tag);
    }
    std::ranges::sort(tags);
    return tags;
}

}  // namespace runway::exec
