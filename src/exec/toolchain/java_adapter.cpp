/*
 * java_adapter.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "java_adapter.hpp"

#include <sstream>

#include <spdlog/spdlog.h>

namespace runway::exec {

namespace {

auto trimBracesAndSpaces(std::string_view token) -> std::string_view {
    constexpr std::string_view kStrip = "{ ";
    const auto first = token.find_first_not_of(kStrip);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = token.find_last_not_of(kStrip);
    return token.substr(first, last - first + 1);
}

// The name becomes a file name inside the workspace.
auto isUsableFileStem(std::string_view name) -> bool {
    return !name.empty() && name.front() != '.' &&
           name.find_first_of("/\\") == std::string_view::npos;
}

}  // namespace

auto extractJavaClassName(std::string_view code) -> std::optional<std::string> {
    std::istringstream lines{std::string(code)};
    std::string line;
    while (std::getline(lines, line)) {
        if (line.find("public class") == std::string::npos) {
            continue;
        }
        std::istringstream tokens(line);
        std::string token;
        while (tokens >> token) {
            if (token != "class") {
                continue;
            }
            std::string next;
            if (tokens >> next) {
                auto name = trimBracesAndSpaces(next);
                if (isUsableFileStem(name)) {
                    return std::string(name);
                }
            }
            break;
        }
    }
    return std::nullopt;
}

auto JavaAdapter::sourceFileName(std::string_view code) const -> std::string {
    auto className = extractJavaClassName(code);
    if (!className) {
        spdlog::debug("Java adapter: no public class found, using {}",
                      kDefaultJavaClassName);
    }
    return className.value_or(std::string(kDefaultJavaClassName)) +
           descriptor().sourceName;
}

}  // namespace runway::exec
