/*
 * java_adapter.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef RUNWAY_EXEC_TOOLCHAIN_JAVA_ADAPTER_HPP
#define RUNWAY_EXEC_TOOLCHAIN_JAVA_ADAPTER_HPP

#include <optional>
#include <string>
#include <string_view>

#include "adapter.hpp"

namespace runway::exec {

/// Class name used when the source declares no public class.
inline constexpr std::string_view kDefaultJavaClassName = "Main";

/**
 * @brief Find the public class name by a line-oriented textual scan
 *
 * The first line containing "public class" whose whitespace-separated token
 * after "class" is non-empty once surrounding braces and spaces are stripped
 * provides the name. The language is not parsed.
 */
[[nodiscard]] auto extractJavaClassName(std::string_view code)
    -> std::optional<std::string>;

/**
 * @brief Adapter for toolchains whose source file is named after the
 * public class (JVM family)
 */
class JavaAdapter : public DescriptorAdapter {
public:
    using DescriptorAdapter::DescriptorAdapter;

protected:
    [[nodiscard]] auto sourceFileName(std::string_view code) const
        -> std::string override;
};

}  // namespace runway::exec

#endif  // RUNWAY_EXEC_TOOLCHAIN_JAVA_ADAPTER_HPP
