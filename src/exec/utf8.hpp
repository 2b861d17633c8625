/*
 * utf8.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef RUNWAY_EXEC_UTF8_HPP
#define RUNWAY_EXEC_UTF8_HPP

#include <string>
#include <string_view>

namespace runway::exec::utf8 {

/// U+FFFD encoded as UTF-8.
inline constexpr std::string_view kReplacement = "\xEF\xBF\xBD";

/**
 * @brief Decode raw bytes as UTF-8, replacing every maximal invalid
 * subsequence with U+FFFD
 * @param bytes Captured process output
 * @return Valid UTF-8 text
 */
[[nodiscard]] auto decodeLossy(std::string_view bytes) -> std::string;

/**
 * @brief Check whether the bytes are already well-formed UTF-8
 */
[[nodiscard]] auto isValid(std::string_view bytes) noexcept -> bool;

}  // namespace runway::exec::utf8

#endif  // RUNWAY_EXEC_UTF8_HPP
