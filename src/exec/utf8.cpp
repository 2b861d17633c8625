/*
 * utf8.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "utf8.hpp"

#include <cstddef>
#include <cstdint>

namespace runway::exec::utf8 {

namespace {

// Length of the valid sequence starting at `pos`, or 0 when the bytes there
// form an invalid subsequence. `consumed` receives the length of the maximal
// invalid prefix so that it is replaced by a single U+FFFD.
auto scanSequence(std::string_view bytes, std::size_t pos,
                  std::size_t& consumed) noexcept -> std::size_t {
    const auto byteAt = [&](std::size_t i) -> std::uint8_t {
        return static_cast<std::uint8_t>(bytes[i]);
    };

    const std::uint8_t lead = byteAt(pos);
    consumed = 1;
    if (lead < 0x80) {
        return 1;
    }

    std::size_t length = 0;
    std::uint8_t lower = 0x80;
    std::uint8_t upper = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        length = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        length = 3;
        if (lead == 0xE0) {
            lower = 0xA0;
        } else if (lead == 0xED) {
            upper = 0x9F;
        }
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        length = 4;
        if (lead == 0xF0) {
            lower = 0x90;
        } else if (lead == 0xF4) {
            upper = 0x8F;
        }
    } else {
        return 0;
    }

    for (std::size_t i = 1; i < length; ++i) {
        if (pos + i >= bytes.size()) {
            return 0;
        }
        const std::uint8_t cont = byteAt(pos + i);
        const std::uint8_t lo = i == 1 ? lower : 0x80;
        const std::uint8_t hi = i == 1 ? upper : 0xBF;
        if (cont < lo || cont > hi) {
            return 0;
        }
        consumed = i + 1;
    }
    return length;
}

}  // namespace

auto decodeLossy(std::string_view bytes) -> std::string {
    if (isValid(bytes)) {
        return std::string(bytes);
    }

    std::string out;
    out.reserve(bytes.size() + 8);
    std::size_t pos = 0;
    while (pos < bytes.size()) {
        std::size_t consumed = 0;
        const std::size_t length = scanSequence(bytes, pos, consumed);
        if (length == 0) {
            out.append(kReplacement);
            pos += consumed;
        } else {
            out.append(bytes.substr(pos, length));
            pos += length;
        }
    }
    return out;
}

auto isValid(std::string_view bytes) noexcept -> bool {
    std::size_t pos = 0;
    while (pos < bytes.size()) {
        std::size_t consumed = 0;
        const std::size_t length = scanSequence(bytes, pos, consumed);
        if (length == 0) {
            return false;
        }
        pos += length;
    }
    return true;
}

}  // namespace runway::exec::utf8
