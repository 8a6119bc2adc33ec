// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <span>

#include <cassert>
#include <cstddef>
#include <cstdint>

#include "types.hpp"

namespace aqsense {
namespace detail {

// Largest unsigned value representable in `width` bytes
constexpr uint64_t max_unsigned(size_t width) noexcept {
    return width >= max_integer_width ? UINT64_MAX : (uint64_t{1} << (width * 8)) - 1;
}

constexpr int64_t min_signed(size_t width) noexcept {
    return width >= max_integer_width ? INT64_MIN : -(int64_t{1} << (width * 8 - 1));
}

constexpr int64_t max_signed(size_t width) noexcept {
    return width >= max_integer_width ? INT64_MAX : (int64_t{1} << (width * 8 - 1)) - 1;
}

constexpr bool fits_unsigned(uint64_t value, size_t width) noexcept {
    return width > 0 && value <= max_unsigned(width);
}

constexpr bool fits_signed(int64_t value, size_t width) noexcept {
    return width > 0 && value >= min_signed(width) && value <= max_signed(width);
}

// Interpret the low `width` bytes of `value` as two's complement
constexpr int64_t sign_extend(uint64_t value, size_t width) noexcept {
    if (width == 0 || width >= max_integer_width) {
        return static_cast<int64_t>(value);
    }
    const unsigned bits = static_cast<unsigned>(width * 8);
    const uint64_t sign_bit = uint64_t{1} << (bits - 1);
    value &= max_unsigned(width);
    return static_cast<int64_t>((value ^ sign_bit) - sign_bit);
}

} // namespace detail

/**
 * Read an unsigned integer of 1-8 bytes
 * @param bytes Source bytes (size must not exceed max_integer_width)
 * @param order Byte order of the source
 * @return Value in host representation
 */
constexpr uint64_t load_uint(std::span<const uint8_t> bytes, ByteOrder order) noexcept {
    assert(bytes.size() <= max_integer_width);
    uint64_t value = 0;
    if (order == ByteOrder::big) {
        for (uint8_t b : bytes) {
            value = (value << 8) | b;
        }
    } else {
        for (size_t i = bytes.size(); i > 0; --i) {
            value = (value << 8) | bytes[i - 1];
        }
    }
    return value;
}

/**
 * Write the low `width` bytes of an unsigned integer
 * @param value Value to pack (caller checks it fits)
 * @param width Output size in bytes (1-8)
 * @param order Byte order of the output
 */
inline Bytes store_uint(uint64_t value, size_t width, ByteOrder order) {
    assert(width <= max_integer_width);
    Bytes out(width, 0);
    for (size_t i = 0; i < width; ++i) {
        const auto b = static_cast<uint8_t>(value >> (8 * i));
        if (order == ByteOrder::big) {
            out[width - 1 - i] = b;
        } else {
            out[i] = b;
        }
    }
    return out;
}

} // namespace aqsense
