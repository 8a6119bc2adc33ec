// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <bit>
#include <optional>

#include <cstddef>
#include <cstdint>

#include "../endian.hpp"

namespace aqsense::detail {

// Shift that moves a masked field down to bit 0.
// A zero mask has no trailing-zero count and yields std::nullopt.
constexpr std::optional<unsigned> mask_shift(uint64_t mask) noexcept {
    if (mask == 0) {
        return std::nullopt;
    }
    return static_cast<unsigned>(std::countr_zero(mask));
}

// True if every set bit of the mask lies inside `width` bytes
constexpr bool mask_fits_width(uint64_t mask, size_t width) noexcept {
    return width > 0 && width <= max_integer_width && (mask & ~max_unsigned(width)) == 0;
}

// Extract a field: mask, then shift down
constexpr uint64_t extract_masked(uint64_t raw, uint64_t mask, unsigned shift) noexcept {
    return (raw & mask) >> shift;
}

// Place an already-extracted value back under its mask.
// Returns std::nullopt if the value has bits outside the mask.
constexpr std::optional<uint64_t> insert_masked(uint64_t value, uint64_t mask,
                                                unsigned shift) noexcept {
    if (value > (mask >> shift)) {
        return std::nullopt;
    }
    const uint64_t placed = value << shift;
    if ((placed & ~mask) != 0) {
        return std::nullopt;
    }
    return placed;
}

} // namespace aqsense::detail
