// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <functional>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <type_traits>
#include <variant>

#include <cmath>
#include <cstdint>

#include "types.hpp"

namespace aqsense {

/**
 * @brief Human-readable value of one field
 *
 * Which alternative a field produces is decided by its encoder:
 * - bool: single-bit flags
 * - int64_t: unsigned/signed integers and integer lookup keys
 * - double: fixed-point quantities and real-valued lookup keys
 * - std::string: named lookup keys (operating modes)
 * - Bytes: raw pass-through fields
 */
using FieldValue = std::variant<bool, int64_t, double, std::string, Bytes>;

/// Field name -> value. Order carries no meaning.
using FieldValues = std::map<std::string, FieldValue, std::less<>>;

/// Integer view of a numeric value (bool, integer, or integral double)
inline std::optional<int64_t> as_integer(const FieldValue& value) noexcept {
    if (const auto* b = std::get_if<bool>(&value)) {
        return *b ? 1 : 0;
    }
    if (const auto* i = std::get_if<int64_t>(&value)) {
        return *i;
    }
    if (const auto* d = std::get_if<double>(&value)) {
        if (std::isfinite(*d) && std::trunc(*d) == *d && std::fabs(*d) < 9.2e18) {
            return static_cast<int64_t>(*d);
        }
    }
    return std::nullopt;
}

/// Real view of a numeric value
inline std::optional<double> as_real(const FieldValue& value) noexcept {
    if (const auto* b = std::get_if<bool>(&value)) {
        return *b ? 1.0 : 0.0;
    }
    if (const auto* i = std::get_if<int64_t>(&value)) {
        return static_cast<double>(*i);
    }
    if (const auto* d = std::get_if<double>(&value)) {
        return *d;
    }
    return std::nullopt;
}

inline bool is_numeric(const FieldValue& value) noexcept {
    return std::holds_alternative<bool>(value) || std::holds_alternative<int64_t>(value) ||
           std::holds_alternative<double>(value);
}

/**
 * Compare two values the way lookup tables match keys
 *
 * Numeric alternatives compare by value across types (250 == 250.0, true == 1).
 * Strings and byte sequences only compare equal to their own type.
 */
inline bool values_equal(const FieldValue& a, const FieldValue& b) noexcept {
    if (is_numeric(a) && is_numeric(b)) {
        auto ia = std::get_if<double>(&a) ? std::nullopt : as_integer(a);
        auto ib = std::get_if<double>(&b) ? std::nullopt : as_integer(b);
        if (ia && ib) {
            return *ia == *ib;
        }
        return *as_real(a) == *as_real(b);
    }
    return a == b;
}

/// Name of the alternative held by a value, for error messages
inline const char* value_type_string(const FieldValue& value) noexcept {
    switch (value.index()) {
        case 0:
            return "bool";
        case 1:
            return "integer";
        case 2:
            return "real";
        case 3:
            return "string";
        case 4:
            return "bytes";
    }
    return "unknown";
}

/// Render a value for diagnostics and example output
inline std::string to_string(const FieldValue& value) {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            std::ostringstream os;
            if constexpr (std::is_same_v<T, bool>) {
                os << (v ? "true" : "false");
            } else if constexpr (std::is_same_v<T, std::string>) {
                os << '"' << v << '"';
            } else if constexpr (std::is_same_v<T, Bytes>) {
                os << "0x" << std::hex;
                for (uint8_t b : v) {
                    os << ((b < 0x10) ? "0" : "") << static_cast<unsigned>(b);
                }
            } else {
                os << v;
            }
            return os.str();
        },
        value);
}

} // namespace aqsense
