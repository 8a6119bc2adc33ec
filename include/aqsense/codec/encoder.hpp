// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <initializer_list>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <cmath>
#include <cstddef>
#include <cstdint>

#include "../core/endian.hpp"
#include "../core/error.hpp"
#include "../core/types.hpp"
#include "../core/value.hpp"

namespace aqsense {

/**
 * @brief Geometry an encoder needs from the field it serves
 *
 * Encoders are shared between fields, so the width and byte order are
 * passed in on every call instead of being stored in the encoder.
 */
struct FieldShape {
    size_t width;    ///< Bytes spanned by the field (first..last index inclusive)
    ByteOrder order; ///< Byte order of the field
};

namespace detail {

inline int64_t integer_argument(const FieldValue& value, const char* encoder) {
    if (const auto* b = std::get_if<bool>(&value)) {
        return *b ? 1 : 0;
    }
    if (const auto* i = std::get_if<int64_t>(&value)) {
        return *i;
    }
    throw CodecError(std::string(encoder) + " expects an integer, got " + value_type_string(value));
}

inline void require_integer_width(size_t width, const char* encoder) {
    if (width == 0 || width > max_integer_width) {
        throw CodecError(std::string(encoder) + " cannot handle a " + std::to_string(width) +
                         " byte field");
    }
}

} // namespace detail

/// Unsigned integer, width taken from the field's byte span
struct UIntEncoder {
    static constexpr const char* name = "uint";

    Bytes encode(const FieldValue& value, FieldShape shape) const {
        detail::require_integer_width(shape.width, name);
        const int64_t v = detail::integer_argument(value, name);
        if (v < 0 || !detail::fits_unsigned(static_cast<uint64_t>(v), shape.width)) {
            throw CodecError(std::to_string(v) + " does not fit in " +
                             std::to_string(shape.width) + " unsigned byte(s)");
        }
        return store_uint(static_cast<uint64_t>(v), shape.width, shape.order);
    }

    FieldValue decode(std::span<const uint8_t> bytes, FieldShape shape) const {
        detail::require_integer_width(bytes.size(), name);
        const uint64_t raw = load_uint(bytes, shape.order);
        if (raw > static_cast<uint64_t>(INT64_MAX)) {
            throw CodecError("unsigned value exceeds the integer range");
        }
        return static_cast<int64_t>(raw);
    }
};

/// Two's complement signed integer
struct SIntEncoder {
    static constexpr const char* name = "sint";

    Bytes encode(const FieldValue& value, FieldShape shape) const {
        detail::require_integer_width(shape.width, name);
        const int64_t v = detail::integer_argument(value, name);
        if (!detail::fits_signed(v, shape.width)) {
            throw CodecError(std::to_string(v) + " does not fit in " +
                             std::to_string(shape.width) + " signed byte(s)");
        }
        return store_uint(static_cast<uint64_t>(v) & detail::max_unsigned(shape.width),
                          shape.width, shape.order);
    }

    FieldValue decode(std::span<const uint8_t> bytes, FieldShape shape) const {
        detail::require_integer_width(bytes.size(), name);
        return detail::sign_extend(load_uint(bytes, shape.order), bytes.size());
    }
};

/// Boolean flag: false <-> 0, true <-> 1
struct FlagEncoder {
    static constexpr const char* name = "flag";

    Bytes encode(const FieldValue& value, FieldShape shape) const {
        detail::require_integer_width(shape.width, name);
        const int64_t v = detail::integer_argument(value, name);
        if (v != 0 && v != 1) {
            throw CodecError("flag value must be 0 or 1, got " + std::to_string(v));
        }
        return store_uint(static_cast<uint64_t>(v), shape.width, shape.order);
    }

    FieldValue decode(std::span<const uint8_t> bytes, FieldShape shape) const {
        detail::require_integer_width(bytes.size(), name);
        const uint64_t raw = load_uint(bytes, shape.order);
        if (raw > 1) {
            throw CodecError("flag raw value must be 0 or 1, got " + std::to_string(raw));
        }
        return raw == 1;
    }
};

/// Raw bytes, passed through unchanged
struct BytesEncoder {
    static constexpr const char* name = "bytes";

    Bytes encode(const FieldValue& value, FieldShape shape) const {
        const auto* b = std::get_if<Bytes>(&value);
        if (b == nullptr) {
            throw CodecError(std::string("bytes encoder expects bytes, got ") +
                             value_type_string(value));
        }
        if (b->size() != shape.width) {
            throw CodecError("expected " + std::to_string(shape.width) + " byte(s), got " +
                             std::to_string(b->size()));
        }
        return *b;
    }

    FieldValue decode(std::span<const uint8_t> bytes, FieldShape) const {
        return Bytes(bytes.begin(), bytes.end());
    }
};

/**
 * @brief Bidirectional table between human-readable keys and register codes
 *
 * Keys may be integers, reals or strings. Both directions must be functions:
 * duplicate keys and duplicate codes are rejected at construction, so decode
 * is never ambiguous. A code missing from the table is a codec error, never
 * a guessed nearest key.
 */
class LookupTable {
public:
    static constexpr const char* name = "lookup";

    struct Entry {
        FieldValue key;
        uint64_t code;
    };

    /// @throws ConfigError if empty or if a key or code repeats
    explicit LookupTable(std::vector<Entry> entries) : entries_(std::move(entries)) {
        if (entries_.empty()) {
            throw ConfigError("lookup table is empty");
        }
        for (size_t i = 0; i < entries_.size(); ++i) {
            for (size_t j = i + 1; j < entries_.size(); ++j) {
                if (values_equal(entries_[i].key, entries_[j].key)) {
                    throw ConfigError("lookup table repeats key " + to_string(entries_[i].key));
                }
                if (entries_[i].code == entries_[j].code) {
                    throw ConfigError("lookup table repeats code " +
                                      std::to_string(entries_[i].code));
                }
            }
        }
    }

    static LookupTable from_integers(std::initializer_list<std::pair<int64_t, uint64_t>> table) {
        std::vector<Entry> entries;
        for (const auto& [key, code] : table) {
            entries.push_back({FieldValue{key}, code});
        }
        return LookupTable(std::move(entries));
    }

    static LookupTable from_reals(std::initializer_list<std::pair<double, uint64_t>> table) {
        std::vector<Entry> entries;
        for (const auto& [key, code] : table) {
            entries.push_back({FieldValue{key}, code});
        }
        return LookupTable(std::move(entries));
    }

    static LookupTable
    from_strings(std::initializer_list<std::pair<std::string_view, uint64_t>> table) {
        std::vector<Entry> entries;
        for (const auto& [key, code] : table) {
            entries.push_back({FieldValue{std::string(key)}, code});
        }
        return LookupTable(std::move(entries));
    }

    const std::vector<Entry>& entries() const noexcept { return entries_; }

    std::optional<uint64_t> code_for(const FieldValue& key) const noexcept {
        for (const auto& entry : entries_) {
            if (values_equal(entry.key, key)) {
                return entry.code;
            }
        }
        return std::nullopt;
    }

    const FieldValue* key_for(uint64_t code) const noexcept {
        for (const auto& entry : entries_) {
            if (entry.code == code) {
                return &entry.key;
            }
        }
        return nullptr;
    }

    bool contains(const FieldValue& key) const noexcept { return code_for(key).has_value(); }

    uint64_t max_code() const noexcept {
        uint64_t out = 0;
        for (const auto& entry : entries_) {
            out = entry.code > out ? entry.code : out;
        }
        return out;
    }

    Bytes encode(const FieldValue& value, FieldShape shape) const {
        detail::require_integer_width(shape.width, name);
        auto code = code_for(value);
        if (!code) {
            throw CodecError(to_string(value) + " not in lookup table");
        }
        if (!detail::fits_unsigned(*code, shape.width)) {
            throw CodecError("lookup code " + std::to_string(*code) + " does not fit in " +
                             std::to_string(shape.width) + " byte(s)");
        }
        return store_uint(*code, shape.width, shape.order);
    }

    FieldValue decode(std::span<const uint8_t> bytes, FieldShape shape) const {
        detail::require_integer_width(bytes.size(), name);
        const uint64_t code = load_uint(bytes, shape.order);
        const FieldValue* key = key_for(code);
        if (key == nullptr) {
            throw CodecError("raw code " + std::to_string(code) + " not in lookup table");
        }
        return *key;
    }

private:
    std::vector<Entry> entries_;
};

/**
 * @brief Fixed-point linear transfer function
 *
 * encode: raw = round((value + offset) * scale), raised to raw_floor if set
 * decode: value = raw / scale - offset
 *
 * Each physical quantity gets its own instance with its constants baked in.
 * Raw values are unsigned; anything below zero without a floor, or above the
 * field width, is an encode error rather than a silent clamp.
 */
struct LinearEncoder {
    static constexpr const char* name = "linear";

    const char* quantity = "value";     ///< Used in error messages
    double scale = 1.0;                 ///< Raw counts per human unit
    double offset = 0.0;                ///< Added to the human value before scaling
    std::optional<int64_t> raw_floor{}; ///< Encode clamps raw values below this
    bool read_only = false;             ///< Encode raises UnsupportedOperation

    Bytes encode(const FieldValue& value, FieldShape shape) const {
        if (read_only) {
            throw UnsupportedOperation(std::string(quantity) + " is read only");
        }
        detail::require_integer_width(shape.width, name);
        auto human = as_real(value);
        if (!human) {
            throw CodecError(std::string(quantity) + " expects a number, got " +
                             value_type_string(value));
        }
        const double scaled = std::round((*human + offset) * scale);
        if (!std::isfinite(scaled) || std::fabs(scaled) > 9.0e18) {
            throw CodecError(std::string(quantity) + " value " + to_string(value) +
                             " is out of range");
        }
        int64_t raw = static_cast<int64_t>(scaled);
        if (raw_floor && raw < *raw_floor) {
            raw = *raw_floor;
        }
        if (raw < 0 || !detail::fits_unsigned(static_cast<uint64_t>(raw), shape.width)) {
            throw CodecError(std::string(quantity) + " value " + to_string(value) +
                             " does not fit in " + std::to_string(shape.width) + " byte(s)");
        }
        return store_uint(static_cast<uint64_t>(raw), shape.width, shape.order);
    }

    FieldValue decode(std::span<const uint8_t> bytes, FieldShape shape) const {
        detail::require_integer_width(bytes.size(), name);
        const uint64_t raw = load_uint(bytes, shape.order);
        return static_cast<double>(raw) / scale - offset;
    }

    /// Value of one least-significant raw count, in human units
    double resolution() const noexcept { return 1.0 / scale; }
};

/// Closed set of encoders
using Encoder =
    std::variant<UIntEncoder, SIntEncoder, FlagEncoder, BytesEncoder, LookupTable, LinearEncoder>;

/// Encoders are immutable and shared by every field that uses them
using EncoderRef = std::shared_ptr<const Encoder>;

template <typename T>
EncoderRef make_encoder(T encoder) {
    return std::make_shared<const Encoder>(std::move(encoder));
}

/**
 * Encode a human-readable value to exactly `shape.width` bytes
 * @throws CodecError if the value has the wrong type or does not fit
 * @throws UnsupportedOperation if the encoder is read only
 */
inline Bytes encode(const Encoder& encoder, const FieldValue& value, FieldShape shape) {
    return std::visit([&](const auto& e) { return e.encode(value, shape); }, encoder);
}

/**
 * Decode raw bytes to a human-readable value
 * @throws CodecError if the bytes have no valid interpretation
 */
inline FieldValue decode(const Encoder& encoder, std::span<const uint8_t> bytes, FieldShape shape) {
    return std::visit([&](const auto& e) { return e.decode(bytes, shape); }, encoder);
}

inline const char* encoder_name(const Encoder& encoder) noexcept {
    return std::visit([](const auto& e) { return e.name; }, encoder);
}

/// Encoders that go through an integer and are limited to max_integer_width
inline bool is_integer_encoder(const Encoder& encoder) noexcept {
    return !std::holds_alternative<BytesEncoder>(encoder);
}

namespace encoders {

// Stateless encoders are shared process-wide

inline const EncoderRef& unsigned_int() {
    static const EncoderRef instance = make_encoder(UIntEncoder{});
    return instance;
}

inline const EncoderRef& signed_int() {
    static const EncoderRef instance = make_encoder(SIntEncoder{});
    return instance;
}

inline const EncoderRef& flag() {
    static const EncoderRef instance = make_encoder(FlagEncoder{});
    return instance;
}

inline const EncoderRef& bytes() {
    static const EncoderRef instance = make_encoder(BytesEncoder{});
    return instance;
}

} // namespace encoders

} // namespace aqsense
