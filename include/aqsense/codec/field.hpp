// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include <cstddef>
#include <cstdint>

#include "../core/detail/bit_mask.hpp"
#include "../core/endian.hpp"
#include "../core/error.hpp"
#include "../core/types.hpp"
#include "../core/value.hpp"
#include "encoder.hpp"

namespace aqsense {

/**
 * @brief Declarative description of one field, consumed by Field's constructor
 *
 * Intended for designated initializers inside register tables:
 * @code
 * FieldSpec{.name = "mode", .byte_index = {0}, .bit_mask = 0x03, .encoder = mode_table}
 * @endcode
 */
struct FieldSpec {
    std::string name;
    std::vector<size_t> byte_index{0};  ///< Offsets within the register, strictly increasing
    std::optional<uint64_t> bit_mask{}; ///< Absent: field occupies its whole byte range
    EncoderRef encoder = encoders::unsigned_int();
    bool read_only = false;
    ByteOrder byte_order = ByteOrder::big;
};

/**
 * @brief One named value packed into a register's bytes
 *
 * A Field owns the bit-level codec: it slices its byte range out of a
 * register image, applies its mask and shift, and hands the result to its
 * encoder. Every malformed description is rejected by the constructor, so
 * a constructed Field can always encode and decode.
 *
 * Fields are immutable after construction.
 */
class Field {
public:
    /// @throws ConfigError if the description is inconsistent
    explicit Field(FieldSpec spec)
        : name_(std::move(spec.name)),
          byte_index_(std::move(spec.byte_index)),
          bit_mask_(spec.bit_mask),
          encoder_(std::move(spec.encoder)),
          read_only_(spec.read_only),
          byte_order_(spec.byte_order) {
        validate();
    }

    const std::string& name() const noexcept { return name_; }
    const std::vector<size_t>& byte_index() const noexcept { return byte_index_; }
    const std::optional<uint64_t>& bit_mask() const noexcept { return bit_mask_; }
    const Encoder& encoder() const noexcept { return *encoder_; }
    bool read_only() const noexcept { return read_only_; }
    ByteOrder byte_order() const noexcept { return byte_order_; }

    /// First byte offset of the field's slice
    size_t first() const noexcept { return byte_index_.front(); }

    /// Last byte offset of the field's slice (inclusive)
    size_t last() const noexcept { return byte_index_.back(); }

    /// Bytes in the slice first..last
    size_t width() const noexcept { return last() - first() + 1; }

    /// Trailing-zero count of the mask, 0 when unmasked
    unsigned shift() const noexcept { return shift_; }

    FieldShape shape() const noexcept { return FieldShape{width(), byte_order_}; }

    /**
     * Move an encoded value into its bit position
     * @param encoded Encoder output, exactly width() bytes
     * @return width() bytes with the value shifted under the mask
     * @throws CodecError if the value has bits outside the mask
     */
    Bytes encode_mask(std::span<const uint8_t> encoded) const {
        check_width(encoded.size());
        if (!bit_mask_) {
            return Bytes(encoded.begin(), encoded.end());
        }
        const uint64_t value = load_uint(encoded, byte_order_);
        auto placed = detail::insert_masked(value, *bit_mask_, shift_);
        if (!placed) {
            throw CodecError("value " + std::to_string(value) + " of field '" + name_ +
                             "' does not fit under its bit mask");
        }
        return store_uint(*placed, width(), byte_order_);
    }

    /**
     * Extract the masked bits and move them down to bit 0
     * @param raw The field's slice of a register image, exactly width() bytes
     * @return width() bytes holding the shifted-down value
     */
    Bytes decode_mask(std::span<const uint8_t> raw) const {
        check_width(raw.size());
        if (!bit_mask_) {
            return Bytes(raw.begin(), raw.end());
        }
        const uint64_t value = detail::extract_masked(load_uint(raw, byte_order_), *bit_mask_, shift_);
        return store_uint(value, width(), byte_order_);
    }

    /**
     * Encode a human-readable value to this field's bytes, already in bit position
     * @throws CodecError, UnsupportedOperation (read-only encoder)
     */
    Bytes encode(const FieldValue& value) const {
        try {
            return encode_mask(aqsense::encode(*encoder_, value, shape()));
        } catch (const CodecError& e) {
            throw CodecError("field '" + name_ + "': " + e.message());
        }
    }

    /**
     * Decode this field's slice of a register image
     * @throws CodecError on width mismatch or an undecodable value
     */
    FieldValue decode(std::span<const uint8_t> raw) const {
        const Bytes unmasked = decode_mask(raw);
        try {
            return aqsense::decode(*encoder_, unmasked, shape());
        } catch (const CodecError& e) {
            throw CodecError("field '" + name_ + "': " + e.message());
        }
    }

    /// This field's slice of a full register image
    std::span<const uint8_t> slice(std::span<const uint8_t> register_bytes) const {
        if (register_bytes.size() <= last()) {
            throw CodecError("field '" + name_ + "' needs byte " + std::to_string(last()) +
                             " but the register image has " +
                             std::to_string(register_bytes.size()) + " byte(s)");
        }
        return register_bytes.subspan(first(), width());
    }

private:
    void check_width(size_t size) const {
        if (size != width()) {
            throw CodecError("field '" + name_ + "' spans " + std::to_string(width()) +
                             " byte(s), got " + std::to_string(size));
        }
    }

    void validate() {
        if (name_.empty()) {
            throw ConfigError("field name is empty");
        }
        if (!encoder_) {
            throw ConfigError("field '" + name_ + "' has no encoder");
        }
        if (byte_index_.empty()) {
            throw ConfigError("field '" + name_ + "' has an empty byte index");
        }
        for (size_t i = 1; i < byte_index_.size(); ++i) {
            if (byte_index_[i] <= byte_index_[i - 1]) {
                throw ConfigError("field '" + name_ + "' byte index is not strictly increasing");
            }
        }
        const bool integer = is_integer_encoder(*encoder_);
        if ((integer || bit_mask_) && width() > max_integer_width) {
            throw ConfigError("field '" + name_ + "' spans " + std::to_string(width()) +
                              " bytes, more than an integer field can hold");
        }

        uint64_t capacity = detail::max_unsigned(width());
        if (bit_mask_) {
            auto shift = detail::mask_shift(*bit_mask_);
            if (!shift) {
                throw ConfigError("field '" + name_ + "' has a zero bit mask");
            }
            if (!detail::mask_fits_width(*bit_mask_, width())) {
                throw ConfigError("field '" + name_ + "' bit mask exceeds its " +
                                  std::to_string(width()) + " byte range");
            }
            shift_ = *shift;
            capacity = *bit_mask_ >> shift_;
        }

        if (const auto* table = std::get_if<LookupTable>(encoder_.get())) {
            if (table->max_code() > capacity) {
                throw ConfigError("field '" + name_ + "' lookup code " +
                                  std::to_string(table->max_code()) + " exceeds the field's bits");
            }
        }
    }

    std::string name_;
    std::vector<size_t> byte_index_;
    std::optional<uint64_t> bit_mask_;
    EncoderRef encoder_;
    bool read_only_;
    ByteOrder byte_order_;
    unsigned shift_ = 0;
};

} // namespace aqsense
