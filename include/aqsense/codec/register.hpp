// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <map>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <cstddef>
#include <cstdint>

#include "../core/error.hpp"
#include "../core/types.hpp"
#include "../core/value.hpp"
#include "field.hpp"

namespace aqsense {

/// Declarative description of one register, consumed by Register's constructor
struct RegisterSpec {
    std::string name;
    register_address_t address = 0;
    std::vector<FieldSpec> fields;
    size_t n_bits = 8;
    bool read_only = false;
    bool non_volatile = false; ///< Contents only change on reset; reads may be served from cache
};

/**
 * @brief Named, addressed group of fields sharing one register's bytes
 *
 * Converts between a full register image and a field-value map. Fields may
 * share bytes when their bit masks are disjoint; mask disjointness is the
 * descriptor author's responsibility and is not checked here.
 */
class Register {
public:
    /// @throws ConfigError on an invalid width, field, or duplicate field name
    explicit Register(RegisterSpec spec)
        : name_(std::move(spec.name)),
          address_(spec.address),
          n_bits_(spec.n_bits),
          read_only_(spec.read_only),
          non_volatile_(spec.non_volatile) {
        if (name_.empty()) {
            throw ConfigError("register name is empty");
        }
        if (n_bits_ == 0 || n_bits_ % 8 != 0) {
            throw ConfigError("register '" + name_ + "' width of " + std::to_string(n_bits_) +
                              " bits is not a whole number of bytes");
        }
        if (spec.fields.empty()) {
            throw ConfigError("register '" + name_ + "' has no fields");
        }
        fields_.reserve(spec.fields.size());
        for (auto& field_spec : spec.fields) {
            Field field(std::move(field_spec));
            if (find_field(field.name()) != nullptr) {
                throw ConfigError("register '" + name_ + "' repeats field '" + field.name() + "'");
            }
            if (field.last() >= n_bytes()) {
                throw ConfigError("field '" + field.name() + "' reaches byte " +
                                  std::to_string(field.last()) + " of " + std::to_string(n_bytes()) +
                                  "-byte register '" + name_ + "'");
            }
            fields_.push_back(std::move(field));
        }
    }

    const std::string& name() const noexcept { return name_; }
    register_address_t address() const noexcept { return address_; }
    size_t n_bits() const noexcept { return n_bits_; }
    size_t n_bytes() const noexcept { return n_bits_ / 8; }
    bool read_only() const noexcept { return read_only_; }
    bool non_volatile() const noexcept { return non_volatile_; }
    const std::vector<Field>& fields() const noexcept { return fields_; }

    const Field* find_field(std::string_view name) const noexcept {
        for (const auto& field : fields_) {
            if (field.name() == name) {
                return &field;
            }
        }
        return nullptr;
    }

    /// @throws ValidationError if the register has no such field
    const Field& field(std::string_view name) const {
        const Field* found = find_field(name);
        if (found == nullptr) {
            throw ValidationError("no such field '" + std::string(name) + "' in register '" +
                                  name_ + "'");
        }
        return *found;
    }

    /**
     * Decode every field from a register image
     *
     * All-or-nothing: the first field that fails to decode fails the call and
     * no partial map is returned.
     *
     * @param raw Register image, at least as long as the last field reaches
     * @throws CodecError
     */
    FieldValues raw_bytes_to_field_values(std::span<const uint8_t> raw) const {
        FieldValues values;
        for (const auto& field : fields_) {
            values.emplace(field.name(), field.decode(field.slice(raw)));
        }
        return values;
    }

    /**
     * Encode a set of field values into the bytes to write
     *
     * Fields are grouped by byte index. Fragments landing on the same byte
     * index are OR-merged, each one already shifted into place by its mask.
     * Groups are emitted in order of increasing offset and concatenated.
     * Bytes no supplied field touches are absent from the output, not zero
     * filled; writing a partial register needs a read-modify-write by the
     * caller.
     *
     * @throws ValidationError for an unknown field name
     * @throws CodecError, UnsupportedOperation from the field encoders
     */
    Bytes field_values_to_raw_bytes(const FieldValues& values) const {
        std::map<std::vector<size_t>, Bytes> groups;
        for (const auto& [name, value] : values) {
            const Field& target = field(name);
            Bytes encoded = target.encode(value);
            auto [slot, inserted] = groups.try_emplace(target.byte_index(), std::move(encoded));
            if (!inserted) {
                Bytes& merged = slot->second;
                for (size_t i = 0; i < merged.size(); ++i) {
                    merged[i] |= encoded[i];
                }
            }
        }

        Bytes out;
        for (const auto& [index, bytes] : groups) {
            out.insert(out.end(), bytes.begin(), bytes.end());
        }
        return out;
    }

    /// Same as field_values_to_raw_bytes() for a single field
    Bytes field_value_to_raw_bytes(std::string_view name, const FieldValue& value) const {
        return field(name).encode(value);
    }

private:
    std::string name_;
    register_address_t address_;
    size_t n_bits_;
    bool read_only_;
    bool non_volatile_;
    std::vector<Field> fields_;
};

} // namespace aqsense
