// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <cstddef>
#include <cstdint>

#include "../core/error.hpp"
#include "../core/types.hpp"
#include "register.hpp"

namespace aqsense {

/// Bus address selected by the level of the chip's address strap pin
using AddressMap = std::map<uint8_t, uint16_t>;

/// Declarative description of one device model, consumed by Device's constructor
struct DeviceSpec {
    std::string name;
    uint32_t chip_id = 0;          ///< Value the chip identifier register must report
    AddressMap addresses;          ///< Address pin level (0 or 1) -> bus address
    std::vector<RegisterSpec> registers;
    ByteOrder byte_order = ByteOrder::big;
    size_t word_size = default_word_size_bits; ///< Bits per transport word
};

/**
 * @brief Immutable description of a hardware device model
 *
 * Built once per model and shared by reference between every driver
 * instance. Holds no behavior beyond lookups; all consistency checks run in
 * the constructor.
 */
class Device {
public:
    using RegisterMap = std::map<std::string, Register, std::less<>>;

    /// @throws ConfigError for any inconsistency in the description
    explicit Device(DeviceSpec spec)
        : name_(std::move(spec.name)),
          chip_id_(spec.chip_id),
          addresses_(std::move(spec.addresses)),
          byte_order_(spec.byte_order),
          word_size_(spec.word_size) {
        if (name_.empty()) {
            throw ConfigError("device name is empty");
        }
        if (chip_id_ == 0) {
            throw ConfigError("device '" + name_ + "' has no chip identifier");
        }
        if (addresses_.empty()) {
            throw ConfigError("device '" + name_ + "' has no bus addresses");
        }
        for (const auto& [level, address] : addresses_) {
            if (level > 1) {
                throw ConfigError("device '" + name_ + "' address pin level " +
                                  std::to_string(level) + " is not 0 or 1");
            }
        }
        if (word_size_ == 0 || word_size_ % 8 != 0) {
            throw ConfigError("device '" + name_ + "' word size must be a multiple of 8 bits");
        }
        for (auto& register_spec : spec.registers) {
            Register reg(std::move(register_spec));
            if (reg.n_bits() % word_size_ != 0) {
                throw ConfigError("register '" + reg.name() + "' is not a whole number of words");
            }
            if (has_register(reg.name())) {
                throw ConfigError("device '" + name_ + "' repeats register '" + reg.name() + "'");
            }
            std::string key = reg.name();
            registers_.emplace(std::move(key), std::move(reg));
        }
    }

    const std::string& name() const noexcept { return name_; }
    uint32_t chip_id() const noexcept { return chip_id_; }
    const AddressMap& addresses() const noexcept { return addresses_; }
    ByteOrder byte_order() const noexcept { return byte_order_; }
    size_t word_size() const noexcept { return word_size_; }
    const RegisterMap& registers() const noexcept { return registers_; }

    bool has_register(std::string_view name) const noexcept {
        return registers_.find(name) != registers_.end();
    }

    /// @throws ConfigError if the device has no such register
    const Register& reg(std::string_view name) const {
        auto it = registers_.find(name);
        if (it == registers_.end()) {
            throw ConfigError("device '" + name_ + "' has no register '" + std::string(name) +
                              "'");
        }
        return it->second;
    }

    /// @throws ValidationError for an address pin level the device does not support
    uint16_t address(uint8_t pin_level) const {
        auto it = addresses_.find(pin_level);
        if (it == addresses_.end()) {
            throw ValidationError("device '" + name_ + "' has no address for pin level " +
                                  std::to_string(pin_level));
        }
        return it->second;
    }

    /// Transfer length for a full read of `reg`
    size_t read_length(const Register& reg) const noexcept { return reg.n_bits() / word_size_; }

private:
    std::string name_;
    uint32_t chip_id_;
    AddressMap addresses_;
    ByteOrder byte_order_;
    size_t word_size_;
    RegisterMap registers_;
};

} // namespace aqsense
