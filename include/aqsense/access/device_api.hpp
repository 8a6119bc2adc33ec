// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <span>

#include <cstdint>

#include "../codec/device.hpp"
#include "transport.hpp"

namespace aqsense {

/**
 * @brief Common base of every I2C device driver
 *
 * Binds a static device descriptor to a caller-owned transport and the level
 * of the chip's address strap pin. The transport must outlive the driver.
 * Register accessors created by the driver share the same transport.
 *
 * @tparam Transport Caller-owned transport
 */
template <RegisterTransport Transport>
class DeviceApi {
public:
    /// @throws ValidationError if the device has no address for `address_pin_level`
    DeviceApi(Transport& transport, const Device& hardware, uint8_t address_pin_level = 0)
        : transport_(&transport),
          hardware_(&hardware),
          address_pin_level_(address_pin_level),
          address_(hardware.address(address_pin_level)) {}

    /// Static descriptor of the device model
    const Device& hardware() const noexcept { return *hardware_; }

    /// Bus address the transport must be bound to
    uint16_t address() const noexcept { return address_; }

    uint8_t address_pin_level() const noexcept { return address_pin_level_; }

protected:
    Transport& transport() noexcept { return *transport_; }

    /// Write a register pointer with no payload, which the device treats as a command
    void send_command(register_address_t command) {
        transport_->write_bytes(command, std::span<const uint8_t>{});
    }

private:
    Transport* transport_;
    const Device* hardware_;
    uint8_t address_pin_level_;
    uint16_t address_;
};

} // namespace aqsense
