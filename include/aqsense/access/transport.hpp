// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <concepts>
#include <span>

#include <cstddef>
#include <cstdint>

#include "../core/types.hpp"

namespace aqsense {

/**
 * @brief Byte-level register I/O supplied by the caller
 *
 * A transport is bound to one device on one bus (an I2C adapter with the
 * device address selected, for example). It blocks until the transaction
 * completes and reports every failure by throwing TransportError; the
 * library never retries on its own.
 *
 * A write with an empty payload sets the register pointer only, which some
 * devices treat as a command.
 *
 * @tparam T The type to check
 */
template <typename T>
concept RegisterTransport =
    requires(T& transport, register_address_t reg, size_t length, std::span<const uint8_t> payload) {
        { transport.read_bytes(reg, length) } -> std::convertible_to<Bytes>;
        { transport.write_bytes(reg, payload) };
    };

/**
 * @brief Transport that can read without first writing the register pointer
 *
 * Needed by devices that start a conversion on the pointer write and must
 * be given time before the result is read back (HDC1080).
 *
 * @tparam T The type to check
 */
template <typename T>
concept PointerReadTransport = RegisterTransport<T> && requires(T& transport, size_t length) {
    { transport.read_current(length) } -> std::convertible_to<Bytes>;
};

} // namespace aqsense
