// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <concepts>
#include <span>

#include <cstddef>
#include <cstdint>

#include "../core/types.hpp"

namespace aqsense::serial {

/**
 * @brief Blocking byte stream supplied by the caller (UART, USB serial adapter)
 *
 * read() returns at most `count` bytes and fewer when the port's read
 * timeout expires first. Hard failures throw TransportError.
 *
 * @tparam T The type to check
 */
template <typename T>
concept SerialPort = requires(T& port, std::span<const uint8_t> data, size_t count) {
    { port.write(data) };
    { port.read(count) } -> std::convertible_to<Bytes>;
    { port.flush_input() };
};

} // namespace aqsense::serial
