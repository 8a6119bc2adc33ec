// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <vector>

#include <cstddef>
#include <cstdint>

namespace aqsense {

// Raw register or frame contents, in wire order
using Bytes = std::vector<uint8_t>;

// Register address as seen by a transport (I2C pointer, Modbus register number)
using register_address_t = uint16_t;

// Byte order used when a field's bytes are interpreted as an integer
enum class ByteOrder : uint8_t {
    big = 0,   // Most significant byte first (default for every supported sensor)
    little = 1 // Least significant byte first (BMP280 calibration words)
};

// Widest field that can be handled as an integer
inline constexpr size_t max_integer_width = 8;

// Bits per transport word for byte-oriented buses
inline constexpr size_t default_word_size_bits = 8;

// Error categories reported by the library
enum class ErrorKind : uint8_t {
    configuration,         // Static descriptor is malformed
    validation,            // Caller supplied a value outside the allowed set
    codec,                 // Bytes and values could not be converted
    transport,             // Bus transaction failed
    unsupported_operation, // Operation not available on this register or in this mode
    device                 // Device reported a failure
};

// Convert error kind to human-readable string
constexpr const char* error_kind_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::configuration:
            return "configuration";
        case ErrorKind::validation:
            return "validation";
        case ErrorKind::codec:
            return "codec";
        case ErrorKind::transport:
            return "transport";
        case ErrorKind::unsupported_operation:
            return "unsupported_operation";
        case ErrorKind::device:
            return "device";
    }
    return "unknown";
}

constexpr const char* byte_order_string(ByteOrder order) noexcept {
    return order == ByteOrder::big ? "big" : "little";
}

} // namespace aqsense
