// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <array>
#include <span>
#include <string>

#include <cstddef>
#include <cstdint>

#include "../core/error.hpp"
#include "../core/types.hpp"

namespace aqsense::serial::modbus {

/// Address every Modbus slave answers to, used for single-sensor links
inline constexpr uint8_t any_address = 0xFE;

inline constexpr size_t crc_size = 2;

/// Address, function code and byte count ahead of the register data
inline constexpr size_t response_header_size = 3;

enum class FunctionCode : uint8_t {
    read_holding_registers = 0x03,
    read_input_registers = 0x04,
    write_single_register = 0x06
};

constexpr const char* function_code_string(FunctionCode code) noexcept {
    switch (code) {
        case FunctionCode::read_holding_registers:
            return "read_holding_registers";
        case FunctionCode::read_input_registers:
            return "read_input_registers";
        case FunctionCode::write_single_register:
            return "write_single_register";
    }
    return "unknown";
}

// CRC-16/MODBUS: reflected polynomial 0xA001, initial value 0xFFFF
constexpr std::array<uint16_t, 256> make_crc_table() noexcept {
    std::array<uint16_t, 256> table{};
    for (uint16_t i = 0; i < 256; ++i) {
        uint16_t crc = i;
        for (int bit = 0; bit < 8; ++bit) {
            crc = (crc & 1) ? static_cast<uint16_t>((crc >> 1) ^ 0xA001) : static_cast<uint16_t>(crc >> 1);
        }
        table[i] = crc;
    }
    return table;
}

inline constexpr std::array<uint16_t, 256> crc_table = make_crc_table();

static_assert(crc_table[1] == 0xC0C1);
static_assert(crc_table[255] == 0x4040);

constexpr uint16_t crc16(std::span<const uint8_t> message) noexcept {
    uint16_t crc = 0xFFFF;
    for (uint8_t byte : message) {
        crc = static_cast<uint16_t>((crc >> 8) ^ crc_table[(crc ^ byte) & 0xFF]);
    }
    return crc;
}

/// Append the CRC, low byte first as Modbus RTU sends it
inline Bytes append_crc(Bytes message) {
    const uint16_t crc = crc16(message);
    message.push_back(static_cast<uint8_t>(crc & 0xFF));
    message.push_back(static_cast<uint8_t>(crc >> 8));
    return message;
}

/// True if the last two bytes of `frame` are the CRC of the rest
inline bool check_crc(std::span<const uint8_t> frame) noexcept {
    if (frame.size() <= crc_size) {
        return false;
    }
    const auto body = frame.first(frame.size() - crc_size);
    const uint16_t crc = crc16(body);
    return frame[frame.size() - 2] == (crc & 0xFF) && frame[frame.size() - 1] == (crc >> 8);
}

/// Request for `count` consecutive registers starting at `reg`
inline Bytes read_request(uint8_t address, FunctionCode function, uint16_t reg, uint16_t count) {
    return append_crc({address, static_cast<uint8_t>(function), static_cast<uint8_t>(reg >> 8),
                       static_cast<uint8_t>(reg & 0xFF), static_cast<uint8_t>(count >> 8),
                       static_cast<uint8_t>(count & 0xFF)});
}

inline Bytes write_single_request(uint8_t address, uint16_t reg, uint16_t value) {
    return append_crc({address, static_cast<uint8_t>(FunctionCode::write_single_register),
                       static_cast<uint8_t>(reg >> 8), static_cast<uint8_t>(reg & 0xFF),
                       static_cast<uint8_t>(value >> 8), static_cast<uint8_t>(value & 0xFF)});
}

/// Expected size of the answer to a read of `count` registers
constexpr size_t read_response_size(uint16_t count) noexcept {
    return response_header_size + 2 * size_t{count} + crc_size;
}

/**
 * Validate a read response and return its register data
 *
 * @param response Bytes received, address through CRC
 * @param function Function code of the request
 * @param count Registers requested
 * @throws DeviceError if the slave answered with a Modbus exception
 * @throws TransportError on a short frame, CRC mismatch or malformed header
 */
inline Bytes read_response_data(std::span<const uint8_t> response, FunctionCode function,
                                uint16_t count) {
    const auto code = static_cast<uint8_t>(function);
    constexpr size_t exception_size = 5;
    if (response.size() >= exception_size && response[1] == (code | 0x80) &&
        check_crc(response.first(exception_size))) {
        throw DeviceError("modbus exception " + std::to_string(response[2]) + " for " +
                          function_code_string(function));
    }
    const size_t expected = read_response_size(count);
    if (response.size() != expected) {
        throw TransportError("modbus response has " + std::to_string(response.size()) +
                             " byte(s), expected " + std::to_string(expected));
    }
    if (!check_crc(response)) {
        throw TransportError("modbus CRC mismatch");
    }
    if (response[1] != code || response[2] != 2 * count) {
        throw TransportError("malformed modbus response header");
    }
    const auto data = response.subspan(response_header_size, 2 * size_t{count});
    return Bytes(data.begin(), data.end());
}

} // namespace aqsense::serial::modbus
