// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <thread>

#include <cstddef>
#include <cstdint>

#include "../core/endian.hpp"
#include "../core/error.hpp"
#include "../core/types.hpp"
#include "../core/value.hpp"
#include "modbus.hpp"
#include "serial_port.hpp"

namespace aqsense::serial {

namespace s8 {

// Input registers
inline constexpr uint16_t error_code_register = 0x00;
inline constexpr uint16_t co2_register = 0x03;
inline constexpr uint16_t type_id_register = 0x19;
inline constexpr uint16_t firmware_version_register = 0x1C;
inline constexpr uint16_t serial_id_register = 0x1D;

// Holding registers
inline constexpr uint16_t ack_register = 0x00;
inline constexpr uint16_t command_register = 0x01;
inline constexpr uint16_t abc_period_register = 0x1F;

/// Written to the command register to start a background calibration
inline constexpr uint16_t background_calibration_command = 0x7C06;

/// Set in the acknowledgement register once background calibration completed
inline constexpr uint16_t background_calibration_ack = 1 << 5;

} // namespace s8

/// Delays of the background calibration sequence
struct S8Timing {
    std::chrono::milliseconds ack_clear_delay{180};
    std::chrono::milliseconds calibration_delay{4500}; ///< A bit over one measurement cycle
};

/**
 * @brief Driver for the Senseair S8 LP CO2 sensor (Modbus RTU, 9600 8N1)
 *
 * Every read updates the cached value of its quantity; values() exposes
 * them keyed as "co2", "error_code", "abc_period", "type_id", "fw_ver" and
 * "serial_id". Write requests are not followed by a read of the echo; the
 * next read flushes it from the input buffer.
 *
 * @tparam Port Caller-owned serial port, read timeout of at least 200 ms
 */
template <SerialPort Port>
class SenseairS8 {
public:
    explicit SenseairS8(Port& port, S8Timing timing = {}) : port_(&port), timing_(timing) {
        port_->flush_input();
    }

    /// CO2 concentration in ppm
    int64_t read_co2() { return read_integer("co2", s8::co2_register); }

    /// Error flags; see the datasheet for their meaning
    int64_t read_error_code() { return read_integer("error_code", s8::error_code_register); }

    /// Automatic baseline correction period in hours
    int64_t read_abc_period() {
        return read_integer("abc_period", s8::abc_period_register,
                            modbus::FunctionCode::read_holding_registers);
    }

    /// Model number
    Bytes read_type_id() { return read_raw("type_id", s8::type_id_register, 2); }

    Bytes read_firmware_version() { return read_raw("fw_ver", s8::firmware_version_register, 1); }

    Bytes read_serial_id() { return read_raw("serial_id", s8::serial_id_register, 2); }

    /**
     * Configure automatic baseline correction (ABC)
     *
     * @param period_hours Longest time between corrections; device default is 192
     * @param disable Turn ABC off; other arguments are ignored
     * @param recalibrate Run a background calibration now; the sensor must sit in
     *        fresh air (about 400 ppm) with a stable concentration
     * @throws DeviceError if the sensor does not acknowledge the calibration
     */
    void configure_abc(std::optional<uint16_t> period_hours = std::nullopt, bool disable = false,
                       bool recalibrate = false) {
        if (disable) {
            write_register(s8::abc_period_register, 0);
            values_.insert_or_assign("abc_period", int64_t{0});
            return;
        }
        if (period_hours) {
            write_register(s8::abc_period_register, *period_hours);
            values_.insert_or_assign("abc_period", int64_t{*period_hours});
        }
        if (recalibrate) {
            write_register(s8::ack_register, 0);
            std::this_thread::sleep_for(timing_.ack_clear_delay);
            write_register(s8::command_register, s8::background_calibration_command);
            std::this_thread::sleep_for(timing_.calibration_delay);
            const Bytes ack =
                read_registers(modbus::FunctionCode::read_holding_registers, s8::ack_register, 1);
            if ((load_uint(ack, ByteOrder::big) & s8::background_calibration_ack) == 0) {
                throw DeviceError("s8 background calibration failed; the CO2 concentration may "
                                  "be unstable");
            }
        }
    }

    const FieldValues& values() const noexcept { return values_; }

    /// Forget every cached value
    void invalidate() noexcept { values_.clear(); }

private:
    Bytes read_registers(modbus::FunctionCode function, uint16_t reg, uint16_t count) {
        const Bytes request = modbus::read_request(modbus::any_address, function, reg, count);
        port_->flush_input();
        port_->write(std::span<const uint8_t>(request));
        const Bytes response = port_->read(modbus::read_response_size(count));
        return modbus::read_response_data(response, function, count);
    }

    void write_register(uint16_t reg, uint16_t value) {
        const Bytes request = modbus::write_single_request(modbus::any_address, reg, value);
        port_->write(std::span<const uint8_t>(request));
    }

    int64_t read_integer(const char* key, uint16_t reg,
                         modbus::FunctionCode function = modbus::FunctionCode::read_input_registers) {
        const Bytes data = read_registers(function, reg, 1);
        const auto value = static_cast<int64_t>(load_uint(data, ByteOrder::big));
        values_.insert_or_assign(key, value);
        return value;
    }

    Bytes read_raw(const char* key, uint16_t reg, uint16_t count) {
        Bytes data = read_registers(modbus::FunctionCode::read_input_registers, reg, count);
        values_.insert_or_assign(key, data);
        return data;
    }

    Port* port_;
    S8Timing timing_;
    FieldValues values_;
};

} // namespace aqsense::serial
