// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <array>
#include <chrono>
#include <thread>

#include <cstdint>

#include "../access/device_api.hpp"
#include "../access/register_access.hpp"
#include "../access/transport.hpp"
#include "../access/validate.hpp"
#include "../codec/device.hpp"
#include "../codec/encoder.hpp"
#include "../core/error.hpp"
#include "../core/value.hpp"

namespace aqsense::sensors {

namespace ccs811 {

inline constexpr uint32_t reset_magic = 0x11E5728A;

/// Pointer-only write that leaves boot mode and starts the application
inline constexpr register_address_t app_start_command = 0xF4;

inline constexpr std::array<double, 5> sample_periods_s{0.0, 0.25, 1.0, 10.0, 60.0};

inline constexpr std::chrono::milliseconds app_start_delay{1};
inline constexpr std::chrono::milliseconds reset_delay{2};

/// Register map of the ScioSense CCS811 eCO2 and TVOC sensor
///
/// Interrupt thresholds and firmware update registers are not described.
inline const Device& hardware() {
    static const Device device = [] {
        auto flag = [](const char* name, uint64_t mask, bool read_only = false) {
            return FieldSpec{.name = name,
                             .bit_mask = mask,
                             .encoder = encoders::flag(),
                             .read_only = read_only};
        };

        // Environment compensation: 1/512 units, temperature offset by 25 C, floor at -25 C
        const EncoderRef humidity =
            make_encoder(LinearEncoder{.quantity = "humidity", .scale = 512.0});
        const EncoderRef temperature = make_encoder(LinearEncoder{
            .quantity = "temperature", .scale = 512.0, .offset = 25.0, .raw_floor = 0});
        // 10-bit ADC, full scale 1023 counts = 1.65 V
        const EncoderRef voltage = make_encoder(
            LinearEncoder{.quantity = "voltage", .scale = 1023.0 / 1.65, .read_only = true});

        return Device(DeviceSpec{
            .name = "ccs811",
            .chip_id = 0x81,
            .addresses = {{0, 0x5A}, {1, 0x5B}},
            .registers = {
                RegisterSpec{.name = "status",
                             .address = 0x00,
                             .fields = {flag("app_on", 0b10000000),
                                        flag("app_erase", 0b01000000),
                                        flag("app_verify", 0b00100000),
                                        flag("app_valid", 0b00010000),
                                        flag("data_ready", 0b00001000),
                                        flag("error", 0b00000001, true)},
                             .read_only = true},
                RegisterSpec{
                    .name = "meas_mode",
                    .address = 0x01,
                    .fields = {FieldSpec{.name = "sample_period",
                                         .bit_mask = 0b01110000,
                                         .encoder = make_encoder(LookupTable::from_reals(
                                             {{0.0, 0b000},
                                              {1.0, 0b001},
                                              {10.0, 0b010},
                                              {60.0, 0b011},
                                              {0.25, 0b100}}))},
                               flag("enable_interrupt", 0b00001000),
                               flag("interrupt_on_thresh", 0b00000100)}},
                RegisterSpec{.name = "data",
                             .address = 0x02,
                             .fields = {FieldSpec{.name = "eco2", .byte_index = {0, 1}},
                                        FieldSpec{.name = "tvoc", .byte_index = {2, 3}}},
                             .n_bits = 32,
                             .read_only = true},
                RegisterSpec{.name = "raw_data",
                             .address = 0x03,
                             .fields = {FieldSpec{.name = "current_ua", .bit_mask = 0b11111100},
                                        FieldSpec{.name = "voltage",
                                                  .byte_index = {0, 1},
                                                  .bit_mask = 0x03FF,
                                                  .encoder = voltage}},
                             .n_bits = 16,
                             .read_only = true},
                RegisterSpec{.name = "env_data",
                             .address = 0x05,
                             .fields = {FieldSpec{.name = "humidity",
                                                  .byte_index = {0, 1},
                                                  .encoder = humidity},
                                        FieldSpec{.name = "temperature",
                                                  .byte_index = {2, 3},
                                                  .encoder = temperature}},
                             .n_bits = 32},
                RegisterSpec{.name = "baseline",
                             .address = 0x11,
                             .fields = {FieldSpec{.name = "baseline", .byte_index = {0, 1}}},
                             .n_bits = 16},
                RegisterSpec{.name = "chip_id",
                             .address = 0x20,
                             .fields = {FieldSpec{.name = "chip_id"}},
                             .read_only = true,
                             .non_volatile = true},
                RegisterSpec{.name = "error_id",
                             .address = 0xE0,
                             .fields = {flag("invalid_write", 0b10000000),
                                        flag("invalid_read", 0b01000000),
                                        flag("invalid_mode", 0b00100000),
                                        flag("max_resistance", 0b00010000),
                                        flag("heater_fault", 0b00001000),
                                        flag("heater_supply", 0b00000100)},
                             .read_only = true},
                RegisterSpec{.name = "reset",
                             .address = 0xFF,
                             .fields = {FieldSpec{.name = "reset", .byte_index = {0, 1, 2, 3}}},
                             .n_bits = 32},
            }});
    }();
    return device;
}

} // namespace ccs811

/**
 * @brief Driver for the ScioSense CCS811 eCO2 and TVOC sensor
 *
 * The chip powers up in boot mode; call start() before configuring
 * meas_mode.
 *
 * @tparam Transport Caller-owned transport bound to address()
 */
template <RegisterTransport Transport>
class CCS811 : public DeviceApi<Transport> {
public:
    class MeasMode : public RegisterAccess<Transport> {
    public:
        using RegisterAccess<Transport>::RegisterAccess;

        /**
         * Select the sample period. Interrupt outputs stay disabled.
         * @param sample_period Seconds between samples, one of {0, 0.25, 1, 10, 60}; 0 idles
         * @throws ValidationError before any I/O for other periods
         */
        void write(double sample_period = 60.0) {
            detail::require_one_of(sample_period, ccs811::sample_periods_s, "sample_period");
            this->write_fields({{"sample_period", sample_period},
                                {"enable_interrupt", false},
                                {"interrupt_on_thresh", false}},
                               true);
        }
    };

    class EnvData : public RegisterAccess<Transport> {
    public:
        using RegisterAccess<Transport>::RegisterAccess;

        /**
         * Pass ambient conditions from an external sensor for compensation
         * @param temperature Degrees C; values below -25 are written as -25
         * @param humidity %RH
         * @throws CodecError if a value does not fit the register
         */
        void write(double temperature = 25.0, double humidity = 50.0) {
            this->write_fields({{"temperature", temperature}, {"humidity", humidity}}, true);
        }
    };

    class Reset : public WriteOnlyRegister<Transport> {
    public:
        Reset(CCS811& parent, Transport& transport)
            : WriteOnlyRegister<Transport>(transport, ccs811::hardware(), "reset"),
              parent_(&parent) {}

        /**
         * Soft reset into boot mode
         * @param app_start Start the application afterwards (stay in boot mode to flash firmware)
         * @throws DeviceError if app_start is set and no valid application is present
         */
        void write(bool app_start = true) {
            this->write_fields({{"reset", int64_t{ccs811::reset_magic}}});
            std::this_thread::sleep_for(ccs811::reset_delay);
            if (app_start) {
                parent_->start();
            }
        }

    private:
        CCS811* parent_;
    };

    /// Does no I/O. Call start() (or reset.write()) before reading measurements.
    explicit CCS811(Transport& transport, uint8_t address_pin_level = 0)
        : DeviceApi<Transport>(transport, ccs811::hardware(), address_pin_level),
          reset(*this, transport),
          env_data(transport, ccs811::hardware(), "env_data"),
          meas_mode(transport, ccs811::hardware(), "meas_mode"),
          error_id(transport, ccs811::hardware(), "error_id"),
          chip_id(transport, ccs811::hardware(), "chip_id"),
          status(transport, ccs811::hardware(), "status"),
          raw_data(transport, ccs811::hardware(), "raw_data"),
          data(transport, ccs811::hardware(), "data"),
          baseline(transport, ccs811::hardware(), "baseline") {}

    CCS811(const CCS811&) = delete;
    CCS811& operator=(const CCS811&) = delete;

    /**
     * Leave boot mode and start the measurement application
     * @throws DeviceError if the status register reports no valid application
     */
    void start() {
        const FieldValues& current = status.read();
        if (!as_integer(current.at("app_valid")).value_or(0)) {
            throw DeviceError("ccs811 application not valid");
        }
        this->send_command(ccs811::app_start_command);
        std::this_thread::sleep_for(ccs811::app_start_delay);
    }

    /// @throws DeviceError if the chip reports another hardware id
    void check_chip_id() {
        const auto reported = as_integer(chip_id.read().at("chip_id"));
        if (reported != static_cast<int64_t>(this->hardware().chip_id())) {
            throw DeviceError("ccs811 hardware id mismatch");
        }
    }

    Reset reset;
    EnvData env_data;
    MeasMode meas_mode;
    ReadOnlyRegister<Transport> error_id;
    ReadOnlyRegister<Transport> chip_id;
    ReadOnlyRegister<Transport> status;
    ReadOnlyRegister<Transport> raw_data;
    ReadOnlyRegister<Transport> data;
    /// Writable on the chip; restoring a saved baseline is not supported yet
    ReadOnlyRegister<Transport> baseline;
};

} // namespace aqsense::sensors
