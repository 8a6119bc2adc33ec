// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <array>

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

namespace bmp280 {

inline constexpr uint8_t reset_magic = 0xB6;

inline constexpr std::array<int64_t, 6> oversampling_values{0, 1, 2, 4, 8, 16};
inline constexpr std::array<double, 8> measurement_periods_ms{0.5,  62.5,   125.0,  250.0,
                                                              500.0, 1000.0, 2000.0, 4000.0};
inline constexpr std::array<int64_t, 5> filter_constants{0, 2, 4, 8, 16};

/// Acquisition mode as offered to callers
enum class MeasurementMode : uint8_t {
    trigger,  // One measurement per ctrl_meas write, then sleep ("forced")
    interval, // Continuous, paced by config.t_sb ("normal")
    sleep     // No measurements
};

constexpr const char* measurement_mode_string(MeasurementMode mode) noexcept {
    switch (mode) {
        case MeasurementMode::trigger:
            return "trigger";
        case MeasurementMode::interval:
            return "interval";
        case MeasurementMode::sleep:
            return "sleep";
    }
    return "unknown";
}

/// Name of the power mode the chip uses for a measurement mode
inline const char* power_mode(MeasurementMode mode) {
    switch (mode) {
        case MeasurementMode::trigger:
            return "forced";
        case MeasurementMode::interval:
            return "normal";
        case MeasurementMode::sleep:
            return "sleep";
    }
    throw ValidationError("measurement mode must be one of {trigger, interval, sleep}");
}

/// Register map of the Bosch BMP280 pressure and temperature sensor
inline const Device& hardware() {
    static const Device device = [] {
        const EncoderRef oversampling = make_encoder(LookupTable::from_integers(
            {{0, 0b000}, {1, 0b001}, {2, 0b010}, {4, 0b011}, {8, 0b100}, {16, 0b101}}));
        const EncoderRef power = make_encoder(
            LookupTable::from_strings({{"sleep", 0b00}, {"forced", 0b10}, {"normal", 0b11}}));
        const EncoderRef standby = make_encoder(LookupTable::from_reals({{0.5, 0b000},
                                                                         {62.5, 0b001},
                                                                         {125.0, 0b010},
                                                                         {250.0, 0b011},
                                                                         {500.0, 0b100},
                                                                         {1000.0, 0b101},
                                                                         {2000.0, 0b110},
                                                                         {4000.0, 0b111}}));
        const EncoderRef filter = make_encoder(LookupTable::from_integers(
            {{0, 0b000}, {2, 0b001}, {4, 0b010}, {8, 0b011}, {16, 0b100}}));

        // Calibration words are little endian; t1 and p1 are unsigned
        auto trim = [](const char* name, size_t offset, bool is_signed) {
            return FieldSpec{.name = name,
                             .byte_index = {offset, offset + 1},
                             .encoder = is_signed ? encoders::signed_int()
                                                  : encoders::unsigned_int(),
                             .byte_order = ByteOrder::little};
        };

        return Device(DeviceSpec{
            .name = "bmp280",
            .chip_id = 0x58,
            .addresses = {{0, 0x76}, {1, 0x77}}, // SDO tied to GND, VDDIO
            .registers = {
                RegisterSpec{.name = "chip_id",
                             .address = 0xD0,
                             .fields = {FieldSpec{.name = "chip_id"}},
                             .read_only = true,
                             .non_volatile = true},
                RegisterSpec{.name = "reset",
                             .address = 0xE0,
                             .fields = {FieldSpec{.name = "reset"}}},
                RegisterSpec{
                    .name = "status",
                    .address = 0xF3,
                    .fields = {FieldSpec{.name = "measuring",
                                         .bit_mask = 0b00001000,
                                         .encoder = encoders::flag()},
                               FieldSpec{.name = "im_update",
                                         .bit_mask = 0b00000001,
                                         .encoder = encoders::flag()}},
                    .read_only = true},
                RegisterSpec{
                    .name = "ctrl_meas",
                    .address = 0xF4,
                    .fields = {FieldSpec{.name = "osrs_t",
                                         .bit_mask = 0b11100000,
                                         .encoder = oversampling},
                               FieldSpec{.name = "osrs_p",
                                         .bit_mask = 0b00011100,
                                         .encoder = oversampling},
                               FieldSpec{.name = "mode", .bit_mask = 0b00000011, .encoder = power}}},
                RegisterSpec{
                    .name = "config",
                    .address = 0xF5,
                    .fields = {FieldSpec{.name = "t_sb", .bit_mask = 0b11100000, .encoder = standby},
                               FieldSpec{.name = "filter",
                                         .bit_mask = 0b00011100,
                                         .encoder = filter},
                               FieldSpec{.name = "spi3w_en",
                                         .bit_mask = 0b00000001,
                                         .encoder = encoders::flag()}}},
                // 20-bit ADC outputs, left aligned in three bytes
                RegisterSpec{.name = "data",
                             .address = 0xF7,
                             .fields = {FieldSpec{.name = "pressure",
                                                  .byte_index = {0, 1, 2},
                                                  .bit_mask = 0xFFFFF0},
                                        FieldSpec{.name = "temperature",
                                                  .byte_index = {3, 4, 5},
                                                  .bit_mask = 0xFFFFF0}},
                             .n_bits = 48,
                             .read_only = true},
                RegisterSpec{.name = "calibration",
                             .address = 0x88,
                             .fields = {trim("dig_t1", 0, false),
                                        trim("dig_t2", 2, true),
                                        trim("dig_t3", 4, true),
                                        trim("dig_p1", 6, false),
                                        trim("dig_p2", 8, true),
                                        trim("dig_p3", 10, true),
                                        trim("dig_p4", 12, true),
                                        trim("dig_p5", 14, true),
                                        trim("dig_p6", 16, true),
                                        trim("dig_p7", 18, true),
                                        trim("dig_p8", 20, true),
                                        trim("dig_p9", 22, true)},
                             .n_bits = 192,
                             .read_only = true,
                             .non_volatile = true},
            }});
    }();
    return device;
}

} // namespace bmp280

/**
 * @brief Driver for the Bosch BMP280 pressure and temperature sensor
 *
 * Exposes one accessor per register. Raw ADC values are reported as read;
 * compensation with the calibration words is left to the caller.
 *
 * @code
 * BMP280 sensor(bus);
 * sensor.config.write(250.0, 8);
 * sensor.ctrl_meas.write(16, 2, bmp280::MeasurementMode::interval);
 * auto values = sensor.data.read();
 * @endcode
 *
 * @tparam Transport Caller-owned transport bound to address()
 */
template <RegisterTransport Transport>
class BMP280 : public DeviceApi<Transport> {
public:
    /// Acquisition options. Not cached: forced mode falls back to sleep on its own.
    class CtrlMeas : public RegisterAccess<Transport> {
    public:
        using RegisterAccess<Transport>::RegisterAccess;

        /**
         * Set oversampling and measurement mode
         *
         * 16x pressure oversampling wants 2x temperature oversampling; more
         * temperature oversampling does not improve pressure resolution. 0 skips
         * that measurement (output reads 0x80000).
         *
         * @param pressure_oversampling One of {0, 1, 2, 4, 8, 16}
         * @param temperature_oversampling One of {0, 1, 2, 4, 8, 16}
         * @param mode trigger, interval or sleep
         * @throws ValidationError before any I/O for values outside those sets
         */
        void write(int64_t pressure_oversampling = 16, int64_t temperature_oversampling = 2,
                   bmp280::MeasurementMode mode = bmp280::MeasurementMode::trigger) {
            detail::require_one_of(pressure_oversampling, bmp280::oversampling_values,
                                   "pressure_oversampling");
            detail::require_one_of(temperature_oversampling, bmp280::oversampling_values,
                                   "temperature_oversampling");
            const char* power = bmp280::power_mode(mode);
            this->write_fields({{"osrs_p", pressure_oversampling},
                                {"osrs_t", temperature_oversampling},
                                {"mode", std::string(power)}},
                               false);
        }
    };

    /// Standby time, IIR filter and interface selection
    class Config : public RegisterAccess<Transport> {
    public:
        using RegisterAccess<Transport>::RegisterAccess;

        /**
         * Configure the sampling period and filter
         *
         * Writes may be ignored while a conversion runs; put the chip to sleep
         * first to be sure they land.
         *
         * @param measurement_period_ms Standby between interval-mode measurements,
         *        one of {0.5, 62.5, 125, 250, 500, 1000, 2000, 4000}
         * @param smoothing_const IIR filter coefficient, one of {0, 2, 4, 8, 16}
         * @param disable_i2c Enable 3-wire SPI, which disables I2C
         * @throws ValidationError before any I/O for values outside those sets
         */
        void write(double measurement_period_ms = 4000.0, int64_t smoothing_const = 8,
                   bool disable_i2c = false) {
            detail::require_one_of(measurement_period_ms, bmp280::measurement_periods_ms,
                                   "measurement_period_ms");
            detail::require_one_of(smoothing_const, bmp280::filter_constants, "smoothing_const");
            this->write_fields({{"t_sb", measurement_period_ms},
                                {"filter", smoothing_const},
                                {"spi3w_en", disable_i2c}},
                               true);
        }
    };

    class Reset : public WriteOnlyRegister<Transport> {
    public:
        using WriteOnlyRegister<Transport>::WriteOnlyRegister;

        /// Soft reset; registers return to defaults and the chip enters sleep mode
        void write() { this->write_fields({{"reset", int64_t{bmp280::reset_magic}}}); }
    };

    /// @throws ValidationError if `address_pin_level` is not 0 or 1
    explicit BMP280(Transport& transport, uint8_t address_pin_level = 0)
        : DeviceApi<Transport>(transport, bmp280::hardware(), address_pin_level),
          chip_id(transport, bmp280::hardware(), "chip_id"),
          reset(transport, bmp280::hardware(), "reset"),
          status(transport, bmp280::hardware(), "status"),
          ctrl_meas(transport, bmp280::hardware(), "ctrl_meas"),
          config(transport, bmp280::hardware(), "config"),
          data(transport, bmp280::hardware(), "data"),
          calibration(transport, bmp280::hardware(), "calibration") {}

    BMP280(const BMP280&) = delete;
    BMP280& operator=(const BMP280&) = delete;

    /**
     * Confirm the chip identifies as a BMP280
     * @throws DeviceError if the chip reports another identifier
     */
    void check_chip_id() {
        const auto reported = as_integer(chip_id.read().at("chip_id"));
        if (reported != static_cast<int64_t>(this->hardware().chip_id())) {
            throw DeviceError("bmp280 chip id mismatch");
        }
    }

    ReadOnlyRegister<Transport> chip_id;
    Reset reset;
    ReadOnlyRegister<Transport> status;
    CtrlMeas ctrl_meas;
    Config config;
    ReadOnlyRegister<Transport> data;
    ReadOnlyRegister<Transport> calibration;
};

} // namespace aqsense::sensors
