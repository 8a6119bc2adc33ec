// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <algorithm>
#include <array>
#include <chrono>
#include <map>
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

namespace hdc1080 {

using Milliseconds = std::chrono::duration<double, std::milli>;

inline constexpr std::array<int64_t, 2> temperature_resolutions{11, 14};
inline constexpr std::array<int64_t, 3> humidity_resolutions{8, 11, 14};

/// Worst-case conversion times per resolution in bits
inline const std::map<int64_t, double>& temperature_conversion_ms() {
    static const std::map<int64_t, double> table{{14, 6.35}, {11, 3.65}};
    return table;
}

inline const std::map<int64_t, double>& humidity_conversion_ms() {
    static const std::map<int64_t, double> table{{14, 6.5}, {11, 3.85}, {8, 2.5}};
    return table;
}

/// Used while the configuration is unknown
inline constexpr Milliseconds default_measurement_duration{15.0};

inline constexpr Milliseconds soft_reset_duration{15.0};

/// Register map of the Texas Instruments HDC1080 humidity and temperature sensor
inline const Device& hardware() {
    static const Device device = [] {
        // T = raw * 165 / 2^16 - 40, RH = raw * 100 / 2^16
        const EncoderRef temperature = make_encoder(LinearEncoder{.quantity = "temperature",
                                                                  .scale = 65536.0 / 165.0,
                                                                  .offset = 40.0,
                                                                  .read_only = true});
        const EncoderRef humidity = make_encoder(
            LinearEncoder{.quantity = "humidity", .scale = 65536.0 / 100.0, .read_only = true});

        return Device(DeviceSpec{
            .name = "hdc1080",
            .chip_id = 0x1050,
            .addresses = {{0, 0x40}, {1, 0x40}}, // single fixed address
            .registers = {
                RegisterSpec{.name = "device_id",
                             .address = 0xFF,
                             .fields = {FieldSpec{.name = "device_id", .byte_index = {0, 1}}},
                             .n_bits = 16,
                             .read_only = true,
                             .non_volatile = true},
                RegisterSpec{.name = "manufacturer_id",
                             .address = 0xFE,
                             .fields = {FieldSpec{.name = "manufacturer_id", .byte_index = {0, 1}}},
                             .n_bits = 16,
                             .read_only = true,
                             .non_volatile = true},
                RegisterSpec{.name = "serial_id",
                             .address = 0xFB,
                             .fields = {FieldSpec{.name = "serial_id",
                                                  .byte_index = {0, 1, 2, 3, 4}}},
                             .n_bits = 48,
                             .read_only = true,
                             .non_volatile = true},
                RegisterSpec{
                    .name = "config",
                    .address = 0x02,
                    .fields =
                        {FieldSpec{.name = "reset",
                                   .bit_mask = 0b10000000,
                                   .encoder = encoders::flag()},
                         FieldSpec{.name = "heater_on",
                                   .bit_mask = 0b00100000,
                                   .encoder = encoders::flag()},
                         FieldSpec{.name = "measure_both",
                                   .bit_mask = 0b00010000,
                                   .encoder = encoders::flag()},
                         FieldSpec{.name = "battery_low",
                                   .bit_mask = 0b00001000,
                                   .encoder = encoders::flag(),
                                   .read_only = true},
                         FieldSpec{.name = "temp_res_bits",
                                   .bit_mask = 0b00000100,
                                   .encoder = make_encoder(
                                       LookupTable::from_integers({{14, 0}, {11, 1}}))},
                         FieldSpec{.name = "rh_res_bits",
                                   .bit_mask = 0b00000011,
                                   .encoder = make_encoder(LookupTable::from_integers(
                                       {{14, 0b00}, {11, 0b01}, {8, 0b10}}))},
                         FieldSpec{.name = "reserved", .byte_index = {1}}}, // must be zero
                    .n_bits = 16},
                RegisterSpec{.name = "humidity",
                             .address = 0x01,
                             .fields = {FieldSpec{.name = "humidity",
                                                  .byte_index = {0, 1},
                                                  .encoder = humidity}},
                             .n_bits = 16,
                             .read_only = true},
                RegisterSpec{.name = "temperature",
                             .address = 0x00,
                             .fields = {FieldSpec{.name = "temperature",
                                                  .byte_index = {0, 1},
                                                  .encoder = temperature}},
                             .n_bits = 16,
                             .read_only = true},
                // Both results in one burst, temperature first
                RegisterSpec{.name = "data",
                             .address = 0x00,
                             .fields = {FieldSpec{.name = "temperature",
                                                  .byte_index = {0, 1},
                                                  .encoder = temperature},
                                        FieldSpec{.name = "humidity",
                                                  .byte_index = {2, 3},
                                                  .encoder = humidity}},
                             .n_bits = 32,
                             .read_only = true},
            }});
    }();
    return device;
}

} // namespace hdc1080

/**
 * @brief Driver for the Texas Instruments HDC1080 humidity and temperature sensor
 *
 * A measurement starts when the temperature or humidity register pointer is
 * written and its result can only be read back after the conversion time.
 * With `measure_both` configured, one trigger converts both and the data
 * register returns them together.
 *
 * @tparam Transport Caller-owned transport bound to address()
 */
template <RegisterTransport Transport>
class HDC1080 : public DeviceApi<Transport> {
public:
    class Config : public RegisterAccess<Transport> {
    public:
        using RegisterAccess<Transport>::RegisterAccess;

        /**
         * Configure heater, resolution and acquisition mode
         *
         * Resolution sets the approximate precision:
         * temperature 11 bits 0.08 C, 14 bits 0.01 C;
         * humidity 8 bits 0.4 %RH, 11 bits 0.05 %RH, 14 bits 0.006 %RH.
         *
         * @param soft_reset Reset the device (cache is invalidated)
         * @param heater_on Drive off condensation
         * @param temperature_resolution_bits 11 or 14
         * @param humidity_resolution_bits 8, 11 or 14
         * @param measure_both Convert temperature and humidity on one trigger
         * @throws ValidationError before any I/O for unsupported resolutions
         */
        void write(bool soft_reset = false, bool heater_on = false,
                   int64_t temperature_resolution_bits = 14, int64_t humidity_resolution_bits = 14,
                   bool measure_both = true) {
            detail::require_one_of(temperature_resolution_bits, hdc1080::temperature_resolutions,
                                   "temperature_resolution_bits");
            detail::require_one_of(humidity_resolution_bits, hdc1080::humidity_resolutions,
                                   "humidity_resolution_bits");
            this->write_fields({{"reset", soft_reset},
                                {"heater_on", heater_on},
                                {"temp_res_bits", temperature_resolution_bits},
                                {"rh_res_bits", humidity_resolution_bits},
                                {"measure_both", measure_both},
                                {"battery_low", false},
                                {"reserved", int64_t{0}}},
                               !soft_reset);
            if (soft_reset) {
                this->invalidate();
                std::this_thread::sleep_for(hdc1080::soft_reset_duration);
            }
        }
    };

    explicit HDC1080(Transport& transport, uint8_t address_pin_level = 0)
        : DeviceApi<Transport>(transport, hdc1080::hardware(), address_pin_level),
          config(transport, hdc1080::hardware(), "config"),
          data(transport, hdc1080::hardware(), "data"),
          humidity(transport, hdc1080::hardware(), "humidity"),
          temperature(transport, hdc1080::hardware(), "temperature"),
          serial_id(transport, hdc1080::hardware(), "serial_id"),
          manufacturer_id(transport, hdc1080::hardware(), "manufacturer_id"),
          device_id(transport, hdc1080::hardware(), "device_id") {}

    HDC1080(const HDC1080&) = delete;
    HDC1080& operator=(const HDC1080&) = delete;

    /// @throws DeviceError if the chip reports another device id
    void check_chip_id() {
        const auto reported = as_integer(device_id.read().at("device_id"));
        if (reported != static_cast<int64_t>(this->hardware().chip_id())) {
            throw DeviceError("hdc1080 device id mismatch");
        }
    }

    /**
     * Conversion time for the cached configuration, per datasheet
     *
     * Sum of both conversions when measuring both, otherwise the longer
     * one, plus 1 ms margin. 15 ms while the configuration is unknown.
     */
    hdc1080::Milliseconds measurement_duration() const {
        const auto t_bits = config.value("temp_res_bits");
        const auto rh_bits = config.value("rh_res_bits");
        const auto both = config.value("measure_both");
        if (!t_bits || !rh_bits || !both) {
            return hdc1080::default_measurement_duration;
        }
        const auto t = hdc1080::temperature_conversion_ms().find(as_integer(*t_bits).value_or(-1));
        const auto rh = hdc1080::humidity_conversion_ms().find(as_integer(*rh_bits).value_or(-1));
        if (t == hdc1080::temperature_conversion_ms().end() ||
            rh == hdc1080::humidity_conversion_ms().end()) {
            return hdc1080::default_measurement_duration;
        }
        if (as_integer(*both).value_or(0) != 0) {
            return hdc1080::Milliseconds{t->second + rh->second + 1.0};
        }
        return hdc1080::Milliseconds{std::max(t->second, rh->second) + 1.0};
    }

    /**
     * Start a conversion with the current configuration
     *
     * Writes the register pointer only: the humidity register when only
     * humidity is requested, the temperature register otherwise.
     */
    void trigger_measurement(bool temperature_requested = true, bool humidity_requested = true) {
        const char* target =
            (humidity_requested && !temperature_requested) ? "humidity" : "temperature";
        this->send_command(this->hardware().reg(target).address());
    }

    /**
     * Trigger, wait for the conversion and read the result back
     *
     * Returns the values of the data register when both quantities are
     * requested, else those of the single register.
     *
     * @throws ValidationError if neither quantity is requested
     * @throws UnsupportedOperation if both are requested but the cached
     *         configuration converts them separately
     */
    const FieldValues& measure(bool temperature_requested = true, bool humidity_requested = true)
        requires PointerReadTransport<Transport>
    {
        if (!temperature_requested && !humidity_requested) {
            throw ValidationError("measure needs temperature, humidity or both");
        }
        RegisterAccess<Transport>* target = &data;
        if (!humidity_requested) {
            target = &temperature;
        } else if (!temperature_requested) {
            target = &humidity;
        } else if (const auto both = config.value("measure_both");
                   both && as_integer(*both).value_or(0) == 0) {
            throw UnsupportedOperation("hdc1080 is configured to convert one quantity at a time");
        }
        trigger_measurement(temperature_requested, humidity_requested);
        std::this_thread::sleep_for(measurement_duration());
        const Bytes raw =
            this->transport().read_current(this->hardware().read_length(target->reg()));
        return target->update_from_raw(raw);
    }

    Config config;
    ReadOnlyRegister<Transport> data;
    ReadOnlyRegister<Transport> humidity;
    ReadOnlyRegister<Transport> temperature;
    ReadOnlyRegister<Transport> serial_id;
    ReadOnlyRegister<Transport> manufacturer_id;
    ReadOnlyRegister<Transport> device_id;
};

} // namespace aqsense::sensors
