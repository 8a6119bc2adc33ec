// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <array>
#include <numeric>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include <cstddef>
#include <cstdint>

#include "../codec/register.hpp"
#include "../core/error.hpp"
#include "../core/types.hpp"
#include "../core/value.hpp"
#include "serial_port.hpp"

namespace aqsense::serial {

namespace pms7003 {

inline constexpr std::array<uint8_t, 2> start_bytes{0x42, 0x4D};
inline constexpr size_t body_size = 30;
inline constexpr size_t frame_size = start_bytes.size() + body_size;

/// Data field names in frame order, excluding frame length, version, error and checksum
inline constexpr std::array<const char*, 12> data_fields{
    "pm1_0",     "pm2_5",     "pm10_0",    "pm1_0_atm", "pm2_5_atm", "pm10_0_atm",
    "count_0_3", "count_0_5", "count_1_0", "count_2_5", "count_5_0", "count_10_0"};

enum class Mode : uint8_t {
    unknown,
    active,  // Sensor streams frames on its own every 0.2 to 2.3 s
    passive, // Sensor sends one frame per read command
    sleep    // Fan off, no measurements
};

constexpr const char* mode_string(Mode mode) noexcept {
    switch (mode) {
        case Mode::unknown:
            return "unknown";
        case Mode::active:
            return "active";
        case Mode::passive:
            return "passive";
        case Mode::sleep:
            return "sleep";
    }
    return "unknown";
}

/// Plain byte sum used by frames and commands
inline uint16_t checksum(std::span<const uint8_t> bytes) noexcept {
    return static_cast<uint16_t>(std::accumulate(bytes.begin(), bytes.end(), 0u));
}

/// Seven byte command: start bytes, command, two data bytes, checksum (big endian)
inline Bytes make_command(uint8_t command, uint16_t data) {
    Bytes out{start_bytes[0], start_bytes[1], command, static_cast<uint8_t>(data >> 8),
              static_cast<uint8_t>(data & 0xFF)};
    const uint16_t sum = checksum(out);
    out.push_back(static_cast<uint8_t>(sum >> 8));
    out.push_back(static_cast<uint8_t>(sum & 0xFF));
    return out;
}

inline Bytes passive_mode_command() { return make_command(0xE1, 0x0000); }
inline Bytes active_mode_command() { return make_command(0xE1, 0x0001); }
inline Bytes sleep_command() { return make_command(0xE4, 0x0000); }
inline Bytes wake_command() { return make_command(0xE4, 0x0001); }
inline Bytes read_command() { return make_command(0xE2, 0x0000); }

/// Layout of the 30 bytes following the start bytes
inline const Register& frame_register() {
    static const Register reg = [] {
        std::vector<FieldSpec> fields;
        fields.push_back(FieldSpec{.name = "frame_length", .byte_index = {0, 1}});
        size_t offset = 2;
        for (const char* name : data_fields) {
            fields.push_back(FieldSpec{.name = name, .byte_index = {offset, offset + 1}});
            offset += 2;
        }
        fields.push_back(FieldSpec{.name = "version", .byte_index = {26}});
        fields.push_back(FieldSpec{.name = "error", .byte_index = {27}});
        fields.push_back(FieldSpec{.name = "checksum", .byte_index = {28, 29}});
        return Register(RegisterSpec{.name = "frame",
                                     .fields = std::move(fields),
                                     .n_bits = body_size * 8,
                                     .read_only = true});
    }();
    return reg;
}

/**
 * Decode the 30 bytes following the start bytes
 * @return Every field except the checksum
 * @throws TransportError on a short body or checksum mismatch
 */
inline FieldValues parse_frame(std::span<const uint8_t> body) {
    if (body.size() != body_size) {
        throw TransportError("expected a " + std::to_string(body_size) + " byte frame, got " +
                             std::to_string(body.size()));
    }
    FieldValues values = frame_register().raw_bytes_to_field_values(body);
    const uint16_t calculated = static_cast<uint16_t>(checksum(start_bytes) +
                                                      checksum(body.first(body_size - 2)));
    const auto received = as_integer(values.at("checksum")).value_or(-1);
    if (received != calculated) {
        throw TransportError("frame checksum mismatch: received " + std::to_string(received) +
                             ", calculated " + std::to_string(calculated));
    }
    values.erase("checksum");
    return values;
}

} // namespace pms7003

/// Bounds on the active-mode frame search
struct Pms7003Options {
    size_t max_sync_bytes = 2 * pms7003::frame_size; ///< Bytes scanned for the start bytes
    unsigned max_frame_attempts = 3;                  ///< Frames tried before giving up
};

/**
 * @brief Driver for the Plantower PMS7003 particulate matter sensor (9600 8N1)
 *
 * Construction wakes the sensor and selects passive mode. In passive mode
 * read() requests and decodes one frame; in active mode listen() waits for
 * the next frame the sensor sends.
 *
 * @tparam Port Caller-owned serial port, read timeout of at least 2.3 s
 */
template <SerialPort Port>
class PMS7003 {
public:
    explicit PMS7003(Port& port, Pms7003Options options = {}) : port_(&port), options_(options) {
        port_->flush_input();
        wake();
        set_passive_mode();
    }

    pms7003::Mode mode() const noexcept { return mode_; }

    /**
     * Request and decode one frame
     * @throws UnsupportedOperation unless in passive mode
     * @throws TransportError on a short or corrupt frame
     */
    const FieldValues& read() {
        require_mode(pms7003::Mode::passive, "read");
        port_->flush_input();
        send(pms7003::read_command());
        const Bytes frame = port_->read(pms7003::frame_size);
        if (frame.size() != pms7003::frame_size) {
            throw TransportError("expected a " + std::to_string(pms7003::frame_size) +
                                 " byte frame, got " + std::to_string(frame.size()));
        }
        if (frame[0] != pms7003::start_bytes[0] || frame[1] != pms7003::start_bytes[1]) {
            throw TransportError("frame does not begin with the start bytes");
        }
        return store(pms7003::parse_frame(std::span<const uint8_t>(frame).subspan(2)));
    }

    /**
     * Wait for the next frame the sensor sends on its own
     * @throws UnsupportedOperation unless in active mode
     * @throws TransportError if no complete frame arrives within the configured bounds
     */
    const FieldValues& listen() {
        require_mode(pms7003::Mode::active, "listen");
        for (unsigned attempt = 0; attempt < options_.max_frame_attempts; ++attempt) {
            sync();
            const Bytes body = port_->read(pms7003::body_size);
            if (body.size() < pms7003::body_size) {
                continue;
            }
            return store(pms7003::parse_frame(body));
        }
        throw TransportError("no complete frame after " +
                             std::to_string(options_.max_frame_attempts) + " attempt(s)");
    }

    /// Stop measuring and turn the fan off
    void sleep() {
        send(pms7003::sleep_command());
        mode_ = pms7003::Mode::sleep;
    }

    /// Wake into passive mode
    void wake() {
        send(pms7003::wake_command());
        mode_ = pms7003::Mode::passive;
    }

    void set_passive_mode() {
        send(pms7003::passive_mode_command());
        mode_ = pms7003::Mode::passive;
    }

    void set_active_mode() {
        send(pms7003::active_mode_command());
        mode_ = pms7003::Mode::active;
    }

    /// Last decoded frame: frame_length, data fields, version and error
    const FieldValues& values() const noexcept { return values_; }

    /// Concentrations and counts only
    FieldValues data_values() const {
        FieldValues out;
        for (const char* name : pms7003::data_fields) {
            auto it = values_.find(name);
            if (it != values_.end()) {
                out.emplace(it->first, it->second);
            }
        }
        return out;
    }

    void invalidate() noexcept { values_.clear(); }

private:
    void send(const Bytes& command) { port_->write(std::span<const uint8_t>(command)); }

    void require_mode(pms7003::Mode required, const char* operation) const {
        if (mode_ != required) {
            throw UnsupportedOperation(std::string(operation) + " needs " +
                                       pms7003::mode_string(required) + " mode, sensor is in " +
                                       pms7003::mode_string(mode_) + " mode");
        }
    }

    // Consume input up to and including the start bytes
    void sync() {
        uint8_t previous = 0;
        for (size_t scanned = 0; scanned < options_.max_sync_bytes; ++scanned) {
            const Bytes next = port_->read(1);
            if (next.empty()) {
                throw TransportError("timed out waiting for a frame");
            }
            if (previous == pms7003::start_bytes[0] && next[0] == pms7003::start_bytes[1]) {
                return;
            }
            previous = next[0];
        }
        throw TransportError("no start bytes within " + std::to_string(options_.max_sync_bytes) +
                             " byte(s)");
    }

    const FieldValues& store(FieldValues parsed) {
        values_ = std::move(parsed);
        return values_;
    }

    Port* port_;
    Pms7003Options options_;
    pms7003::Mode mode_ = pms7003::Mode::unknown;
    FieldValues values_;
};

} // namespace aqsense::serial
