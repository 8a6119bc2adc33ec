#pragma once

#include <algorithm>
#include <array>
#include <deque>
#include <functional>
#include <map>
#include <optional>
#include <span>
#include <utility>
#include <vector>

#include <cstddef>
#include <cstdint>
#include <aqsense/serial/modbus.hpp>
#include <aqsense/serial/pms7003.hpp>
#include <aqsense/serial/senseair_s8.hpp>

namespace aqsense::serial::test {

/**
 * @brief Scripted serial port
 *
 * Every write is recorded and handed to the responder, whose reply is queued
 * as input. Input arrives in bursts: read() never crosses the end of a burst
 * and returns fewer bytes than asked there, like a port whose read timeout
 * expired while the line was idle.
 */
class FakeSerialPort {
public:
    using Responder = std::function<Bytes(std::span<const uint8_t>)>;

    void set_responder(Responder responder) { responder_ = std::move(responder); }

    void queue_input(std::span<const uint8_t> bytes) {
        if (!bytes.empty()) {
            input_.emplace_back(bytes.begin(), bytes.end());
        }
    }

    void write(std::span<const uint8_t> data) {
        writes_.emplace_back(data.begin(), data.end());
        if (responder_) {
            const Bytes reply = responder_(data);
            queue_input(reply);
        }
    }

    Bytes read(size_t count) {
        if (input_.empty()) {
            return {};
        }
        Bytes& burst = input_.front();
        const auto take = static_cast<std::ptrdiff_t>(std::min(count, burst.size()));
        Bytes out(burst.begin(), burst.begin() + take);
        burst.erase(burst.begin(), burst.begin() + take);
        if (burst.empty()) {
            input_.pop_front();
        }
        return out;
    }

    void flush_input() {
        input_.clear();
        ++flush_count_;
    }

    const std::vector<Bytes>& writes() const noexcept { return writes_; }
    size_t pending_input() const noexcept {
        size_t total = 0;
        for (const auto& burst : input_) {
            total += burst.size();
        }
        return total;
    }
    size_t flush_count() const noexcept { return flush_count_; }

private:
    Responder responder_;
    std::deque<Bytes> input_;
    std::vector<Bytes> writes_;
    size_t flush_count_ = 0;
};

static_assert(SerialPort<FakeSerialPort>);

/**
 * @brief Register-level model of a Senseair S8 answering Modbus RTU requests
 *
 * Write requests are echoed the way the sensor does. A background
 * calibration command sets the acknowledgement bit unless disabled.
 */
struct S8Simulator {
    std::map<uint16_t, uint16_t> input_registers;
    std::map<uint16_t, uint16_t> holding_registers;
    bool acknowledge_calibration = true;
    std::optional<uint8_t> exception_code;
    bool corrupt_crc = false;

    Bytes respond(std::span<const uint8_t> request) {
        if (request.size() != 8 || !modbus::check_crc(request)) {
            return {};
        }
        const uint8_t function = request[1];
        const auto reg = static_cast<uint16_t>((request[2] << 8) | request[3]);
        const auto operand = static_cast<uint16_t>((request[4] << 8) | request[5]);

        if (function == 0x06) {
            holding_registers[reg] = operand;
            if (reg == s8::command_register && operand == s8::background_calibration_command &&
                acknowledge_calibration) {
                holding_registers[s8::ack_register] |= s8::background_calibration_ack;
            }
            return Bytes(request.begin(), request.end());
        }

        if (exception_code) {
            return modbus::append_crc(
                {request[0], static_cast<uint8_t>(function | 0x80), *exception_code});
        }
        const auto& bank = function == 0x04 ? input_registers : holding_registers;
        Bytes reply{request[0], function, static_cast<uint8_t>(2 * operand)};
        for (uint16_t i = 0; i < operand; ++i) {
            auto it = bank.find(static_cast<uint16_t>(reg + i));
            const uint16_t value = it == bank.end() ? 0 : it->second;
            reply.push_back(static_cast<uint8_t>(value >> 8));
            reply.push_back(static_cast<uint8_t>(value & 0xFF));
        }
        reply = modbus::append_crc(std::move(reply));
        if (corrupt_crc) {
            reply.back() ^= 0xFF;
        }
        return reply;
    }
};

/// Complete 32-byte PMS7003 frame carrying `data` in the 12 data words
inline Bytes pms_frame(const std::array<uint16_t, 12>& data, uint8_t version = 0x97,
                       uint8_t error = 0) {
    Bytes frame{pms7003::start_bytes[0], pms7003::start_bytes[1], 0x00, 28};
    for (uint16_t word : data) {
        frame.push_back(static_cast<uint8_t>(word >> 8));
        frame.push_back(static_cast<uint8_t>(word & 0xFF));
    }
    frame.push_back(version);
    frame.push_back(error);
    const uint16_t sum = pms7003::checksum(frame);
    frame.push_back(static_cast<uint8_t>(sum >> 8));
    frame.push_back(static_cast<uint8_t>(sum & 0xFF));
    return frame;
}

} // namespace aqsense::serial::test
