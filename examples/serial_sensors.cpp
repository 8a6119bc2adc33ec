// Serial sensor example for AQSENSE
//
// The drivers only need an object with write(), read() and flush_input().
// LoopbackPort stands in for a 9600 8N1 UART by answering requests the way
// the sensors do.

#include <deque>
#include <iostream>
#include <span>

#include <aqsense.hpp>

namespace modbus = aqsense::serial::modbus;
namespace pms7003 = aqsense::serial::pms7003;

namespace {

class LoopbackPort {
public:
    void write(std::span<const uint8_t> data) {
        const aqsense::Bytes request(data.begin(), data.end());
        if (request.size() == 8 && modbus::check_crc(request) && request[1] == 0x04) {
            // Senseair S8: every input register reads 415
            const auto count = static_cast<uint8_t>(request[5]);
            aqsense::Bytes reply{request[0], request[1], static_cast<uint8_t>(2 * count)};
            for (uint8_t i = 0; i < count; ++i) {
                reply.push_back(0x01);
                reply.push_back(0x9F);
            }
            enqueue(modbus::append_crc(reply));
        } else if (request == pms7003::read_command()) {
            enqueue(particulate_frame());
        }
    }

    aqsense::Bytes read(size_t count) {
        aqsense::Bytes out;
        while (out.size() < count && !input_.empty()) {
            out.push_back(input_.front());
            input_.pop_front();
        }
        return out;
    }

    void flush_input() { input_.clear(); }

private:
    static aqsense::Bytes particulate_frame() {
        aqsense::Bytes frame{0x42, 0x4D, 0x00, 0x1C};
        for (uint16_t word : {4, 9, 11, 4, 9, 11, 780, 230, 52, 8, 2, 1}) {
            frame.push_back(static_cast<uint8_t>(word >> 8));
            frame.push_back(static_cast<uint8_t>(word & 0xFF));
        }
        frame.push_back(0x97); // version
        frame.push_back(0x00); // error
        const uint16_t sum = pms7003::checksum(frame);
        frame.push_back(static_cast<uint8_t>(sum >> 8));
        frame.push_back(static_cast<uint8_t>(sum & 0xFF));
        return frame;
    }

    void enqueue(const aqsense::Bytes& bytes) { input_.insert(input_.end(), bytes.begin(), bytes.end()); }

    std::deque<uint8_t> input_;
};

} // namespace

int main() {
    std::cout << "AQSENSE - Serial Sensors Example\n";
    std::cout << "================================\n\n";

    LoopbackPort port;

    // Example 1: CO2 over Modbus RTU
    try {
        std::cout << "Example 1: Senseair S8\n";
        aqsense::serial::SenseairS8<LoopbackPort> s8(port);
        std::cout << "  CO2: " << s8.read_co2() << " ppm\n\n";
    } catch (const aqsense::Error& e) {
        std::cerr << "  S8 failed: " << e.what() << "\n";
        return 1;
    }

    // Example 2: Particulate matter in passive mode
    try {
        std::cout << "Example 2: PMS7003\n";
        aqsense::serial::PMS7003<LoopbackPort> pms(port);
        std::cout << "  Mode: " << pms7003::mode_string(pms.mode()) << "\n";
        pms.read();
        for (const auto& [name, value] : pms.data_values()) {
            std::cout << "  " << name << " = " << aqsense::to_string(value) << "\n";
        }
        pms.sleep();
        std::cout << "  Mode: " << pms7003::mode_string(pms.mode()) << "\n\n";
    } catch (const aqsense::Error& e) {
        std::cerr << "  PMS7003 failed: " << e.what() << "\n";
        return 1;
    }

    std::cout << "All examples completed!\n";
    return 0;
}
