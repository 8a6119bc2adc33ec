// BMP280 sampling example for AQSENSE
//
// Runs the driver against an in-memory register file. On hardware, replace
// MemoryTransport with a transport bound to sensor.address() on the I2C bus.

#include <chrono>
#include <iostream>

#include <aqsense.hpp>

using aqsense::sensors::BMP280;
using aqsense::utils::MemoryTransport;
namespace bmp280 = aqsense::sensors::bmp280;

namespace {

void load_power_on_state(MemoryTransport& bus) {
    bus.set_register(0xD0, aqsense::Bytes{0x58});
    bus.set_register(0xF3, aqsense::Bytes{0x00});
    bus.set_register(0xF4, aqsense::Bytes{0x00});
    bus.set_register(0xF5, aqsense::Bytes{0x00});
    bus.set_register(0xF7, aqsense::Bytes{0x65, 0x5A, 0xC0, 0x7E, 0xED, 0x00});
    bus.set_register(0x88, aqsense::Bytes{0x70, 0x6B, 0x43, 0x67, 0x18, 0xFC, 0x7D, 0x8E,
                                          0x43, 0xD6, 0xD0, 0x0B, 0x27, 0x0B, 0x8C, 0x00,
                                          0xF9, 0xFF, 0x8C, 0x3C, 0xF8, 0xC6, 0x70, 0x17});
}

} // namespace

int main() {
    std::cout << "AQSENSE - BMP280 Sampling Example\n";
    std::cout << "=================================\n\n";

    MemoryTransport bus;
    load_power_on_state(bus);

    try {
        BMP280<MemoryTransport> sensor(bus);
        std::cout << "Bus address: 0x" << std::hex << sensor.address() << std::dec << "\n";

        sensor.check_chip_id();
        std::cout << "Chip id: OK\n\n";

        // Calibration words are read once and served from cache afterwards
        const auto& trim = sensor.calibration.read();
        std::cout << "Calibration:\n";
        for (const auto& [name, value] : trim) {
            std::cout << "  " << name << " = " << aqsense::to_string(value) << "\n";
        }
        std::cout << "\n";

        sensor.config.write(250.0, 8);
        sensor.ctrl_meas.write(16, 2, bmp280::MeasurementMode::interval);
        std::cout << "Configured: " << bus.write_count() << " register write(s)\n";
        std::cout << "  t_sb = " << aqsense::to_string(*sensor.config.value("t_sb")) << " ms\n\n";

        // Simulate a glitch on the bus; the read succeeds on the second attempt
        bus.fail_next(1);
        const aqsense::RetryPolicy policy{.attempts = 3, .backoff = std::chrono::milliseconds{10}};
        const auto& data = aqsense::with_retries(
            sensor.data, policy,
            [&]() -> const aqsense::FieldValues& { return sensor.data.read(); });
        std::cout << "Raw ADC values:\n";
        std::cout << "  pressure    = " << aqsense::to_string(data.at("pressure")) << "\n";
        std::cout << "  temperature = " << aqsense::to_string(data.at("temperature")) << "\n\n";

        try {
            sensor.ctrl_meas.write(3);
        } catch (const aqsense::ValidationError& e) {
            std::cout << "Rejected before I/O: " << e.message() << "\n\n";
        }
    } catch (const aqsense::Error& e) {
        std::cerr << "Sampling failed: " << e.what() << "\n";
        return 1;
    }

    std::cout << "All examples completed!\n";
    return 0;
}
