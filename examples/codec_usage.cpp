// Codec usage example for AQSENSE

#include <iomanip>
#include <iostream>
#include <string>

#include <aqsense.hpp>

namespace {

void print_values(const aqsense::FieldValues& values) {
    for (const auto& [name, value] : values) {
        std::cout << "  " << std::left << std::setw(16) << name << aqsense::to_string(value)
                  << "\n";
    }
}

} // namespace

int main() {
    std::cout << "AQSENSE - Codec Usage Example\n";
    std::cout << "=============================\n\n";

    // Example 1: Describing a register
    aqsense::Register ctrl(aqsense::RegisterSpec{
        .name = "ctrl",
        .address = 0x10,
        .fields = {aqsense::FieldSpec{.name = "rate",
                                      .bit_mask = 0b11110000,
                                      .encoder = aqsense::make_encoder(
                                          aqsense::LookupTable::from_reals({{0.5, 0},
                                                                            {1.0, 1},
                                                                            {2.0, 2},
                                                                            {4.0, 3}}))},
                   aqsense::FieldSpec{.name = "mode",
                                      .bit_mask = 0b00000011,
                                      .encoder = aqsense::make_encoder(
                                          aqsense::LookupTable::from_strings(
                                              {{"off", 0}, {"single", 1}, {"continuous", 3}}))},
                   aqsense::FieldSpec{.name = "enabled",
                                      .bit_mask = 0b00000100,
                                      .encoder = aqsense::encoders::flag()}}});
    std::cout << "Example 1: Register '" << ctrl.name() << "' with " << ctrl.fields().size()
              << " fields\n\n";

    // Example 2: Encoding field values into register bytes
    {
        std::cout << "Example 2: Encoding\n";
        const aqsense::Bytes raw = ctrl.field_values_to_raw_bytes(
            {{"rate", 2.0}, {"mode", std::string("continuous")}, {"enabled", true}});
        std::cout << "  Raw: " << aqsense::to_string(raw) << "\n\n";
    }

    // Example 3: Decoding a register image
    {
        std::cout << "Example 3: Decoding 0x35\n";
        print_values(ctrl.raw_bytes_to_field_values(aqsense::Bytes{0x35}));
        std::cout << "\n";
    }

    // Example 4: Fixed-point quantities
    {
        std::cout << "Example 4: Fixed-point temperature\n";
        aqsense::Field temperature(aqsense::FieldSpec{
            .name = "temperature",
            .byte_index = {0, 1},
            .encoder = aqsense::make_encoder(aqsense::LinearEncoder{
                .quantity = "temperature", .scale = 512.0, .offset = 25.0, .raw_floor = 0})});
        for (double celsius : {-40.0, 0.0, 21.5}) {
            const aqsense::Bytes raw = temperature.encode(celsius);
            std::cout << "  " << celsius << " C -> " << aqsense::to_string(raw) << " -> "
                      << aqsense::to_string(temperature.decode(raw)) << " C\n";
        }
        std::cout << "\n";
    }

    // Example 5: Errors carry their context
    {
        std::cout << "Example 5: Rejected values\n";
        try {
            ctrl.field_values_to_raw_bytes({{"mode", std::string("burst")}});
        } catch (const aqsense::Error& e) {
            std::cout << "  " << aqsense::error_kind_string(e.kind()) << ": " << e.message()
                      << "\n";
        }
        try {
            ctrl.raw_bytes_to_field_values(aqsense::Bytes{0x02});
        } catch (const aqsense::CodecError& e) {
            std::cout << "  " << e.what() << "\n";
        }
        std::cout << "\n";
    }

    std::cout << "All examples completed!\n";
    return 0;
}
