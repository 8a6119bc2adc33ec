#pragma once

#include <cstdint>
#include <gtest/gtest.h>
#include <aqsense/access/register_access.hpp>
#include <aqsense/codec/device.hpp>
#include <aqsense/utils/memory_transport.hpp>

using namespace aqsense;
using aqsense::utils::MemoryTransport;

// Accessor exposing the protected write path to tests
class TestRegister : public RegisterAccess<MemoryTransport> {
public:
    using RegisterAccess<MemoryTransport>::RegisterAccess;
    using RegisterAccess<MemoryTransport>::write_fields;
};

// Shared fixture for register accessor tests
class RegisterAccessTest : public ::testing::Test {
protected:
    static const Device& test_device() {
        static const Device device(DeviceSpec{
            .name = "test",
            .chip_id = 0x42,
            .addresses = {{0, 0x20}, {1, 0x21}},
            .registers = {
                RegisterSpec{.name = "id",
                             .address = 0x0F,
                             .fields = {FieldSpec{.name = "id"}},
                             .read_only = true,
                             .non_volatile = true},
                RegisterSpec{.name = "ctrl",
                             .address = 0x10,
                             .fields = {FieldSpec{.name = "rate", .bit_mask = 0xF0},
                                        FieldSpec{.name = "enabled",
                                                  .bit_mask = 0x01,
                                                  .encoder = encoders::flag()}}},
                RegisterSpec{.name = "data",
                             .address = 0x11,
                             .fields = {FieldSpec{.name = "a", .byte_index = {0, 1}},
                                        FieldSpec{.name = "b", .byte_index = {2, 3}}},
                             .n_bits = 32,
                             .read_only = true},
                // Code 0b11 has no table entry
                RegisterSpec{.name = "mode",
                             .address = 0x12,
                             .fields = {FieldSpec{.name = "mode",
                                                  .bit_mask = 0x03,
                                                  .encoder = make_encoder(LookupTable::from_integers(
                                                      {{0, 0b00}, {1, 0b01}, {2, 0b10}}))}}},
            }});
        return device;
    }

    MemoryTransport bus;
};
