#include <array>

#include <cstdint>
#include <gtest/gtest.h>
#include <aqsense/core/endian.hpp>

using namespace aqsense;

TEST(EndianTest, LoadBigEndian) {
    const std::array<uint8_t, 3> bytes{0x12, 0x34, 0x56};
    EXPECT_EQ(load_uint(bytes, ByteOrder::big), 0x123456u);
}

TEST(EndianTest, LoadLittleEndian) {
    const std::array<uint8_t, 3> bytes{0x12, 0x34, 0x56};
    EXPECT_EQ(load_uint(bytes, ByteOrder::little), 0x563412u);
}

TEST(EndianTest, LoadFullWidth) {
    const std::array<uint8_t, 8> bytes{0xCA, 0xFE, 0xBA, 0xBE, 0xDE, 0xAD, 0xBE, 0xEF};
    EXPECT_EQ(load_uint(bytes, ByteOrder::big), 0xCAFEBABEDEADBEEFULL);
    EXPECT_EQ(load_uint(bytes, ByteOrder::little), 0xEFBEADDEBEBAFECAULL);
}

TEST(EndianTest, LoadEmptyIsZero) {
    EXPECT_EQ(load_uint({}, ByteOrder::big), 0u);
}

TEST(EndianTest, StoreBothOrders) {
    EXPECT_EQ(store_uint(0x1234, 2, ByteOrder::big), (Bytes{0x12, 0x34}));
    EXPECT_EQ(store_uint(0x1234, 2, ByteOrder::little), (Bytes{0x34, 0x12}));
}

TEST(EndianTest, StorePadsToWidth) {
    EXPECT_EQ(store_uint(0x01, 4, ByteOrder::big), (Bytes{0x00, 0x00, 0x00, 0x01}));
    EXPECT_EQ(store_uint(0x01, 4, ByteOrder::little), (Bytes{0x01, 0x00, 0x00, 0x00}));
}

TEST(EndianTest, StoreThenLoad) {
    const Bytes bytes = store_uint(0xABCDEF, 3, ByteOrder::little);
    EXPECT_EQ(load_uint(bytes, ByteOrder::little), 0xABCDEFu);
}

// Range helpers used by the integer encoders
TEST(EndianTest, WidthLimits) {
    EXPECT_EQ(detail::max_unsigned(1), 0xFFu);
    EXPECT_EQ(detail::max_unsigned(3), 0xFFFFFFu);
    EXPECT_EQ(detail::max_unsigned(8), UINT64_MAX);
    EXPECT_EQ(detail::min_signed(2), -32768);
    EXPECT_EQ(detail::max_signed(2), 32767);
    EXPECT_EQ(detail::min_signed(8), INT64_MIN);
}

TEST(EndianTest, FitsChecks) {
    EXPECT_TRUE(detail::fits_unsigned(255, 1));
    EXPECT_FALSE(detail::fits_unsigned(256, 1));
    EXPECT_TRUE(detail::fits_signed(-128, 1));
    EXPECT_FALSE(detail::fits_signed(128, 1));
    EXPECT_FALSE(detail::fits_unsigned(0, 0));
}

TEST(EndianTest, SignExtend) {
    EXPECT_EQ(detail::sign_extend(0xFC18, 2), -1000);
    EXPECT_EQ(detail::sign_extend(0x7FFF, 2), 32767);
    EXPECT_EQ(detail::sign_extend(0x80, 1), -128);
    // Bits above the width are ignored
    EXPECT_EQ(detail::sign_extend(0x1FF, 1), -1);
}

TEST(EndianTest, ConstexprFunctions) {
    constexpr std::array<uint8_t, 2> bytes{0x18, 0xFC};
    constexpr uint64_t value = load_uint(bytes, ByteOrder::little);
    static_assert(value == 0xFC18);
    static_assert(detail::sign_extend(value, 2) == -1000);
    EXPECT_EQ(value, 0xFC18u);
}
