#include <cstdint>
#include <gtest/gtest.h>
#include <aqsense/core/detail/bit_mask.hpp>

using namespace aqsense::detail;

TEST(BitMaskTest, ShiftNoTrailingZeros) {
    EXPECT_EQ(mask_shift(0b1), 0u);
}

TEST(BitMaskTest, ShiftOneByte) {
    EXPECT_EQ(mask_shift(0b1000), 3u);
}

TEST(BitMaskTest, ShiftMultiByte) {
    EXPECT_EQ(mask_shift(0xFFFF000), 12u);
}

TEST(BitMaskTest, ZeroMaskHasNoShift) {
    EXPECT_FALSE(mask_shift(0).has_value());
}

TEST(BitMaskTest, MaskFitsWidth) {
    EXPECT_TRUE(mask_fits_width(0xF0, 1));
    EXPECT_FALSE(mask_fits_width(0x1F0, 1));
    EXPECT_TRUE(mask_fits_width(0xFFFFF0, 3));
    EXPECT_FALSE(mask_fits_width(0x01, 0));
    EXPECT_FALSE(mask_fits_width(0x01, 9));
}

TEST(BitMaskTest, ExtractAndInsert) {
    EXPECT_EQ(extract_masked(0b00111100, 0b11110000, 4), 0b0011u);
    EXPECT_EQ(insert_masked(0b0011, 0b11110000, 4), 0b00110000u);
}

TEST(BitMaskTest, InsertOverflowRejected) {
    EXPECT_FALSE(insert_masked(0b10000, 0b11110000, 4).has_value());
}

TEST(BitMaskTest, InsertIntoGappedMaskRejected) {
    // 0b101 has a hole; value 0b010 would land in it
    EXPECT_FALSE(insert_masked(0b010, 0b101, 0).has_value());
    EXPECT_EQ(insert_masked(0b101, 0b101, 0), 0b101u);
}

TEST(BitMaskTest, ConstexprFunctions) {
    static_assert(mask_shift(0b00011100).value() == 2);
    static_assert(extract_masked(0xFF, 0x0F, 0) == 0x0F);
    SUCCEED();
}
