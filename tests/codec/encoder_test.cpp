#include <string>
#include <utility>
#include <vector>

#include <cstdint>
#include <gtest/gtest.h>
#include <aqsense/codec/encoder.hpp>

using namespace aqsense;

namespace {

constexpr FieldShape one_byte{1, ByteOrder::big};
constexpr FieldShape two_bytes{2, ByteOrder::big};

int64_t decode_int(const Encoder& encoder, const Bytes& bytes, FieldShape shape) {
    return std::get<int64_t>(decode(encoder, bytes, shape));
}

double decode_real(const Encoder& encoder, const Bytes& bytes, FieldShape shape) {
    return std::get<double>(decode(encoder, bytes, shape));
}

} // namespace

// Unsigned integers

TEST(EncoderTest, UnsignedBoundaries) {
    const Encoder& e = *encoders::unsigned_int();
    for (int64_t v : {int64_t{0}, int64_t{0x8000}, int64_t{0xFFFF}}) {
        EXPECT_EQ(decode_int(e, encode(e, FieldValue{v}, two_bytes), two_bytes), v);
    }
    EXPECT_EQ(encode(e, FieldValue{int64_t{0x1234}}, two_bytes), (Bytes{0x12, 0x34}));
}

TEST(EncoderTest, UnsignedOverflowRejected) {
    const Encoder& e = *encoders::unsigned_int();
    EXPECT_THROW(encode(e, FieldValue{int64_t{256}}, one_byte), CodecError);
    EXPECT_THROW(encode(e, FieldValue{int64_t{-1}}, one_byte), CodecError);
}

TEST(EncoderTest, UnsignedTypeMismatchRejected) {
    const Encoder& e = *encoders::unsigned_int();
    EXPECT_THROW(encode(e, FieldValue{1.5}, one_byte), CodecError);
    EXPECT_THROW(encode(e, FieldValue{std::string{"1"}}, one_byte), CodecError);
}

TEST(EncoderTest, UnsignedLittleEndian) {
    const Encoder& e = *encoders::unsigned_int();
    const FieldShape shape{2, ByteOrder::little};
    EXPECT_EQ(encode(e, FieldValue{int64_t{0x1234}}, shape), (Bytes{0x34, 0x12}));
    EXPECT_EQ(decode_int(e, Bytes{0x34, 0x12}, shape), 0x1234);
}

TEST(EncoderTest, UnsignedWideField) {
    const Encoder& e = *encoders::unsigned_int();
    const FieldShape shape{5, ByteOrder::big};
    EXPECT_EQ(decode_int(e, Bytes{0x03, 0x03, 0x02, 0x02, 0x01}, shape), 0x0303020201);
}

// Signed integers

TEST(EncoderTest, SignedBoundaries) {
    const Encoder& e = *encoders::signed_int();
    for (int64_t v : {int64_t{-32768}, int64_t{0}, int64_t{32767}}) {
        EXPECT_EQ(decode_int(e, encode(e, FieldValue{v}, two_bytes), two_bytes), v);
    }
}

TEST(EncoderTest, SignedTwosComplement) {
    const Encoder& e = *encoders::signed_int();
    EXPECT_EQ(encode(e, FieldValue{int64_t{-1000}}, two_bytes), (Bytes{0xFC, 0x18}));
    EXPECT_EQ(decode_int(e, Bytes{0xFC, 0x18}, two_bytes), -1000);
    EXPECT_EQ(decode_int(e, Bytes{0x18, 0xFC}, FieldShape{2, ByteOrder::little}), -1000);
}

TEST(EncoderTest, SignedOverflowRejected) {
    const Encoder& e = *encoders::signed_int();
    EXPECT_THROW(encode(e, FieldValue{int64_t{128}}, one_byte), CodecError);
    EXPECT_THROW(encode(e, FieldValue{int64_t{-129}}, one_byte), CodecError);
}

// Flags

TEST(EncoderTest, FlagRoundTrip) {
    const Encoder& e = *encoders::flag();
    EXPECT_EQ(encode(e, FieldValue{true}, one_byte), (Bytes{0x01}));
    EXPECT_EQ(encode(e, FieldValue{false}, one_byte), (Bytes{0x00}));
    EXPECT_EQ(std::get<bool>(decode(e, Bytes{0x01}, one_byte)), true);
    EXPECT_EQ(std::get<bool>(decode(e, Bytes{0x00}, one_byte)), false);
}

TEST(EncoderTest, FlagRejectsOtherValues) {
    const Encoder& e = *encoders::flag();
    EXPECT_THROW(encode(e, FieldValue{int64_t{2}}, one_byte), CodecError);
    EXPECT_THROW(decode(e, Bytes{0x02}, one_byte), CodecError);
}

// Raw bytes

TEST(EncoderTest, BytesPassThrough) {
    const Encoder& e = *encoders::bytes();
    const Bytes raw{0xFF, 0x01, 0x02, 0x03};
    const FieldShape shape{4, ByteOrder::big};
    EXPECT_EQ(encode(e, FieldValue{raw}, shape), raw);
    EXPECT_EQ(std::get<Bytes>(decode(e, raw, shape)), raw);
    EXPECT_THROW(encode(e, FieldValue{Bytes{0x01}}, shape), CodecError);
    EXPECT_THROW(encode(e, FieldValue{int64_t{1}}, shape), CodecError);
}

// Lookup tables

TEST(LookupTableTest, PowerModes) {
    const Encoder e =
        LookupTable::from_strings({{"sleep", 0b00}, {"forced", 0b10}, {"normal", 0b11}});
    EXPECT_EQ(encode(e, FieldValue{std::string{"forced"}}, one_byte), (Bytes{0b10}));
    EXPECT_EQ(std::get<std::string>(decode(e, Bytes{0b11}, one_byte)), "normal");
    EXPECT_THROW(decode(e, Bytes{0b01}, one_byte), CodecError);
}

TEST(LookupTableTest, UnknownKeyRejected) {
    const Encoder e = LookupTable::from_integers({{0, 0}, {2, 1}});
    EXPECT_THROW(encode(e, FieldValue{int64_t{1}}, one_byte), CodecError);
}

TEST(LookupTableTest, RealKeysMatchIntegralInput) {
    const Encoder e = LookupTable::from_reals({{0.5, 0}, {62.5, 1}, {125.0, 2}});
    EXPECT_EQ(encode(e, FieldValue{int64_t{125}}, one_byte), (Bytes{0x02}));
    EXPECT_EQ(encode(e, FieldValue{62.5}, one_byte), (Bytes{0x01}));
    EXPECT_DOUBLE_EQ(decode_real(e, Bytes{0x00}, one_byte), 0.5);
}

TEST(LookupTableTest, EveryEntryRoundTrips) {
    const LookupTable table =
        LookupTable::from_integers({{0, 0}, {1, 1}, {2, 2}, {4, 3}, {8, 4}, {16, 5}});
    const Encoder e = table;
    for (const auto& entry : table.entries()) {
        EXPECT_TRUE(values_equal(decode(e, encode(e, entry.key, one_byte), one_byte), entry.key));
    }
    EXPECT_EQ(table.max_code(), 5u);
}

TEST(LookupTableTest, CodePackedToFieldWidth) {
    const Encoder e = LookupTable::from_integers({{14, 0}, {11, 1}});
    EXPECT_EQ(encode(e, FieldValue{int64_t{11}}, two_bytes), (Bytes{0x00, 0x01}));
}

TEST(LookupTableTest, MalformedTablesRejected) {
    EXPECT_THROW((void)LookupTable(std::vector<LookupTable::Entry>{}), ConfigError);
    EXPECT_THROW((void)LookupTable::from_integers({{0, 0}, {0, 1}}), ConfigError);
    EXPECT_THROW((void)LookupTable::from_strings({{"a", 1}, {"b", 1}}), ConfigError);

    // 250 and 250.0 are the same key
    std::vector<LookupTable::Entry> mixed;
    mixed.push_back({FieldValue{int64_t{250}}, 0});
    mixed.push_back({FieldValue{250.0}, 1});
    EXPECT_THROW((void)LookupTable(std::move(mixed)), ConfigError);
}

// Linear fixed point

TEST(LinearEncoderTest, TemperatureWithFloor) {
    const Encoder e = LinearEncoder{
        .quantity = "temperature", .scale = 512.0, .offset = 25.0, .raw_floor = 0};
    EXPECT_EQ(load_uint(encode(e, FieldValue{-25.0}, two_bytes), ByteOrder::big), 0u);
    EXPECT_EQ(load_uint(encode(e, FieldValue{0.0}, two_bytes), ByteOrder::big), 12800u);
    EXPECT_DOUBLE_EQ(decode_real(e, Bytes{0x00, 0x00}, two_bytes), -25.0);
    EXPECT_NEAR(decode_real(e, store_uint(12800, 2, ByteOrder::big), two_bytes), 0.0,
                1.0 / 512);
}

TEST(LinearEncoderTest, FloorClampsColdValues) {
    const Encoder e = LinearEncoder{
        .quantity = "temperature", .scale = 512.0, .offset = 25.0, .raw_floor = 0};
    EXPECT_EQ(encode(e, FieldValue{-40.0}, two_bytes), (Bytes{0x00, 0x00}));
}

TEST(LinearEncoderTest, NegativeWithoutFloorRejected) {
    const Encoder e = LinearEncoder{.quantity = "humidity", .scale = 512.0};
    EXPECT_THROW(encode(e, FieldValue{-1.0}, two_bytes), CodecError);
}

TEST(LinearEncoderTest, OverflowRejected) {
    const Encoder e = LinearEncoder{.quantity = "humidity", .scale = 512.0};
    // 128 %RH * 512 = 65536, one past the field
    EXPECT_THROW(encode(e, FieldValue{128.0}, two_bytes), CodecError);
    EXPECT_THROW(encode(e, FieldValue{std::string{"wet"}}, two_bytes), CodecError);
}

TEST(LinearEncoderTest, HumidityBoundariesWithinOneCount) {
    const LinearEncoder linear{.quantity = "humidity", .scale = 512.0};
    const Encoder e = linear;
    for (double v : {0.0, 50.3, 127.99}) {
        EXPECT_NEAR(decode_real(e, encode(e, FieldValue{v}, two_bytes), two_bytes), v,
                    linear.resolution());
    }
}

TEST(LinearEncoderTest, TemperatureBoundariesWithinOneCount) {
    const LinearEncoder linear{
        .quantity = "temperature", .scale = 512.0, .offset = 25.0, .raw_floor = 0};
    const Encoder e = linear;
    for (double v : {-25.0, 21.7, 102.99}) {
        EXPECT_NEAR(decode_real(e, encode(e, FieldValue{v}, two_bytes), two_bytes), v,
                    linear.resolution());
    }
}

TEST(LinearEncoderTest, ReadOnlyEncodeUnsupported) {
    const Encoder e = LinearEncoder{
        .quantity = "voltage", .scale = 1023.0 / 1.65, .read_only = true};
    EXPECT_THROW(encode(e, FieldValue{1.0}, two_bytes), UnsupportedOperation);
    EXPECT_NEAR(decode_real(e, store_uint(1023, 2, ByteOrder::big), two_bytes), 1.65, 1e-9);
    EXPECT_NEAR(decode_real(e, Bytes{0x00, 0x00}, two_bytes), 0.0, 1e-12);
}

TEST(LinearEncoderTest, SixteenBitTemperatureTransfer) {
    // raw * 165 / 2^16 - 40
    const Encoder e = LinearEncoder{
        .quantity = "temperature", .scale = 65536.0 / 165.0, .offset = 40.0, .read_only = true};
    EXPECT_NEAR(decode_real(e, Bytes{0x00, 0x00}, two_bytes), -40.0, 1e-9);
    EXPECT_NEAR(decode_real(e, Bytes{0x66, 0x00}, two_bytes), 0x6600 * 165.0 / 65536 - 40,
                1e-9);
    EXPECT_NEAR(decode_real(e, Bytes{0xFF, 0xFF}, two_bytes), 125.0, 2 * 165.0 / 65536);
}

// Dispatch

TEST(EncoderTest, Names) {
    EXPECT_STREQ(encoder_name(*encoders::unsigned_int()), "uint");
    EXPECT_STREQ(encoder_name(*encoders::bytes()), "bytes");
    EXPECT_FALSE(is_integer_encoder(*encoders::bytes()));
    EXPECT_TRUE(is_integer_encoder(*encoders::flag()));
}

TEST(EncoderTest, SharedInstances) {
    EXPECT_EQ(encoders::unsigned_int().get(), encoders::unsigned_int().get());
}
