#include <string>

#include <cstdint>
#include <gtest/gtest.h>
#include <aqsense/core/error.hpp>
#include <aqsense/core/value.hpp>

using namespace aqsense;

TEST(ValueTest, IntegerView) {
    EXPECT_EQ(as_integer(FieldValue{true}), 1);
    EXPECT_EQ(as_integer(FieldValue{int64_t{-7}}), -7);
    EXPECT_EQ(as_integer(FieldValue{250.0}), 250);
    EXPECT_FALSE(as_integer(FieldValue{62.5}).has_value());
    EXPECT_FALSE(as_integer(FieldValue{std::string{"forced"}}).has_value());
}

TEST(ValueTest, RealView) {
    EXPECT_DOUBLE_EQ(as_real(FieldValue{int64_t{4}}).value(), 4.0);
    EXPECT_DOUBLE_EQ(as_real(FieldValue{0.25}).value(), 0.25);
    EXPECT_FALSE(as_real(FieldValue{Bytes{0x01}}).has_value());
}

TEST(ValueTest, NumericEqualityAcrossTypes) {
    EXPECT_TRUE(values_equal(FieldValue{int64_t{250}}, FieldValue{250.0}));
    EXPECT_TRUE(values_equal(FieldValue{true}, FieldValue{int64_t{1}}));
    EXPECT_FALSE(values_equal(FieldValue{0.5}, FieldValue{int64_t{0}}));
}

TEST(ValueTest, NonNumericEquality) {
    EXPECT_TRUE(values_equal(FieldValue{std::string{"sleep"}}, FieldValue{std::string{"sleep"}}));
    EXPECT_FALSE(values_equal(FieldValue{std::string{"1"}}, FieldValue{int64_t{1}}));
    EXPECT_TRUE(values_equal(FieldValue{Bytes{0x01, 0x02}}, FieldValue{Bytes{0x01, 0x02}}));
}

TEST(ValueTest, TypeNames) {
    EXPECT_STREQ(value_type_string(FieldValue{false}), "bool");
    EXPECT_STREQ(value_type_string(FieldValue{int64_t{0}}), "integer");
    EXPECT_STREQ(value_type_string(FieldValue{0.0}), "real");
    EXPECT_STREQ(value_type_string(FieldValue{std::string{}}), "string");
    EXPECT_STREQ(value_type_string(FieldValue{Bytes{}}), "bytes");
}

TEST(ValueTest, Rendering) {
    EXPECT_EQ(to_string(FieldValue{true}), "true");
    EXPECT_EQ(to_string(FieldValue{int64_t{-1000}}), "-1000");
    EXPECT_EQ(to_string(FieldValue{62.5}), "62.5");
    EXPECT_EQ(to_string(FieldValue{std::string{"normal"}}), "\"normal\"");
    EXPECT_EQ(to_string(FieldValue{Bytes{0x00, 0x1A, 0xFF}}), "0x001aff");
}

TEST(ErrorTest, KindAndMessage) {
    try {
        throw CodecError("raw code 1 not in lookup table");
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::codec);
        EXPECT_EQ(e.message(), "raw code 1 not in lookup table");
        EXPECT_STREQ(e.what(), "codec: raw code 1 not in lookup table");
    }
}

TEST(ErrorTest, KindStrings) {
    EXPECT_STREQ(error_kind_string(ErrorKind::configuration), "configuration");
    EXPECT_STREQ(error_kind_string(ErrorKind::validation), "validation");
    EXPECT_STREQ(error_kind_string(ErrorKind::transport), "transport");
    EXPECT_STREQ(error_kind_string(ErrorKind::unsupported_operation), "unsupported_operation");
    EXPECT_STREQ(error_kind_string(ErrorKind::device), "device");
}

TEST(ErrorTest, HierarchyIsCatchableAsRuntimeError) {
    EXPECT_THROW(throw TransportError("nack"), std::runtime_error);
    EXPECT_THROW(throw UnsupportedOperation("read only"), Error);
}
