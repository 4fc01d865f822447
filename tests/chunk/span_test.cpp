#include "bmt/chunk/span.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <initializer_list>

using bmt::Bytes;
using bmt::ErrorCode;
using bmt::chunk::get_span_value;
using bmt::chunk::kMaxSpanLength;
using bmt::chunk::make_span;

TEST(SpanTest, EncodesLittleEndianIntoEightBytes) {
    auto span = make_span(3);
    ASSERT_TRUE(span.is_ok());
    EXPECT_EQ(span.value(), (Bytes{3, 0, 0, 0, 0, 0, 0, 0}));

    auto larger = make_span(0x01020304);
    ASSERT_TRUE(larger.is_ok());
    EXPECT_EQ(larger.value(), (Bytes{4, 3, 2, 1, 0, 0, 0, 0}));
}

TEST(SpanTest, ZeroAndMaximumAreAccepted) {
    auto zero = make_span(0);
    ASSERT_TRUE(zero.is_ok());
    EXPECT_EQ(zero.value(), Bytes(8, 0));

    auto max = make_span(kMaxSpanLength);
    ASSERT_TRUE(max.is_ok());
    EXPECT_EQ(max.value(), (Bytes{0xff, 0xff, 0xff, 0xff, 0, 0, 0, 0}));
}

TEST(SpanTest, DecodesWhatItEncodes) {
    for (std::int64_t value : std::initializer_list<std::int64_t>{0, 1, 4096, 528384, 0x7fffffff, kMaxSpanLength}) {
        auto span = make_span(value);
        ASSERT_TRUE(span.is_ok());
        EXPECT_EQ(get_span_value(span.value()), static_cast<std::uint32_t>(value));
    }
}

TEST(SpanTest, RejectsOutOfRangeValues) {
    auto negative = make_span(-1);
    ASSERT_TRUE(negative.is_error());
    EXPECT_EQ(negative.error().code, ErrorCode::InvalidSpanValue);

    auto too_large = make_span(kMaxSpanLength + 1);
    ASSERT_TRUE(too_large.is_error());
    EXPECT_EQ(too_large.error().code, ErrorCode::InvalidSpanValue);
}

TEST(SpanTest, CustomLength) {
    auto four = make_span(7, 4);
    ASSERT_TRUE(four.is_ok());
    EXPECT_EQ(four.value(), (Bytes{7, 0, 0, 0}));

    auto too_short = make_span(7, 3);
    ASSERT_TRUE(too_short.is_error());
    EXPECT_EQ(too_short.error().code, ErrorCode::InvalidOptions);
}

TEST(SpanTest, DecodingIgnoresTrailingBytes) {
    EXPECT_EQ(get_span_value(Bytes{1, 0, 0, 0, 0xff, 0xff, 0xff, 0xff}), 1u);
    EXPECT_EQ(get_span_value(Bytes{2, 1}), 0x0102u);
    EXPECT_EQ(get_span_value(Bytes{}), 0u);
}
