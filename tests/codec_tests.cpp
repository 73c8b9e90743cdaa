/**
 * @file codec_tests.cpp
 * @brief Byte level conversions for every primitive encoding
 */

#include "test_helpers.hpp"
#include "../src/codec.hpp"
#include <gtest/gtest.h>

using namespace bitwise::codec;

// ============================================================================
// Integers
// ============================================================================

TEST(CodecTests, DecodeBigEndianUnsigned) {
    const std::vector<uint8_t> bytes = {0x12, 0x34, 0x56, 0x78};
    EXPECT_EQ(decodeInteger(std::span(bytes).first(2), false, false), 0x1234);
    EXPECT_EQ(decodeInteger(std::span(bytes).first(3), false, false), 0x123456);
    EXPECT_EQ(decodeInteger(bytes, false, false), 0x12345678);
}

TEST(CodecTests, DecodeLittleEndianUnsigned) {
    const std::vector<uint8_t> bytes = {0x12, 0x34, 0x56, 0x78};
    EXPECT_EQ(decodeInteger(std::span(bytes).first(2), false, true), 0x3412);
    EXPECT_EQ(decodeInteger(std::span(bytes).first(3), false, true), 0x563412);
    EXPECT_EQ(decodeInteger(bytes, false, true), 0x78563412);
}

TEST(CodecTests, DecodeSignedTwosComplement) {
    const std::vector<uint8_t> minusOne = {0xFF, 0xFF, 0xFF, 0xFF};
    EXPECT_EQ(decodeInteger(std::span(minusOne).first(1), true, false), -1);
    EXPECT_EQ(decodeInteger(std::span(minusOne).first(3), true, false), -1);
    EXPECT_EQ(decodeInteger(minusOne, true, true), -1);

    const std::vector<uint8_t> minInt16 = {0x00, 0x80};
    EXPECT_EQ(decodeInteger(minInt16, true, true), -32768);
    EXPECT_EQ(decodeInteger(minInt16, true, false), 0x0080);
}

TEST(CodecTests, DecodeUnsigned32DoesNotGoNegative) {
    const std::vector<uint8_t> bytes = {0xFF, 0xFF, 0xFF, 0xFF};
    EXPECT_EQ(decodeInteger(bytes, false, false), 0xFFFFFFFFLL);
}

TEST(CodecTests, EncodeIntegerByteOrder) {
    expectBytes(encodeInteger(0x1234, 16, false, false), {0x12, 0x34});
    expectBytes(encodeInteger(0x1234, 16, false, true), {0x34, 0x12});
    expectBytes(encodeInteger(0x123456, 24, false, true), {0x56, 0x34, 0x12});
    expectBytes(encodeInteger(-2, 16, true, false), {0xFF, 0xFE});
    expectBytes(encodeInteger(-8388608, 24, true, false), {0x80, 0x00, 0x00});
}

TEST(CodecTests, EncodeIntegerRangeChecked) {
    EXPECT_THROW(encodeInteger(256, 8, false, false), EncodingError);
    EXPECT_THROW(encodeInteger(-1, 8, false, false), EncodingError);
    EXPECT_THROW(encodeInteger(128, 8, true, false), EncodingError);
    EXPECT_THROW(encodeInteger(-129, 8, true, false), EncodingError);
    EXPECT_THROW(encodeInteger(0x1000000, 24, false, true), EncodingError);
    EXPECT_THROW(encodeInteger(0x100000000LL, 32, false, false), EncodingError);
    EXPECT_NO_THROW(encodeInteger(0xFFFFFFFFLL, 32, false, false));
    EXPECT_NO_THROW(encodeInteger(-2147483648LL, 32, true, true));
}

// ============================================================================
// BCD
// ============================================================================

TEST(CodecTests, DecodeBcdBigEndian) {
    const std::vector<uint8_t> bytes = {0x12, 0x34, 0x56, 0x78};
    EXPECT_EQ(decodeBcd(bytes, false), 12345678);
    EXPECT_EQ(decodeBcd(std::span(bytes).first(1), false), 12);
}

TEST(CodecTests, DecodeBcdLittleEndian) {
    const std::vector<uint8_t> bytes = {0x12, 0x34};
    EXPECT_EQ(decodeBcd(bytes, true), 3412);
}

TEST(CodecTests, DecodeBcdIsPositionalForBadNibbles) {
    // 0xFF reads as 15 tens plus 15 ones rather than failing
    const std::vector<uint8_t> bytes = {0xFF};
    EXPECT_EQ(decodeBcd(bytes, false), 165);
}

TEST(CodecTests, EncodeBcd) {
    expectBytes(encodeBcd(99, 1, false), {0x99});
    expectBytes(encodeBcd(1234, 2, false), {0x12, 0x34});
    expectBytes(encodeBcd(1234, 2, true), {0x34, 0x12});
    expectBytes(encodeBcd(7, 3, false), {0x00, 0x00, 0x07});
}

TEST(CodecTests, EncodeBcdRejectsOverflowAndNegative) {
    EXPECT_THROW(encodeBcd(100, 1, false), EncodingError);
    EXPECT_THROW(encodeBcd(9999, 1, false), EncodingError);
    EXPECT_THROW(encodeBcd(-1, 2, false), EncodingError);
    EXPECT_NO_THROW(encodeBcd(9999, 2, true));
}

TEST(CodecTests, BcdWiderThanEighteenDigitsRejected) {
    const std::vector<uint8_t> nine(9, 0x99);
    const std::vector<uint8_t> ten(10, 0x99);
    EXPECT_EQ(decodeBcd(nine, false), 999999999999999999);
    EXPECT_NO_THROW(encodeBcd(999999999999999999, 9, false));

    EXPECT_THROW(decodeBcd(ten, false), EncodingError);
    EXPECT_THROW(decodeBcd(ten, true), EncodingError);
    EXPECT_THROW(encodeBcd(1234, 10, false), EncodingError);
    EXPECT_THROW(checkBcd(0, 128), EncodingError);
}

// ============================================================================
// Characters
// ============================================================================

TEST(CodecTests, CharsRoundTripBytes) {
    const std::vector<uint8_t> bytes = {'A', 'B', 0x00, 0xFF};
    const std::string text = decodeChars(bytes);
    ASSERT_EQ(text.size(), 4u);
    EXPECT_EQ(text[2], '\0');
    expectBytes(encodeChars(text, 4), bytes);
}

TEST(CodecTests, EncodeCharsLengthRules) {
    EXPECT_THROW(encodeChars("ABCDEFG", 6), EncodingError);
    EXPECT_THROW(encodeChars("ABC", 6), EncodingError);
    expectBytes(encodeChars("ABC", 6, ' '), {'A', 'B', 'C', ' ', ' ', ' '});
    EXPECT_THROW(encodeChars("ABCDEFG", 6, ' '), EncodingError);
}

// ============================================================================
// Bitfields and single bits
// ============================================================================

TEST(CodecTests, ExtractBitsFromMostSignificant) {
    EXPECT_EQ(extractBits(0xAB, 8, 0, 4), 0xAu);
    EXPECT_EQ(extractBits(0xAB, 8, 4, 4), 0xBu);
    EXPECT_EQ(extractBits(0x8001, 16, 0, 1), 1u);
    EXPECT_EQ(extractBits(0x8001, 16, 15, 1), 1u);
    EXPECT_EQ(extractBits(0x8001, 16, 1, 14), 0u);
}

TEST(CodecTests, InsertBitsTouchesOnlyItsBits) {
    EXPECT_EQ(insertBits(0xFF, 8, 0, 4, 0x0), 0x0Fu);
    EXPECT_EQ(insertBits(0x00, 8, 4, 4, 0x5), 0x05u);
    EXPECT_EQ(insertBits(0x1234, 16, 4, 8, 0xAB), 0x1AB4u);
}

TEST(CodecTests, InsertBitsRejectsWideValues) {
    EXPECT_THROW(insertBits(0, 8, 0, 4, 16), EncodingError);
    EXPECT_THROW(insertBits(0, 8, 0, 4, -1), EncodingError);
    EXPECT_THROW(checkBits(2, 1), EncodingError);
}

TEST(CodecTests, SingleBitOrder) {
    EXPECT_TRUE(decodeBit(0x80, 0, false));
    EXPECT_FALSE(decodeBit(0x80, 0, true));
    EXPECT_TRUE(decodeBit(0x01, 0, true));
    EXPECT_TRUE(decodeBit(0x01, 7, false));

    EXPECT_EQ(encodeBit(0x00, 0, false, 1), 0x80);
    EXPECT_EQ(encodeBit(0x00, 0, true, 1), 0x01);
    EXPECT_EQ(encodeBit(0xFF, 3, false, 0), 0xEF);
    EXPECT_THROW(encodeBit(0x00, 0, false, 2), EncodingError);
}
