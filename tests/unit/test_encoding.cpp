/**
 * @file test_encoding.cpp
 * @brief Unit tests for the XOR checksum, base64 encoder and hex decoder
 */

#include <gtest/gtest.h>
#include <lanlight/utils/checksum.hpp>
#include <lanlight/utils/encoding.hpp>

#include <string>
#include <vector>

using namespace lanlight::utils;

// =============================================================================
// Xor8
// =============================================================================

TEST(Xor8Test, EmptyInputIsZero) {
    EXPECT_EQ(Xor8::compute(std::vector<uint8_t>{}), 0x00);
}

TEST(Xor8Test, XorsEveryByte) {
    EXPECT_EQ(Xor8::compute(std::vector<uint8_t>{0x33, 0x05, 0x04}), 0x32);
    EXPECT_EQ(Xor8::compute(std::vector<uint8_t>{0xFF, 0xFF}), 0x00);
}

// =============================================================================
// Base64
// =============================================================================

TEST(Base64Test, EncodesWithPadding) {
    EXPECT_EQ(base64Encode({'M', 'a', 'n'}), "TWFu");
    EXPECT_EQ(base64Encode({'M', 'a'}), "TWE=");
    EXPECT_EQ(base64Encode({'M'}), "TQ==");
    EXPECT_EQ(base64Encode({}), "");
}

TEST(Base64Test, EncodesFrameBytes) {
    EXPECT_EQ(base64Encode({0x33, 0x05, 0x04, 0x00, 0x00}), "MwUEAAA=");
}

// =============================================================================
// Hex
// =============================================================================

TEST(HexTest, DecodesEitherCase) {
    auto decoded = hexDecode("33aAfF00");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, (std::vector<uint8_t>{0x33, 0xAA, 0xFF, 0x00}));
}

TEST(HexTest, RejectsOddLengthAndNonHex) {
    EXPECT_FALSE(hexDecode("abc").has_value());
    EXPECT_FALSE(hexDecode("zz").has_value());
}
