/**
 * @file test_encoding.cpp
 * @brief Hex and Base64 codec unit tests
 *
 * Base64 vectors from RFC 4648 section 10.
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <gtest/gtest.h>
#include <cstring>
#include <string>

#include "kccomp/kccomp.h"

using kccomp::ByteVec;

class EncodingTest : public ::testing::Test {
protected:
    void SetUp() override {
        kccomp_init();
    }
};

// ============================================================================
// Hex
// ============================================================================

TEST_F(EncodingTest, HexEncodeIsLowercase) {
    ByteVec data = {0x00, 0x01, 0xAB, 0xCD, 0xEF, 0xFF};
    EXPECT_EQ(kccomp::hexEncode(data), "0001abcdefff");
}

TEST_F(EncodingTest, HexDecodeAcceptsEitherCaseAndPrefix) {
    ByteVec expected = {0xDE, 0xAD, 0xBE, 0xEF};
    EXPECT_EQ(kccomp::hexDecode("deadbeef"), expected);
    EXPECT_EQ(kccomp::hexDecode("DEADBEEF"), expected);
    EXPECT_EQ(kccomp::hexDecode("0xDeAdBeEf"), expected);
    EXPECT_TRUE(kccomp::hexDecode("").empty());
}

TEST_F(EncodingTest, HexDecodeRejectsMalformedInput) {
    EXPECT_THROW(kccomp::hexDecode("abc"), kccomp::encoding::EncodingError);
    EXPECT_THROW(kccomp::hexDecode("zz"), kccomp::encoding::EncodingError);
    EXPECT_THROW(kccomp::hexDecode("12 34"), std::invalid_argument);
    EXPECT_FALSE(kccomp::encoding::isValidHex("0x1"));
    EXPECT_TRUE(kccomp::encoding::isValidHex("00ff"));
}

TEST_F(EncodingTest, HexCApi) {
    const uint8_t data[] = {0x12, 0x34, 0x56};
    char hex[7];
    EXPECT_EQ(kccomp_hex_encode(data, sizeof(data), hex, sizeof(hex)), 6u);
    EXPECT_STREQ(hex, "123456");

    // Terminator does not fit
    char small[6];
    EXPECT_EQ(kccomp_hex_encode(data, sizeof(data), small, sizeof(small)), 0u);

    uint8_t out[3];
    EXPECT_EQ(kccomp_hex_decode("0x123456", 0, out, sizeof(out)), 3u);
    EXPECT_EQ(std::memcmp(out, data, sizeof(data)), 0);
    EXPECT_EQ(kccomp_hex_decode("12345", 0, out, sizeof(out)), 0u);
    EXPECT_EQ(kccomp_hex_decode("12345678", 0, out, sizeof(out)), 0u);
}

// ============================================================================
// Base64
// ============================================================================

TEST_F(EncodingTest, Base64RFC4648Vectors) {
    const char* plain[] = {"", "f", "fo", "foo", "foob", "fooba", "foobar"};
    const char* encoded[] = {"", "Zg==", "Zm8=", "Zm9v", "Zm9vYg==", "Zm9vYmE=", "Zm9vYmFy"};

    for (size_t i = 0; i < 7; i++) {
        ByteVec bytes = kccomp::stringToBytes(plain[i]);
        EXPECT_EQ(kccomp::base64Encode(bytes), encoded[i]) << "input " << plain[i];
        EXPECT_EQ(kccomp::base64Decode(encoded[i]), bytes) << "input " << encoded[i];
    }
}

TEST_F(EncodingTest, Base64RejectsMalformedInput) {
    EXPECT_THROW(kccomp::base64Decode("Zm9"), kccomp::encoding::EncodingError);
    EXPECT_THROW(kccomp::base64Decode("Zm!v"), kccomp::encoding::EncodingError);
}

TEST_F(EncodingTest, StringBytesConversion) {
    const std::string text = "Hello World.";
    ByteVec bytes = kccomp::stringToBytes(text);
    EXPECT_EQ(bytes.size(), text.size());
    EXPECT_EQ(bytes[0], 'H');
    EXPECT_EQ(kccomp::bytesToString(bytes), text);
}
