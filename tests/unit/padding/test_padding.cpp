/**
 * @file test_padding.cpp
 * @brief Block padding unit tests
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>

#include "kccomp/kccomp.h"

using kccomp::ByteVec;
using kccomp::PaddingScheme;
namespace padding = kccomp::padding;

static ByteVec hex_to_bytes(const std::string& hex) {
    return kccomp::hexDecode(hex);
}

static std::string bytes_to_hex(const ByteVec& data) {
    return kccomp::hexEncode(data);
}

class PaddingTest : public ::testing::Test {
protected:
    void SetUp() override {
        kccomp_init();
    }

    // 16-byte block with `content` leading bytes of 0x41
    static ByteVec block_with_content(size_t content) {
        ByteVec block(16, 0xEE);
        for (size_t i = 0; i < content; i++) block[i] = 0x41;
        return block;
    }
};

// ============================================================================
// Pad
// ============================================================================

TEST_F(PaddingTest, ZeroBytePad) {
    ByteVec padded = padding::pad(block_with_content(11), 11, PaddingScheme::ZeroByte);
    EXPECT_EQ(bytes_to_hex(padded), "41414141414141414141410000000000");
    EXPECT_EQ(padding::pad_count(padded, PaddingScheme::ZeroByte), 5u);
}

TEST_F(PaddingTest, PKCS7Pad) {
    ByteVec padded = padding::pad(block_with_content(11), 11, PaddingScheme::PKCS7);
    EXPECT_EQ(bytes_to_hex(padded), "41414141414141414141410505050505");
    EXPECT_EQ(padding::pad_count(padded, PaddingScheme::PKCS7), 5u);

    ByteVec full = padding::pad(block_with_content(0), 0, PaddingScheme::PKCS7);
    EXPECT_EQ(full, ByteVec(16, 0x10));
    EXPECT_EQ(padding::pad_count(full, PaddingScheme::PKCS7), 16u);
}

TEST_F(PaddingTest, TBCPad) {
    // Last content bit 1 (0x41) -> fill 0x00
    ByteVec padded = padding::pad(block_with_content(11), 11, PaddingScheme::TBC);
    EXPECT_EQ(bytes_to_hex(padded), "41414141414141414141410000000000");
    EXPECT_EQ(padding::pad_count(padded, PaddingScheme::TBC), 5u);

    // Last content bit 0 (0x42) -> fill 0xFF
    ByteVec block(16, 0x00);
    block[0] = 0x42;
    ByteVec padded2 = padding::pad(block, 1, PaddingScheme::TBC);
    EXPECT_EQ(bytes_to_hex(padded2), "42ffffffffffffffffffffffffffffff");
    EXPECT_EQ(padding::pad_count(padded2, PaddingScheme::TBC), 15u);
}

TEST_F(PaddingTest, ISO7816Pad) {
    ByteVec padded = padding::pad(block_with_content(13), 13, PaddingScheme::ISO7816);
    EXPECT_EQ(bytes_to_hex(padded), "41414141414141414141414141800000");
    EXPECT_EQ(padding::pad_count(padded, PaddingScheme::ISO7816), 3u);
}

TEST_F(PaddingTest, OffsetEqualToSizeIsNoOp) {
    ByteVec block = block_with_content(16);
    for (PaddingScheme scheme : {PaddingScheme::None, PaddingScheme::ZeroByte,
                                 PaddingScheme::PKCS7, PaddingScheme::TBC,
                                 PaddingScheme::ISO7816}) {
        EXPECT_EQ(padding::pad(block, 16, scheme), block);
        EXPECT_EQ(padding::unpad(block, 16, scheme), block);
    }
}

// ============================================================================
// Unpad
// ============================================================================

TEST_F(PaddingTest, PadThenUnpadRecoversContent) {
    for (PaddingScheme scheme : {PaddingScheme::ZeroByte, PaddingScheme::PKCS7,
                                 PaddingScheme::TBC, PaddingScheme::ISO7816}) {
        for (size_t offset = 0; offset <= 16; offset++) {
            ByteVec padded = padding::pad(block_with_content(offset), offset, scheme);
            ByteVec content = padding::unpad(padded, offset, scheme);
            EXPECT_EQ(content, ByteVec(offset, 0x41))
                << kccomp::padding_name(scheme) << " offset " << offset;
        }
    }
}

TEST_F(PaddingTest, TBCEmptyContentAcceptsBothFills) {
    EXPECT_TRUE(padding::unpad(ByteVec(16, 0x00), 0, PaddingScheme::TBC).empty());
    EXPECT_TRUE(padding::unpad(ByteVec(16, 0xFF), 0, PaddingScheme::TBC).empty());
    EXPECT_THROW(padding::unpad(ByteVec(16, 0x80), 0, PaddingScheme::TBC), kccomp::InvalidPadding);
}

TEST_F(PaddingTest, MalformedPaddingThrows) {
    ByteVec bad_pkcs7 = hex_to_bytes("41414141414141414141410505050405");
    EXPECT_THROW(padding::unpad(bad_pkcs7, 11, PaddingScheme::PKCS7), kccomp::InvalidPadding);
    EXPECT_THROW(padding::pad_count(bad_pkcs7, PaddingScheme::PKCS7), kccomp::InvalidPadding);

    EXPECT_THROW(padding::pad_count(hex_to_bytes("41414141414141414141414141414100"),
                                    PaddingScheme::PKCS7),
                 kccomp::InvalidPadding);
    EXPECT_THROW(padding::pad_count(hex_to_bytes("41414141414141414141414141414111"),
                                    PaddingScheme::PKCS7),
                 kccomp::InvalidPadding);

    ByteVec bad_zero = hex_to_bytes("41414141414141414141410000000100");
    EXPECT_THROW(padding::unpad(bad_zero, 11, PaddingScheme::ZeroByte), kccomp::InvalidPadding);

    // 0x41 ends in bit 1, so the TBC fill must be 0x00
    ByteVec bad_tbc = hex_to_bytes("414141414141414141414141ffffffff");
    EXPECT_THROW(padding::unpad(bad_tbc, 12, PaddingScheme::TBC), kccomp::InvalidPadding);

    EXPECT_THROW(padding::pad_count(ByteVec(16, 0x00), PaddingScheme::ISO7816),
                 kccomp::InvalidPadding);
}

TEST_F(PaddingTest, PKCS7CountIsTheLastByte) {
    for (size_t n = 1; n <= 16; n++) {
        ByteVec padded = padding::pad(block_with_content(16 - n), 16 - n, PaddingScheme::PKCS7);
        EXPECT_EQ(padded.back(), n);
        EXPECT_EQ(padding::pad_count(padded, PaddingScheme::PKCS7), n);
    }
}

// ============================================================================
// Argument checks and storage
// ============================================================================

TEST_F(PaddingTest, OffsetBeyondBlockThrows) {
    EXPECT_THROW(padding::pad(ByteVec(16, 0), 17, PaddingScheme::PKCS7), std::out_of_range);
    EXPECT_THROW(padding::unpad(ByteVec(16, 0), 17, PaddingScheme::PKCS7), std::out_of_range);
}

TEST_F(PaddingTest, NoneRequiresFullBlock) {
    EXPECT_THROW(padding::pad(ByteVec(16, 0), 15, PaddingScheme::None), std::invalid_argument);
    EXPECT_THROW(padding::unpad(ByteVec(16, 0), 15, PaddingScheme::None), kccomp::InvalidPadding);
    EXPECT_EQ(padding::pad_count(ByteVec(16, 0), PaddingScheme::None), 0u);
}

TEST_F(PaddingTest, CopyingVariantLeavesInputUntouched) {
    const ByteVec block = block_with_content(10);
    ByteVec padded = padding::pad(block, 10, PaddingScheme::PKCS7);
    EXPECT_EQ(block, block_with_content(10));
    EXPECT_NE(padded, block);

    ByteVec content = padding::unpad(padded, 10, PaddingScheme::PKCS7);
    EXPECT_EQ(padded.size(), 16u);
    EXPECT_EQ(content.size(), 10u);
}

TEST_F(PaddingTest, InPlaceVariantReusesStorage) {
    ByteVec block = block_with_content(10);
    const uint8_t* storage = block.data();

    ByteVec padded = padding::pad_in_place(std::move(block), 10, PaddingScheme::PKCS7);
    EXPECT_EQ(padded.data(), storage);
    EXPECT_EQ(bytes_to_hex(padded), "41414141414141414141060606060606");

    ByteVec content = padding::unpad_in_place(std::move(padded), 10, PaddingScheme::PKCS7);
    EXPECT_EQ(content.data(), storage);
    EXPECT_EQ(content, ByteVec(10, 0x41));
}

TEST_F(PaddingTest, ParseNames) {
    EXPECT_EQ(kccomp::parse_padding("PKCS5"), PaddingScheme::PKCS7);
    EXPECT_EQ(kccomp::parse_padding("ZeroByte"), PaddingScheme::ZeroByte);
    EXPECT_EQ(kccomp::parse_padding("tbc"), PaddingScheme::TBC);
    EXPECT_EQ(kccomp::parse_padding("ISO7816-4"), PaddingScheme::ISO7816);
    EXPECT_THROW(kccomp::parse_padding("ansix923"), kccomp::UnsupportedAlgorithm);
}
