/**
 * @file test_raw_cipher.cpp
 * @brief Raw block and stream transform unit tests
 *
 * Vectors: FIPS 197 appendix C.1, SP 800-38A F.1.1, RFC 8439 section 2.4.2.
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "kccomp/kccomp.h"

using kccomp::ByteVec;
using kccomp::RawCipher;
using kccomp::CipherAlgorithm;
using kccomp::CipherDirection;

static ByteVec hex_to_bytes(const std::string& hex) {
    return kccomp::hexDecode(hex);
}

static std::string bytes_to_hex(const ByteVec& data) {
    return kccomp::hexEncode(data);
}

static const char* kSunscreen =
    "Ladies and Gentlemen of the class of '99: If I could offer you only one "
    "tip for the future, sunscreen would be it.";

class RawCipherTest : public ::testing::Test {
protected:
    void SetUp() override {
        kccomp_init();
    }
};

TEST_F(RawCipherTest, AES128_FIPS197) {
    RawCipher aes(CipherAlgorithm::AES128);
    aes.init(hex_to_bytes("000102030405060708090a0b0c0d0e0f"), ByteVec(), CipherDirection::Encrypt);

    ByteVec ct = aes.processBlock(hex_to_bytes("00112233445566778899aabbccddeeff"));
    EXPECT_EQ(bytes_to_hex(ct), "69c4e0d86a7b0430d8cdb78070b4c55a");

    RawCipher inv(CipherAlgorithm::AES128);
    inv.init(hex_to_bytes("000102030405060708090a0b0c0d0e0f"), ByteVec(), CipherDirection::Decrypt);
    EXPECT_EQ(bytes_to_hex(inv.processBlock(ct)), "00112233445566778899aabbccddeeff");
}

TEST_F(RawCipherTest, AES128_SP800_38A_ECB) {
    RawCipher aes(CipherAlgorithm::AES128);
    aes.init(hex_to_bytes("2b7e151628aed2a6abf7158809cf4f3c"), ByteVec(), CipherDirection::Encrypt);

    // In-place transform
    ByteVec block = hex_to_bytes("6bc1bee22e409f96e93d7e117393172a");
    aes.processBlock(block.data(), block.data());
    EXPECT_EQ(bytes_to_hex(block), "3ad77bb40d7a3660a89ecaf32466ef97");
}

TEST_F(RawCipherTest, ChaCha20_RFC8439) {
    RawCipher chacha(CipherAlgorithm::CHACHA20);
    // LE32 counter (1) || 96-bit nonce
    ByteVec iv = hex_to_bytes("01000000" "000000000000004a00000000");
    chacha.init(hex_to_bytes("000102030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f"),
                iv, CipherDirection::Encrypt);

    ByteVec ct = chacha.processBytes(kccomp::stringToBytes(kSunscreen));
    EXPECT_EQ(bytes_to_hex(ct),
              "6e2e359a2568f98041ba0728dd0d6981e97e7aec1d4360c20a27afccfd9fae0b"
              "f91b65c5524733ab8f593dabcd62b3571639d624e65152ab8f530c359f0861d8"
              "07ca0dbf500d6a6156a38e088a22b65e52bc514d16ccf806818ce91ab7793736"
              "5af90bbf74a35be6b40b8eedf2785e42874d");

    // reset() rewinds to the initial counter
    chacha.reset();
    ByteVec again = chacha.processBytes(kccomp::stringToBytes(kSunscreen));
    EXPECT_EQ(again, ct);
}

TEST_F(RawCipherTest, ChaCha20_SplitCallsMatchOneCall) {
    ByteVec key(32, 0x42);
    ByteVec iv(16, 0x00);
    ByteVec data(150, 0x00);

    RawCipher whole(CipherAlgorithm::CHACHA20);
    whole.init(key, iv, CipherDirection::Encrypt);
    ByteVec expected = whole.processBytes(data);

    RawCipher split(CipherAlgorithm::CHACHA20);
    split.init(key, iv, CipherDirection::Encrypt);
    ByteVec out(data.size());
    split.processBytes(data.data(), 7, out.data());
    split.processBytes(data.data() + 7, 64, out.data() + 7);
    split.processBytes(data.data() + 71, 79, out.data() + 71);
    EXPECT_EQ(out, expected);
}

TEST_F(RawCipherTest, BlockAndStreamCallsAreExclusive) {
    RawCipher aes(CipherAlgorithm::AES256);
    aes.init(ByteVec(32, 1), ByteVec(), CipherDirection::Encrypt);
    EXPECT_FALSE(aes.isStream());
    EXPECT_THROW(aes.processBytes(ByteVec(16, 0)), kccomp::UnsupportedAlgorithm);
    EXPECT_THROW(aes.processBlock(ByteVec(15, 0)), kccomp::InvalidInputLength);

    RawCipher chacha(CipherAlgorithm::CHACHA20);
    chacha.init(ByteVec(32, 1), ByteVec(16, 0), CipherDirection::Encrypt);
    EXPECT_TRUE(chacha.isStream());
    uint8_t buf[1] = {0};
    EXPECT_THROW(chacha.processBlock(buf, buf), kccomp::UnsupportedAlgorithm);
}

TEST_F(RawCipherTest, KeyAndIvValidation) {
    RawCipher aes(CipherAlgorithm::AES128);
    EXPECT_THROW(aes.init(ByteVec(15, 0), ByteVec(), CipherDirection::Encrypt),
                 kccomp::InvalidKeyMaterial);
    EXPECT_THROW(aes.init(ByteVec(16, 0), ByteVec(16, 0), CipherDirection::Encrypt),
                 kccomp::InvalidKeyMaterial);

    RawCipher chacha(CipherAlgorithm::CHACHA20);
    EXPECT_THROW(chacha.init(ByteVec(32, 0), ByteVec(12, 0), CipherDirection::Encrypt),
                 kccomp::InvalidKeyMaterial);
}

TEST_F(RawCipherTest, UseBeforeInitThrows) {
    RawCipher aes(CipherAlgorithm::AES192);
    EXPECT_FALSE(aes.isInitialized());
    EXPECT_THROW(aes.processBlock(ByteVec(16, 0)), kccomp::EngineNotInitialized);
    EXPECT_THROW(aes.reset(), kccomp::EngineNotInitialized);
    EXPECT_EQ(aes.keySize(), 24u);
    EXPECT_EQ(aes.blockSize(), 16u);
}
