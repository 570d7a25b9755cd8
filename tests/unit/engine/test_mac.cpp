/**
 * @file test_mac.cpp
 * @brief MAC engine unit tests
 *
 * Vectors:
 * - HMAC-SHA256: RFC 4231
 * - CMAC-AES128: RFC 4493
 * - GMAC-AES128: NIST SP 800-38D (GCM test case 1, no payload)
 * - Poly1305: RFC 8439 section 2.5.2
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "kccomp/kccomp.h"

using kccomp::ByteVec;
using kccomp::Mac;
using kccomp::MacSpec;
using kccomp::DigestAlgorithm;
using kccomp::CipherAlgorithm;

static ByteVec hex_to_bytes(const std::string& hex) {
    return kccomp::hexDecode(hex);
}

static std::string bytes_to_hex(const ByteVec& data) {
    return kccomp::hexEncode(data);
}

class MACTest : public ::testing::Test {
protected:
    void SetUp() override {
        kccomp_init();
    }
};

// ============================================================================
// HMAC
// ============================================================================

TEST_F(MACTest, HMAC_SHA256_RFC4231_TC1) {
    ByteVec key = hex_to_bytes("0b0b0b0b0b0b0b0b0b0b0b0b0b0b0b0b0b0b0b0b");
    ByteVec tag = kccomp::hmac(DigestAlgorithm::SHA256, key, kccomp::stringToBytes("Hi There"));
    EXPECT_EQ(bytes_to_hex(tag),
              "b0344c61d8db38535ca8afceaf0bf12b881dc200c9833da726e9376c2e32cff7");
}

TEST_F(MACTest, HMAC_SHA256_RFC4231_TC2) {
    ByteVec tag = kccomp::hmac(DigestAlgorithm::SHA256, kccomp::stringToBytes("Jefe"),
                               kccomp::stringToBytes("what do ya want for nothing?"));
    EXPECT_EQ(bytes_to_hex(tag),
              "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}

TEST_F(MACTest, HMAC_ResetReusesKey) {
    Mac mac(MacSpec::hmac(DigestAlgorithm::SHA256));
    mac.init(kccomp::stringToBytes("key"));
    mac.update(std::string("The quick brown fox jumps over the lazy dog"));
    ByteVec first = mac.final();

    mac.reset();
    mac.update(std::string("The quick brown fox "));
    mac.update(std::string("jumps over the lazy dog"));
    EXPECT_EQ(mac.final(), first);
    EXPECT_EQ(bytes_to_hex(first),
              "f7bc83f430538424b13298e6aa6fb143ef4d59a14946175997479dbc2d1a3cd8");
}

TEST_F(MACTest, HMAC_EmptyKeyIsValid) {
    Mac mac(MacSpec::hmac(DigestAlgorithm::SHA256));
    EXPECT_NO_THROW(mac.init(ByteVec()));
    mac.update(std::string("data"));
    EXPECT_EQ(mac.final().size(), 32u);
}

TEST_F(MACTest, UpdateWindow) {
    ByteVec data = kccomp::stringToBytes("xxThe quick brown fox jumps over the lazy dogyy");
    Mac mac(MacSpec::hmac(DigestAlgorithm::SHA256));
    mac.init(kccomp::stringToBytes("key"));
    mac.update(data, 2, data.size() - 4);
    EXPECT_EQ(bytes_to_hex(mac.final()),
              "f7bc83f430538424b13298e6aa6fb143ef4d59a14946175997479dbc2d1a3cd8");

    mac.reset();
    EXPECT_THROW(mac.update(data, 10, data.size()), std::out_of_range);
    EXPECT_THROW(mac.update(data, data.size() + 1, 0), std::out_of_range);
}

// ============================================================================
// CMAC / GMAC / Poly1305
// ============================================================================

TEST_F(MACTest, CMAC_AES128_RFC4493) {
    ByteVec key = hex_to_bytes("2b7e151628aed2a6abf7158809cf4f3c");

    EXPECT_EQ(bytes_to_hex(kccomp::mac(MacSpec::cmac(CipherAlgorithm::AES128), key, ByteVec())),
              "bb1d6929e95937287fa37d129b756746");
    EXPECT_EQ(bytes_to_hex(kccomp::mac(MacSpec::cmac(CipherAlgorithm::AES128), key,
                                       hex_to_bytes("6bc1bee22e409f96e93d7e117393172a"))),
              "070a16b46b4d4144f79bdd9dd04a287c");
}

TEST_F(MACTest, GMAC_AES128) {
    Mac zero(MacSpec::gmac(CipherAlgorithm::AES128));
    zero.init(ByteVec(16, 0x00), ByteVec(12, 0x00));
    EXPECT_EQ(bytes_to_hex(zero.final()), "58e2fccefa7e3061367f1d57a4e7455a");

    Mac gmac(MacSpec::gmac(CipherAlgorithm::AES128));
    gmac.init(hex_to_bytes("2b7e151628aed2a6abf7158809cf4f3c"),
              hex_to_bytes("cafebabefacedbaddecaf888"));
    gmac.update(std::string("Hello World."));
    EXPECT_EQ(bytes_to_hex(gmac.final()), "109f71ad36db09a12231f55fa93f80b2");
}

TEST_F(MACTest, Poly1305_RFC8439) {
    ByteVec key = hex_to_bytes("85d6be7857556d337f4452fe42d506a80103808afb0db2fd4abff6af4149f51b");
    ByteVec tag = kccomp::mac(MacSpec::poly1305(), key,
                              kccomp::stringToBytes("Cryptographic Forum Research Group"));
    EXPECT_EQ(bytes_to_hex(tag), "a8061dc1305136c6c22b8baf0c0127a9");
}

// ============================================================================
// Validation and lifecycle
// ============================================================================

TEST_F(MACTest, KeyAndIvValidation) {
    Mac cmac(MacSpec::cmac(CipherAlgorithm::AES256));
    EXPECT_THROW(cmac.init(ByteVec(16, 1)), kccomp::InvalidKeyMaterial);
    EXPECT_THROW(cmac.init(ByteVec(32, 1), ByteVec(12, 0)), kccomp::InvalidKeyMaterial);
    EXPECT_NO_THROW(cmac.init(ByteVec(32, 1)));

    Mac gmac(MacSpec::gmac(CipherAlgorithm::AES128));
    EXPECT_THROW(gmac.init(ByteVec(16, 1)), kccomp::InvalidKeyMaterial);

    Mac poly(MacSpec::poly1305());
    EXPECT_THROW(poly.init(ByteVec(16, 1)), kccomp::InvalidKeyMaterial);
}

TEST_F(MACTest, UseBeforeInitAndAfterFinal) {
    Mac mac(MacSpec::hmac(DigestAlgorithm::SHA256));
    EXPECT_FALSE(mac.isInitialized());
    EXPECT_THROW(mac.update(std::string("x")), kccomp::EngineNotInitialized);
    EXPECT_THROW(mac.final(), kccomp::EngineNotInitialized);
    EXPECT_THROW(mac.reset(), kccomp::EngineNotInitialized);

    mac.init(kccomp::stringToBytes("k"));
    EXPECT_TRUE(mac.isInitialized());
    mac.final();
    EXPECT_THROW(mac.update(std::string("x")), kccomp::EngineNotInitialized);
    EXPECT_NO_THROW(mac.reset());
}

TEST_F(MACTest, MacSizes) {
    EXPECT_EQ(Mac(MacSpec::hmac(DigestAlgorithm::SHA384)).macSize(), 48u);
    EXPECT_EQ(Mac(MacSpec::cmac(CipherAlgorithm::AES128)).macSize(), 16u);
    EXPECT_EQ(Mac(MacSpec::poly1305()).macSize(), 16u);
}
