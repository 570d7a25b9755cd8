/**
 * @file test_digest.cpp
 * @brief Digest engine unit tests
 *
 * Vectors: FIPS 180-4 ("abc"), FIPS 202, RFC 7693.
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "kccomp/kccomp.h"

using kccomp::ByteVec;
using kccomp::Digest;
using kccomp::DigestAlgorithm;

static std::string bytes_to_hex(const ByteVec& data) {
    return kccomp::hexEncode(data);
}

class DigestTest : public ::testing::Test {
protected:
    void SetUp() override {
        kccomp_init();
    }
};

// ============================================================================
// Known answers
// ============================================================================

TEST_F(DigestTest, SHA256_Abc) {
    EXPECT_EQ(bytes_to_hex(kccomp::digest(DigestAlgorithm::SHA256, kccomp::stringToBytes("abc"))),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(DigestTest, SHA1_Abc) {
    EXPECT_EQ(bytes_to_hex(kccomp::digest(DigestAlgorithm::SHA1, kccomp::stringToBytes("abc"))),
              "a9993e364706816aba3e25717850c26c9cd0d89d");
}

TEST_F(DigestTest, SHA512_Abc) {
    EXPECT_EQ(bytes_to_hex(kccomp::digest(DigestAlgorithm::SHA512, kccomp::stringToBytes("abc"))),
              "ddaf35a193617abacc417349ae20413112e6fa4e89a97ea20a9eeee64b55d39a"
              "2192992a274fc1a836ba3c23a3feebbd454d4423643ce80e2a9ac94fa54ca49f");
}

TEST_F(DigestTest, SHA3_256_Empty) {
    EXPECT_EQ(bytes_to_hex(kccomp::digest(DigestAlgorithm::SHA3_256, ByteVec())),
              "a7ffc6f8bf1ed76651c14756a061d662f580ff4de43b49fa82d80a4b80f8434a");
}

TEST_F(DigestTest, BLAKE2b512_Abc) {
    EXPECT_EQ(bytes_to_hex(kccomp::digest(DigestAlgorithm::BLAKE2B_512, kccomp::stringToBytes("abc"))),
              "ba80a53f981c4d0d6a2797b69f12f6e94c212f14685ac4b74b12bb6fdbffa2d1"
              "7d87c5392aab792dc252d5de4533cc9518d38aa8dbf1925ab92386edd4009923");
}

TEST_F(DigestTest, SHAKE128_CallerChosenLength) {
    Digest shake(DigestAlgorithm::SHAKE128, 32);
    shake.update(std::string("abc"));
    EXPECT_EQ(shake.outputSize(), 32u);
    EXPECT_EQ(bytes_to_hex(shake.digest()),
              "5881092dd818bf5cf8a3ddb793fbcba74097d5c526a6d35f97b83351940f2cc8");

    // A shorter XOF output is a prefix of a longer one
    Digest shorter(DigestAlgorithm::SHAKE128, 8);
    shorter.update(std::string("abc"));
    EXPECT_EQ(bytes_to_hex(shorter.digest()), "5881092dd818bf5c");
}

// ============================================================================
// Lifecycle
// ============================================================================

TEST_F(DigestTest, IncrementalMatchesOneShot) {
    const std::string msg = "The quick brown fox jumps over the lazy dog";
    Digest md(DigestAlgorithm::SHA256);
    for (char c : msg) {
        md.update(reinterpret_cast<const uint8_t*>(&c), 1);
    }
    EXPECT_EQ(md.digest(), kccomp::digest(DigestAlgorithm::SHA256, kccomp::stringToBytes(msg)));
}

TEST_F(DigestTest, UpdateAfterFinalizeThrows) {
    Digest md(DigestAlgorithm::SHA256);
    md.update(std::string("abc"));
    md.digest();

    EXPECT_THROW(md.update(std::string("more")), kccomp::EngineNotInitialized);
    EXPECT_THROW(md.digest(), kccomp::EngineNotInitialized);
}

TEST_F(DigestTest, ResetRestartsComputation) {
    Digest md(DigestAlgorithm::SHA256);
    md.update(std::string("garbage"));
    md.reset();
    md.update(std::string("abc"));
    EXPECT_EQ(bytes_to_hex(md.digest()),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    md.reset();
    md.update(std::string("abc"));
    EXPECT_EQ(md.digest().size(), 32u);
}

TEST_F(DigestTest, FixedDigestRejectsOutputSize) {
    EXPECT_THROW(Digest(DigestAlgorithm::SHA256, 16), std::invalid_argument);
    EXPECT_NO_THROW(Digest(DigestAlgorithm::SHA256, 32));
}

TEST_F(DigestTest, MovedEngineKeepsState) {
    Digest a(DigestAlgorithm::SHA256);
    a.update(std::string("ab"));
    Digest b(std::move(a));
    b.update(std::string("c"));
    EXPECT_EQ(bytes_to_hex(b.digest()),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(DigestTest, AccessorsReportTableValues) {
    Digest md(DigestAlgorithm::SHA384);
    EXPECT_EQ(md.algorithm(), DigestAlgorithm::SHA384);
    EXPECT_EQ(md.outputSize(), 48u);
    EXPECT_EQ(md.blockSize(), 128u);
}
