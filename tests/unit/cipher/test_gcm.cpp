/**
 * @file test_gcm.cpp
 * @brief AES-GCM composition tests
 *
 * Vectors: McGrew & Viega GCM test cases 1-5 (AES-128).
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <gtest/gtest.h>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "kccomp/kccomp.h"
#include "cipher/modes.h"

using kccomp::ByteVec;
using kccomp::CipherDirection;
using kccomp::CipherEngine;
using kccomp::CipherSpec;

static ByteVec hex_to_bytes(const std::string& hex) {
    return kccomp::hexDecode(hex);
}

static std::string bytes_to_hex(const ByteVec& data) {
    return kccomp::hexEncode(data);
}

class GcmTest : public ::testing::Test {
protected:
    void SetUp() override {
        kccomp_init();
        spec_ = CipherSpec::parse("aes128-gcm");
        key_ = hex_to_bytes("feffe9928665731c6d6a8f9467308308");
        iv_ = hex_to_bytes("cafebabefacedbaddecaf888");
        pt_ = hex_to_bytes(
            "d9313225f88406e5a55909c5aff5269a86a7a9531534f7da2e4c303d8a318a72"
            "1c3c0c95956809532fcf0e2449a6b525b16aedf5aa0de657ba637b391aafd255");
        aad_ = hex_to_bytes("feedfacedeadbeeffeedfacedeadbeefabaddad2");
    }

    CipherSpec spec_;
    ByteVec key_;
    ByteVec iv_;
    ByteVec pt_;
    ByteVec aad_;
};

// ============================================================================
// Known answers
// ============================================================================

TEST_F(GcmTest, TestCase1_EmptyEverything) {
    ByteVec out = kccomp::cipher_encrypt(spec_, ByteVec(16, 0), ByteVec(12, 0), ByteVec());
    EXPECT_EQ(bytes_to_hex(out), "58e2fccefa7e3061367f1d57a4e7455a");
    EXPECT_TRUE(kccomp::cipher_decrypt(spec_, ByteVec(16, 0), ByteVec(12, 0), out).empty());
}

TEST_F(GcmTest, TestCase2_OneZeroBlock) {
    ByteVec out = kccomp::cipher_encrypt(spec_, ByteVec(16, 0), ByteVec(12, 0), ByteVec(16, 0));
    EXPECT_EQ(bytes_to_hex(out),
              "0388dace60b6a392f328c2b971b2fe78" "ab6e47d42cec13bdf53a67b21257bddf");
}

TEST_F(GcmTest, TestCase3_NoAad) {
    ByteVec out = kccomp::cipher_encrypt(spec_, key_, iv_, pt_);
    EXPECT_EQ(bytes_to_hex(out),
              "42831ec2217774244b7221b784d0d49ce3aa212f2c02a4e035c17e2329aca12e"
              "21d514b25466931c7d8f6a5aac84aa051ba30b396a0aac973d58e091473f5985"
              "4d5c2af327cd64a62cf35abd2ba6fab4");
    EXPECT_EQ(kccomp::cipher_decrypt(spec_, key_, iv_, out), pt_);
}

TEST_F(GcmTest, TestCase4_WithAad) {
    ByteVec pt(pt_.begin(), pt_.begin() + 60);
    ByteVec out = kccomp::cipher_encrypt(spec_, key_, iv_, pt, kccomp::PaddingScheme::None, aad_);
    EXPECT_EQ(bytes_to_hex(out),
              "42831ec2217774244b7221b784d0d49ce3aa212f2c02a4e035c17e2329aca12e"
              "21d514b25466931c7d8f6a5aac84aa051ba30b396a0aac973d58e091"
              "5bc94fbc3221a5db94fae95ae7121a47");
    EXPECT_EQ(kccomp::cipher_decrypt(spec_, key_, iv_, out, kccomp::PaddingScheme::None, aad_), pt);
}

TEST_F(GcmTest, TestCase5_ShortIv) {
    ByteVec pt(pt_.begin(), pt_.begin() + 60);
    ByteVec iv = hex_to_bytes("cafebabefacedbad");
    ByteVec out = kccomp::cipher_encrypt(spec_, key_, iv, pt, kccomp::PaddingScheme::None, aad_);
    EXPECT_EQ(bytes_to_hex(out),
              "61353b4c2806934a777ff51fa22a4755699b2a714fcdc6f83766e5f97b6c7423"
              "73806900e49f24b22b097544d4896b424989b5e1ebac0f07c23f4598"
              "3612d2e79e3b0785561be14aaca2fccb");
    EXPECT_EQ(kccomp::cipher_decrypt(spec_, key_, iv, out, kccomp::PaddingScheme::None, aad_), pt);
}

TEST_F(GcmTest, LongIvRoundTrip) {
    ByteVec iv(60, 0x9c);
    ByteVec out = kccomp::cipher_encrypt(spec_, key_, iv, pt_);
    EXPECT_EQ(out.size(), pt_.size() + 16);
    EXPECT_EQ(kccomp::cipher_decrypt(spec_, key_, iv, out), pt_);
}

// ============================================================================
// Streaming
// ============================================================================

TEST_F(GcmTest, StreamedEncryptMatchesOneShot) {
    CipherEngine engine(spec_);
    engine.init(CipherDirection::Encrypt, key_, iv_);
    engine.updateAad(aad_.data(), 7);
    engine.updateAad(aad_.data() + 7, aad_.size() - 7);
    EXPECT_EQ(engine.outputSize(pt_.size()), pt_.size() + 16);

    ByteVec out = engine.processBytes(pt_.data(), 13);
    ByteVec more = engine.processBytes(pt_.data() + 13, pt_.size() - 13);
    out.insert(out.end(), more.begin(), more.end());
    ByteVec tag = engine.doFinal();
    EXPECT_EQ(tag.size(), 16u);
    out.insert(out.end(), tag.begin(), tag.end());

    EXPECT_EQ(out, kccomp::cipher_encrypt(spec_, key_, iv_, pt_,
                                          kccomp::PaddingScheme::None, aad_));
}

TEST_F(GcmTest, DecryptReleasesNothingBeforeTag) {
    ByteVec ct = kccomp::cipher_encrypt(spec_, key_, iv_, pt_);

    CipherEngine engine(spec_);
    engine.init(CipherDirection::Decrypt, key_, iv_);
    EXPECT_TRUE(engine.processBytes(ct.data(), 40).empty());
    EXPECT_TRUE(engine.processBytes(ct.data() + 40, ct.size() - 40).empty());
    EXPECT_EQ(engine.outputSize(0), pt_.size());
    EXPECT_EQ(engine.doFinal(), pt_);
}

// ============================================================================
// Failures
// ============================================================================

TEST_F(GcmTest, TamperedInputFailsAuthentication) {
    ByteVec ct = kccomp::cipher_encrypt(spec_, key_, iv_, pt_, kccomp::PaddingScheme::None, aad_);

    for (size_t pos : {size_t(0), size_t(33), ct.size() - 16, ct.size() - 1}) {
        ByteVec bad = ct;
        bad[pos] ^= 0x01;
        EXPECT_THROW(kccomp::cipher_decrypt(spec_, key_, iv_, bad,
                                            kccomp::PaddingScheme::None, aad_),
                     kccomp::AuthenticationFailure)
            << "position " << pos;
    }

    ByteVec other_aad = aad_;
    other_aad[0] ^= 0x80;
    EXPECT_THROW(kccomp::cipher_decrypt(spec_, key_, iv_, ct,
                                        kccomp::PaddingScheme::None, other_aad),
                 kccomp::AuthenticationFailure);
}

TEST_F(GcmTest, ShortInputFailsAuthentication) {
    EXPECT_THROW(kccomp::cipher_decrypt(spec_, key_, iv_, ByteVec(15, 0)),
                 kccomp::AuthenticationFailure);
    EXPECT_THROW(kccomp::cipher_decrypt(spec_, key_, iv_, ByteVec()),
                 kccomp::AuthenticationFailure);
}

TEST_F(GcmTest, FailedDecryptLeavesEngineUninitialized) {
    CipherEngine engine(spec_);
    engine.init(CipherDirection::Decrypt, key_, iv_);
    engine.processBytes(ByteVec(32, 0));
    EXPECT_THROW(engine.doFinal(), kccomp::AuthenticationFailure);
    EXPECT_FALSE(engine.isInitialized());
}

TEST_F(GcmTest, AadAfterPayloadIsRejected) {
    CipherEngine enc(spec_);
    enc.init(CipherDirection::Encrypt, key_, iv_);
    enc.processBytes(pt_.data(), 16);
    EXPECT_THROW(enc.updateAad(aad_), std::logic_error);

    CipherEngine dec(spec_);
    dec.init(CipherDirection::Decrypt, key_, iv_);
    dec.processBytes(pt_.data(), 16);
    EXPECT_THROW(dec.updateAad(aad_), std::logic_error);
}

TEST_F(GcmTest, ProcessBlockUnsupported) {
    CipherEngine engine(spec_);
    engine.init(CipherDirection::Encrypt, key_, iv_);
    uint8_t block[16] = {0};
    EXPECT_THROW(engine.processBlock(block, block), kccomp::UnsupportedAlgorithm);
}

TEST_F(GcmTest, EmptyIvRejected) {
    CipherEngine engine(spec_);
    EXPECT_THROW(engine.init(CipherDirection::Encrypt, key_, ByteVec()),
                 kccomp::InvalidKeyMaterial);
    EXPECT_EQ(engine.tagSize(), 16u);
}

TEST_F(GcmTest, PayloadLimit) {
    using kccomp::internal::check_payload_limit;
    using kccomp::internal::kGcmMaxPayload;

    // 2^32 - 2 counter blocks, no inc32 wrap back onto J0
    EXPECT_EQ(kGcmMaxPayload, ((uint64_t(1) << 32) - 2) * 16);

    EXPECT_NO_THROW(check_payload_limit(0, kGcmMaxPayload, kGcmMaxPayload));
    EXPECT_NO_THROW(check_payload_limit(kGcmMaxPayload - 16, 16, kGcmMaxPayload));
    EXPECT_THROW(check_payload_limit(kGcmMaxPayload - 16, 17, kGcmMaxPayload),
                 kccomp::InvalidInputLength);
    EXPECT_THROW(check_payload_limit(kGcmMaxPayload, 1, kGcmMaxPayload),
                 kccomp::InvalidInputLength);
    EXPECT_THROW(check_payload_limit(0, UINT64_MAX, kGcmMaxPayload),
                 kccomp::InvalidInputLength);
}
