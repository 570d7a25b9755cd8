/**
 * @file test_security.cpp
 * @brief Secure memory helpers and error taxonomy unit tests
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <gtest/gtest.h>
#include <cstring>
#include <string>
#include <vector>

#include "kccomp/kccomp.h"

class SecurityTest : public ::testing::Test {
protected:
    void SetUp() override {
        kccomp_init();
    }
};

// ============================================================================
// Constant-time comparison
// ============================================================================

TEST_F(SecurityTest, CompareEqualBuffers) {
    const uint8_t a[] = {1, 2, 3, 4, 5, 6, 7, 8};
    const uint8_t b[] = {1, 2, 3, 4, 5, 6, 7, 8};

    EXPECT_TRUE(kccomp::secure_compare(a, b, sizeof(a)));
    EXPECT_EQ(kccomp_secure_compare(a, b, sizeof(a)), 1);
}

TEST_F(SecurityTest, CompareDetectsSingleBitDifference) {
    uint8_t a[32];
    uint8_t b[32];
    std::memset(a, 0x5A, sizeof(a));

    for (size_t byte = 0; byte < sizeof(a); byte += 7) {
        for (int bit = 0; bit < 8; bit += 3) {
            std::memcpy(b, a, sizeof(a));
            b[byte] ^= static_cast<uint8_t>(1u << bit);
            EXPECT_FALSE(kccomp::secure_compare(a, b, sizeof(a)));
            EXPECT_EQ(kccomp_secure_compare(a, b, sizeof(a)), 0);
        }
    }
}

TEST_F(SecurityTest, CompareEmptyRegionsAreEqual) {
    const uint8_t a[1] = {0x00};
    const uint8_t b[1] = {0xFF};
    EXPECT_TRUE(kccomp::secure_compare(a, b, 0));
}

TEST_F(SecurityTest, ContainerCompareRejectsDifferentSizes) {
    kccomp::ByteVec a = {1, 2, 3};
    kccomp::ByteVec b = {1, 2, 3, 4};
    kccomp::ByteVec c = {1, 2, 3};

    EXPECT_FALSE(kccomp::secure_compare(a, b));
    EXPECT_TRUE(kccomp::secure_compare(a, c));
}

// ============================================================================
// Wiping
// ============================================================================

TEST_F(SecurityTest, SecureZeroClearsMemory) {
    uint8_t buf[64];
    std::memset(buf, 0xA5, sizeof(buf));

    kccomp::secure_zero(buf, sizeof(buf));
    for (uint8_t b : buf) {
        EXPECT_EQ(b, 0);
    }

    std::memset(buf, 0x3C, sizeof(buf));
    kccomp_secure_zero(buf, 16);
    EXPECT_EQ(buf[15], 0);
    EXPECT_EQ(buf[16], 0x3C);
}

TEST_F(SecurityTest, ScopedWipeEmptiesVector) {
    kccomp::ByteVec key(32, 0x11);
    {
        kccomp::ScopedWipe guard(key);
        EXPECT_EQ(key.size(), 32u);
    }
    EXPECT_TRUE(key.empty());
}

TEST_F(SecurityTest, ScopedWipeEmptiesVectorOnThrow) {
    kccomp::ByteVec key(32, 0x22);
    try {
        kccomp::ScopedWipe guard(key);
        throw kccomp::OutputLimitExceeded("hkdf");
    } catch (const kccomp::OutputLimitExceeded&) {
        EXPECT_TRUE(key.empty());
    }
    EXPECT_TRUE(key.empty());
}

// ============================================================================
// Error taxonomy
// ============================================================================

TEST_F(SecurityTest, ErrorClassesCarryCodes) {
    EXPECT_EQ(kccomp::UnsupportedAlgorithm("x").code(), KCCOMP_ERROR_UNSUPPORTED_ALGORITHM);
    EXPECT_EQ(kccomp::InvalidKeyMaterial("x").code(), KCCOMP_ERROR_INVALID_KEY_MATERIAL);
    EXPECT_EQ(kccomp::EngineNotInitialized("x").code(), KCCOMP_ERROR_NOT_INITIALIZED);
    EXPECT_EQ(kccomp::InvalidPadding("x").code(), KCCOMP_ERROR_INVALID_PADDING);
    EXPECT_EQ(kccomp::AuthenticationFailure("x").code(), KCCOMP_ERROR_AUTH_FAILED);
    EXPECT_EQ(kccomp::InvalidInputLength("x").code(), KCCOMP_ERROR_INVALID_LENGTH);
    EXPECT_EQ(kccomp::OutputLimitExceeded("x").code(), KCCOMP_ERROR_OUTPUT_LIMIT);
    EXPECT_EQ(kccomp::ProviderError("x").code(), KCCOMP_ERROR_PROVIDER);
}

TEST_F(SecurityTest, ErrorsAreRuntimeErrors) {
    try {
        throw kccomp::AuthenticationFailure("tag mismatch");
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "tag mismatch");
    }
}

TEST_F(SecurityTest, ErrorStringsAreDistinct) {
    EXPECT_STREQ(kccomp_error_string(KCCOMP_SUCCESS), "Success");
    EXPECT_STREQ(kccomp_error_string(KCCOMP_ERROR_AUTH_FAILED), "Authentication failed");
    EXPECT_STRNE(kccomp_error_string(KCCOMP_ERROR_INVALID_PADDING),
                 kccomp_error_string(KCCOMP_ERROR_INVALID_LENGTH));
}
