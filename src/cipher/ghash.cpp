/**
 * @file ghash.cpp
 * @brief GHASH Implementation - GF(2^128) Multiplication
 *
 * Bit-serial multiplication with mask-based selection: every one of the 128
 * steps runs the same instructions whatever the key and data bits are.
 *
 * Reference: NIST SP 800-38D, Algorithm 1
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "ghash.h"
#include "kccomp/core/security.h"
#include "kccomp/utils/byte_order.h"

#include <cstring>

namespace kccomp {
namespace internal {

namespace {

// Reduction polynomial x^128 + x^7 + x^2 + x + 1, bit-reflected: R = 0xE1 || 0^120
constexpr uint64_t kReduction = 0xE100000000000000ULL;

// Multiply by x in GF(2^128) with reduction
inline void mul_by_x(uint64_t v[2]) {
    const uint64_t carry = v[1] & 1;
    v[1] = (v[1] >> 1) | (v[0] << 63);
    v[0] = (v[0] >> 1) ^ (kReduction & (0 - carry));
}

// Z = X * H
void gf128_mul(const uint64_t x[2], const uint64_t h[2], uint64_t z[2]) {
    uint64_t v[2] = {h[0], h[1]};
    uint64_t acc[2] = {0, 0};

    for (int i = 0; i < 128; i++) {
        const uint64_t word = i < 64 ? x[0] : x[1];
        const uint64_t bit = (word >> (63 - (i & 63))) & 1;
        const uint64_t mask = 0 - bit;
        acc[0] ^= v[0] & mask;
        acc[1] ^= v[1] & mask;
        mul_by_x(v);
    }

    z[0] = acc[0];
    z[1] = acc[1];
}

} // anonymous namespace

Ghash::~Ghash() {
    secure_zero(h_, sizeof(h_));
    secure_zero(y_, sizeof(y_));
    secure_zero(buffer_, sizeof(buffer_));
}

void Ghash::init(const uint8_t h[16]) {
    h_[0] = byte_order::load_be64(h);
    h_[1] = byte_order::load_be64(h + 8);
    y_[0] = 0;
    y_[1] = 0;
    buffer_len_ = 0;
}

void Ghash::absorb(const uint8_t block[16]) {
    y_[0] ^= byte_order::load_be64(block);
    y_[1] ^= byte_order::load_be64(block + 8);
    gf128_mul(y_, h_, y_);
}

void Ghash::update(const uint8_t* data, size_t len) {
    if (len == 0) {
        return;
    }

    // Handle buffered data
    if (buffer_len_ > 0) {
        size_t needed = 16 - buffer_len_;
        if (len < needed) {
            std::memcpy(buffer_ + buffer_len_, data, len);
            buffer_len_ += len;
            return;
        }
        std::memcpy(buffer_ + buffer_len_, data, needed);
        absorb(buffer_);
        buffer_len_ = 0;
        data += needed;
        len -= needed;
    }

    while (len >= 16) {
        absorb(data);
        data += 16;
        len -= 16;
    }

    if (len > 0) {
        std::memcpy(buffer_, data, len);
        buffer_len_ = len;
    }
}

void Ghash::pad() {
    if (buffer_len_ > 0) {
        std::memset(buffer_ + buffer_len_, 0, 16 - buffer_len_);
        absorb(buffer_);
        buffer_len_ = 0;
    }
}

void Ghash::final(uint64_t aad_bits, uint64_t data_bits, uint8_t out[16]) {
    pad();

    uint8_t lengths[16];
    byte_order::store_be64(lengths, aad_bits);
    byte_order::store_be64(lengths + 8, data_bits);
    absorb(lengths);

    byte_order::store_be64(out, y_[0]);
    byte_order::store_be64(out + 8, y_[1]);
}

} // namespace internal
} // namespace kccomp
