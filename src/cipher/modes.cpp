/**
 * @file modes.cpp
 * @brief CBC, CTR (SIC), OFB, GCM and stream modes over RawCipher
 *
 * Reference: NIST SP 800-38A (CBC, CTR, OFB), SP 800-38D (GCM)
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "modes.h"
#include "kccomp/core/error.h"
#include "kccomp/core/security.h"

#include <cstring>
#include <stdexcept>
#include <string>

namespace kccomp {
namespace internal {

namespace {

constexpr size_t kBlock = KCCOMP_AES_BLOCK_SIZE;

void require_block_iv(const char* mode, size_t iv_len) {
    if (iv_len != kBlock) {
        throw InvalidKeyMaterial(std::string(mode) + " requires a 16-byte IV");
    }
}

// Full-width big-endian increment, wrapping at 2^128
void increment_be128(uint8_t block[16]) {
    for (int i = 15; i >= 0; i--) {
        if (++block[i] != 0) {
            break;
        }
    }
}

// GCM inc32: only the rightmost 32 bits count
void increment_be32(uint8_t block[16]) {
    for (int i = 15; i >= 12; i--) {
        if (++block[i] != 0) {
            break;
        }
    }
}

} // anonymous namespace

void ModeEngine::updateAad(const uint8_t*, size_t) {
    throw UnsupportedAlgorithm("Associated data requires an AEAD mode");
}

std::unique_ptr<ModeEngine> make_mode(const CipherSpec& spec) {
    spec.validate();
    switch (spec.mode) {
        case CipherMode::CBC:
            return std::unique_ptr<ModeEngine>(new CbcMode(spec.algorithm));
        case CipherMode::CTR:
            return std::unique_ptr<ModeEngine>(new CtrMode(spec.algorithm));
        case CipherMode::OFB:
            return std::unique_ptr<ModeEngine>(new OfbMode(spec.algorithm));
        case CipherMode::GCM:
            return std::unique_ptr<ModeEngine>(new GcmMode(spec.algorithm));
        case CipherMode::STREAM:
            return std::unique_ptr<ModeEngine>(new StreamMode(spec.algorithm));
    }
    throw UnsupportedAlgorithm("Unsupported cipher mode");
}

// ============================================================================
// CBC
// ============================================================================

CbcMode::CbcMode(CipherAlgorithm alg) : cipher_(alg) {}

CbcMode::~CbcMode() {
    clear();
}

void CbcMode::init(CipherDirection direction, const uint8_t* key, size_t key_len,
                   const uint8_t* iv, size_t iv_len) {
    require_block_iv("CBC", iv_len);
    cipher_.init(key, key_len, nullptr, 0, direction);
    direction_ = direction;
    std::memcpy(chain_.data(), iv, kBlock);
    buffer_len_ = 0;
}

void CbcMode::processBlock(const uint8_t* in, uint8_t* out) {
    if (buffer_len_ != 0) {
        throw InvalidInputLength("CBC processBlock called with a partial block pending");
    }

    if (direction_ == CipherDirection::Encrypt) {
        AESBlock tmp;
        for (size_t i = 0; i < kBlock; i++) {
            tmp[i] = static_cast<uint8_t>(in[i] ^ chain_[i]);
        }
        cipher_.processBlock(tmp.data(), out);
        std::memcpy(chain_.data(), out, kBlock);
    } else {
        // in and out may alias: keep the ciphertext for the next chain value
        AESBlock saved;
        std::memcpy(saved.data(), in, kBlock);
        cipher_.processBlock(in, out);
        for (size_t i = 0; i < kBlock; i++) {
            out[i] ^= chain_[i];
        }
        chain_ = saved;
    }
}

void CbcMode::processBytes(const uint8_t* in, size_t len, ByteVec& out) {
    if (buffer_len_ > 0) {
        size_t needed = kBlock - buffer_len_;
        if (len < needed) {
            std::memcpy(buffer_.data() + buffer_len_, in, len);
            buffer_len_ += len;
            return;
        }
        std::memcpy(buffer_.data() + buffer_len_, in, needed);
        buffer_len_ = 0;
        out.resize(out.size() + kBlock);
        processBlock(buffer_.data(), out.data() + out.size() - kBlock);
        in += needed;
        len -= needed;
    }

    const size_t full = len / kBlock * kBlock;
    const size_t start = out.size();
    out.resize(start + full);
    for (size_t i = 0; i < full; i += kBlock) {
        processBlock(in + i, out.data() + start + i);
    }

    if (len > full) {
        std::memcpy(buffer_.data(), in + full, len - full);
        buffer_len_ = len - full;
    }
}

void CbcMode::doFinal(ByteVec&) {
    if (buffer_len_ != 0) {
        buffer_len_ = 0;
        throw InvalidInputLength("CBC input is not a multiple of the block size");
    }
}

size_t CbcMode::outputSize(size_t input_len) const {
    return buffer_len_ + input_len;
}

void CbcMode::clear() {
    secure_zero(chain_.data(), chain_.size());
    secure_zero(buffer_.data(), buffer_.size());
    buffer_len_ = 0;
}

// ============================================================================
// CTR / OFB
// ============================================================================

KeystreamMode::KeystreamMode(CipherAlgorithm alg) : cipher_(alg) {}

KeystreamMode::~KeystreamMode() {
    secure_zero(register_.data(), register_.size());
    secure_zero(keystream_.data(), keystream_.size());
}

void KeystreamMode::init(CipherDirection, const uint8_t* key, size_t key_len,
                         const uint8_t* iv, size_t iv_len) {
    require_block_iv("CTR/OFB", iv_len);
    // Both directions run the forward transform
    cipher_.init(key, key_len, nullptr, 0, CipherDirection::Encrypt);
    std::memcpy(register_.data(), iv, kBlock);
    keystream_pos_ = kBlock;
}

void KeystreamMode::processBlock(const uint8_t* in, uint8_t* out) {
    if (keystream_pos_ != kBlock) {
        throw InvalidInputLength("processBlock called with a partial keystream block pending");
    }
    nextKeystream();
    for (size_t i = 0; i < kBlock; i++) {
        out[i] = static_cast<uint8_t>(in[i] ^ keystream_[i]);
    }
    keystream_pos_ = kBlock;
}

void KeystreamMode::processBytes(const uint8_t* in, size_t len, ByteVec& out) {
    const size_t start = out.size();
    out.resize(start + len);
    uint8_t* dst = out.data() + start;

    for (size_t i = 0; i < len; i++) {
        if (keystream_pos_ == kBlock) {
            nextKeystream();
            keystream_pos_ = 0;
        }
        dst[i] = static_cast<uint8_t>(in[i] ^ keystream_[keystream_pos_++]);
    }
}

void KeystreamMode::doFinal(ByteVec&) {}

void KeystreamMode::clear() {
    secure_zero(register_.data(), register_.size());
    secure_zero(keystream_.data(), keystream_.size());
    keystream_pos_ = kBlock;
}

void CtrMode::nextKeystream() {
    cipher_.processBlock(register_.data(), keystream_.data());
    increment_be128(register_.data());
}

void OfbMode::nextKeystream() {
    cipher_.processBlock(register_.data(), keystream_.data());
    register_ = keystream_;
}

// ============================================================================
// GCM
// ============================================================================

GcmMode::GcmMode(CipherAlgorithm alg) : cipher_(alg) {}

GcmMode::~GcmMode() {
    clear();
}

void GcmMode::init(CipherDirection direction, const uint8_t* key, size_t key_len,
                   const uint8_t* iv, size_t iv_len) {
    if (iv == nullptr || iv_len == 0) {
        throw InvalidKeyMaterial("GCM requires a non-empty IV");
    }
    cipher_.init(key, key_len, nullptr, 0, CipherDirection::Encrypt);
    direction_ = direction;

    // H = E(K, 0^128)
    AESBlock h{};
    cipher_.processBlock(h.data(), h.data());

    // J0 = IV || 0^31 || 1 for 96-bit IVs, GHASH(IV padded || [len(IV)]64) otherwise
    if (iv_len == KCCOMP_GCM_IV_SIZE) {
        j0_.fill(0);
        std::memcpy(j0_.data(), iv, iv_len);
        j0_[15] = 1;
    } else {
        Ghash iv_hash;
        iv_hash.init(h.data());
        iv_hash.update(iv, iv_len);
        iv_hash.final(0, static_cast<uint64_t>(iv_len) * 8, j0_.data());
    }

    ghash_.init(h.data());
    secure_zero(h.data(), h.size());

    counter_ = j0_;
    increment_be32(counter_.data());
    keystream_pos_ = kBlock;
    aad_len_ = 0;
    data_len_ = 0;
    payload_started_ = false;
    secure_wipe(held_);
}

void GcmMode::updateAad(const uint8_t* aad, size_t len) {
    if (payload_started_) {
        throw std::logic_error("GCM associated data must precede the payload");
    }
    ghash_.update(aad, len);
    aad_len_ += len;
}

void GcmMode::startPayload() {
    if (!payload_started_) {
        ghash_.pad();
        payload_started_ = true;
    }
}

void GcmMode::ctrXor(const uint8_t* in, size_t len, uint8_t* out) {
    for (size_t i = 0; i < len; i++) {
        if (keystream_pos_ == kBlock) {
            cipher_.processBlock(counter_.data(), keystream_.data());
            increment_be32(counter_.data());
            keystream_pos_ = 0;
        }
        out[i] = static_cast<uint8_t>(in[i] ^ keystream_[keystream_pos_++]);
    }
}

void GcmMode::processBlock(const uint8_t*, uint8_t*) {
    throw UnsupportedAlgorithm("GCM is driven with processBytes()");
}

void GcmMode::processBytes(const uint8_t* in, size_t len, ByteVec& out) {
    startPayload();
    if (direction_ == CipherDirection::Decrypt) {
        check_payload_limit(held_.size(), len, kGcmMaxPayload + KCCOMP_GCM_TAG_SIZE);
        // Nothing is released before the tag has been checked
        held_.insert(held_.end(), in, in + len);
        return;
    }

    check_payload_limit(data_len_, len, kGcmMaxPayload);
    const size_t start = out.size();
    out.resize(start + len);
    ctrXor(in, len, out.data() + start);
    ghash_.update(out.data() + start, len);
    data_len_ += len;
}

void GcmMode::computeTag(uint8_t tag[16]) {
    startPayload();
    ghash_.final(aad_len_ * 8, data_len_ * 8, tag);

    AESBlock ek_j0;
    cipher_.processBlock(j0_.data(), ek_j0.data());
    for (size_t i = 0; i < kBlock; i++) {
        tag[i] ^= ek_j0[i];
    }
    secure_zero(ek_j0.data(), ek_j0.size());
}

void GcmMode::doFinal(ByteVec& out) {
    AESBlock tag;

    if (direction_ == CipherDirection::Encrypt) {
        computeTag(tag.data());
        out.insert(out.end(), tag.begin(), tag.end());
        return;
    }

    if (held_.size() < KCCOMP_GCM_TAG_SIZE) {
        secure_wipe(held_);
        throw AuthenticationFailure("GCM authentication failed");
    }

    const size_t ct_len = held_.size() - KCCOMP_GCM_TAG_SIZE;
    startPayload();
    ghash_.update(held_.data(), ct_len);
    data_len_ = ct_len;
    computeTag(tag.data());

    if (!secure_compare(tag.data(), held_.data() + ct_len, KCCOMP_GCM_TAG_SIZE)) {
        secure_wipe(held_);
        throw AuthenticationFailure("GCM authentication failed");
    }

    const size_t start = out.size();
    out.resize(start + ct_len);
    ctrXor(held_.data(), ct_len, out.data() + start);
    secure_wipe(held_);
}

size_t GcmMode::outputSize(size_t input_len) const {
    if (direction_ == CipherDirection::Encrypt) {
        return input_len + KCCOMP_GCM_TAG_SIZE;
    }
    const size_t total = held_.size() + input_len;
    return total < KCCOMP_GCM_TAG_SIZE ? 0 : total - KCCOMP_GCM_TAG_SIZE;
}

void GcmMode::clear() {
    secure_zero(j0_.data(), j0_.size());
    secure_zero(counter_.data(), counter_.size());
    secure_zero(keystream_.data(), keystream_.size());
    keystream_pos_ = kBlock;
    secure_wipe(held_);
    payload_started_ = false;
    aad_len_ = 0;
    data_len_ = 0;
}

// ============================================================================
// Stream
// ============================================================================

void StreamMode::init(CipherDirection direction, const uint8_t* key, size_t key_len,
                      const uint8_t* iv, size_t iv_len) {
    cipher_.init(key, key_len, iv, iv_len, direction);
}

void StreamMode::processBlock(const uint8_t* in, uint8_t* out) {
    cipher_.processBytes(in, 1, out);
}

void StreamMode::processBytes(const uint8_t* in, size_t len, ByteVec& out) {
    const size_t start = out.size();
    out.resize(start + len);
    cipher_.processBytes(in, len, out.data() + start);
}

void StreamMode::doFinal(ByteVec&) {}

} // namespace internal
} // namespace kccomp
