/**
 * @file modes.h
 * @brief Block cipher modes behind CipherEngine (internal)
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef KCCOMP_SRC_CIPHER_MODES_H
#define KCCOMP_SRC_CIPHER_MODES_H

#include "kccomp/core/common.h"
#include "kccomp/core/error.h"
#include "kccomp/core/types.h"
#include "kccomp/engine/algorithm.h"
#include "kccomp/engine/raw_cipher.h"
#include "ghash.h"

#include <cstdint>
#include <memory>

namespace kccomp {
namespace internal {

class ModeEngine {
public:
    virtual ~ModeEngine() = default;

    virtual void init(CipherDirection direction, const uint8_t* key, size_t key_len,
                      const uint8_t* iv, size_t iv_len) = 0;
    virtual void updateAad(const uint8_t* aad, size_t len);
    virtual void processBlock(const uint8_t* in, uint8_t* out) = 0;

    /** Appends released output to out */
    virtual void processBytes(const uint8_t* in, size_t len, ByteVec& out) = 0;
    virtual void doFinal(ByteVec& out) = 0;

    virtual size_t outputSize(size_t input_len) const = 0;
    virtual size_t tagSize() const { return 0; }

    /** Wipe chaining state */
    virtual void clear() = 0;
};

std::unique_ptr<ModeEngine> make_mode(const CipherSpec& spec);

// ============================================================================
// CBC
// ============================================================================

class CbcMode final : public ModeEngine {
public:
    explicit CbcMode(CipherAlgorithm alg);
    ~CbcMode() override;

    void init(CipherDirection direction, const uint8_t* key, size_t key_len,
              const uint8_t* iv, size_t iv_len) override;
    void processBlock(const uint8_t* in, uint8_t* out) override;
    void processBytes(const uint8_t* in, size_t len, ByteVec& out) override;
    void doFinal(ByteVec& out) override;
    size_t outputSize(size_t input_len) const override;
    void clear() override;

private:
    RawCipher cipher_;
    CipherDirection direction_ = CipherDirection::Encrypt;
    AESBlock chain_{};
    AESBlock buffer_{};
    size_t buffer_len_ = 0;
};

// ============================================================================
// CTR (SIC) and OFB: keystream modes
// ============================================================================

class KeystreamMode : public ModeEngine {
public:
    ~KeystreamMode() override;

    void init(CipherDirection direction, const uint8_t* key, size_t key_len,
              const uint8_t* iv, size_t iv_len) override;
    void processBlock(const uint8_t* in, uint8_t* out) override;
    void processBytes(const uint8_t* in, size_t len, ByteVec& out) override;
    void doFinal(ByteVec& out) override;
    size_t outputSize(size_t input_len) const override { return input_len; }
    void clear() override;

protected:
    explicit KeystreamMode(CipherAlgorithm alg);

    /** Fill keystream_ with the next block and advance register_ */
    virtual void nextKeystream() = 0;

    RawCipher cipher_;
    AESBlock register_{};
    AESBlock keystream_{};
    size_t keystream_pos_ = 16;
};

class CtrMode final : public KeystreamMode {
public:
    explicit CtrMode(CipherAlgorithm alg) : KeystreamMode(alg) {}

protected:
    void nextKeystream() override;
};

class OfbMode final : public KeystreamMode {
public:
    explicit OfbMode(CipherAlgorithm alg) : KeystreamMode(alg) {}

protected:
    void nextKeystream() override;
};

// ============================================================================
// GCM
// ============================================================================

/** SP 800-38D bound on one message under a key/IV: 2^39 - 256 bits */
constexpr uint64_t kGcmMaxPayload = (uint64_t(1) << 36) - 32;

/**
 * @throws InvalidInputLength if processed + len would pass limit
 */
inline void check_payload_limit(uint64_t processed, uint64_t len, uint64_t limit) {
    if (len > limit || processed > limit - len) {
        throw InvalidInputLength("GCM payload exceeds 2^39 - 256 bits");
    }
}

class GcmMode final : public ModeEngine {
public:
    explicit GcmMode(CipherAlgorithm alg);
    ~GcmMode() override;

    void init(CipherDirection direction, const uint8_t* key, size_t key_len,
              const uint8_t* iv, size_t iv_len) override;
    void updateAad(const uint8_t* aad, size_t len) override;
    void processBlock(const uint8_t* in, uint8_t* out) override;
    void processBytes(const uint8_t* in, size_t len, ByteVec& out) override;
    void doFinal(ByteVec& out) override;
    size_t outputSize(size_t input_len) const override;
    size_t tagSize() const override { return KCCOMP_GCM_TAG_SIZE; }
    void clear() override;

private:
    void startPayload();
    void ctrXor(const uint8_t* in, size_t len, uint8_t* out);
    void computeTag(uint8_t tag[16]);

    RawCipher cipher_;
    Ghash ghash_;
    CipherDirection direction_ = CipherDirection::Encrypt;
    AESBlock j0_{};
    AESBlock counter_{};
    AESBlock keystream_{};
    size_t keystream_pos_ = 16;
    uint64_t aad_len_ = 0;
    uint64_t data_len_ = 0;
    bool payload_started_ = false;
    ByteVec held_;      ///< decrypt: ciphertext || tag held until doFinal
};

// ============================================================================
// Native stream cipher (ChaCha20)
// ============================================================================

class StreamMode final : public ModeEngine {
public:
    explicit StreamMode(CipherAlgorithm alg) : cipher_(alg) {}

    void init(CipherDirection direction, const uint8_t* key, size_t key_len,
              const uint8_t* iv, size_t iv_len) override;
    void processBlock(const uint8_t* in, uint8_t* out) override;
    void processBytes(const uint8_t* in, size_t len, ByteVec& out) override;
    void doFinal(ByteVec& out) override;
    size_t outputSize(size_t input_len) const override { return input_len; }
    void clear() override {}

private:
    RawCipher cipher_;
};

} // namespace internal
} // namespace kccomp

#endif // KCCOMP_SRC_CIPHER_MODES_H
