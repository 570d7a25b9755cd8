/**
 * @file cipher.h
 * @brief Cipher composition: chaining modes over a raw cipher
 *
 * CipherEngine is a state machine:
 *
 *   Uninitialized --init--> Ready --processBlock/processBytes--> Ready
 *   Ready --doFinal--> Uninitialized
 *   any --reset--> Uninitialized
 *
 * init() may be called again at any time; prior state is discarded.
 *
 * Modes:
 * - CBC: chains each block with the previous ciphertext; no padding here
 * - CTR (SIC): full-width big-endian counter block
 * - OFB: chains the keystream block
 * - GCM: AEAD with running GHASH over AAD and ciphertext; decryption holds
 *   all input back and releases plaintext only after the tag verifies
 * - STREAM: ChaCha20 keystream
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef KCCOMP_CIPHER_CIPHER_H
#define KCCOMP_CIPHER_CIPHER_H

#include "kccomp/core/common.h"
#include "kccomp/core/types.h"
#include "kccomp/engine/algorithm.h"
#include "kccomp/engine/raw_cipher.h"
#include "kccomp/padding/padding.h"

#include <memory>
#include <string>

namespace kccomp {

namespace internal {
class ModeEngine;
}

class KCCOMP_API CipherEngine {
public:
    /**
     * @throws UnsupportedAlgorithm on an invalid cipher/mode pairing
     */
    explicit CipherEngine(const CipherSpec& spec);
    explicit CipherEngine(const std::string& name);
    ~CipherEngine();

    CipherEngine(CipherEngine&&) noexcept;
    CipherEngine& operator=(CipherEngine&&) noexcept;
    CipherEngine(const CipherEngine&) = delete;
    CipherEngine& operator=(const CipherEngine&) = delete;

    /**
     * @brief Key the engine and move to Ready
     *
     * IV sizes: CBC/CTR/OFB one block, GCM at least 1 byte (12 recommended),
     * ChaCha20 16 bytes (LE32 counter || 96-bit nonce).
     *
     * @throws InvalidKeyMaterial on a key or IV size mismatch
     */
    void init(CipherDirection direction, const uint8_t* key, size_t key_len,
              const uint8_t* iv, size_t iv_len);
    void init(CipherDirection direction, const ByteVec& key, const ByteVec& iv) {
        init(direction, key.data(), key.size(), iv.data(), iv.size());
    }

    /**
     * @brief Feed associated data (GCM only, before any payload)
     * @throws UnsupportedAlgorithm for non-AEAD modes
     * @throws std::logic_error once payload processing has started
     */
    void updateAad(const uint8_t* aad, size_t len);
    void updateAad(const ByteVec& aad) { updateAad(aad.data(), aad.size()); }

    /**
     * @brief Transform exactly one block (CBC, CTR, OFB)
     * @throws EngineNotInitialized unless Ready
     */
    void processBlock(const uint8_t* in, uint8_t* out);

    /**
     * @brief Streaming transform; returns the bytes this call releases
     * @throws EngineNotInitialized unless Ready
     */
    ByteVec processBytes(const uint8_t* in, size_t len);
    ByteVec processBytes(const ByteVec& in) { return processBytes(in.data(), in.size()); }

    /**
     * @brief Complete the message and return to Uninitialized
     *
     * GCM encryption appends the tag; GCM decryption verifies it and then
     * returns the whole plaintext.
     *
     * @throws InvalidInputLength if CBC input was not block-aligned
     * @throws AuthenticationFailure on a GCM tag mismatch
     */
    ByteVec doFinal();

    /**
     * @brief Bytes processBytes(len) followed by doFinal() would return
     */
    size_t outputSize(size_t input_len) const;

    /**
     * @brief Drop keys and state; back to Uninitialized
     */
    void reset();

    bool isInitialized() const noexcept { return ready_; }
    const CipherSpec& spec() const noexcept { return spec_; }
    size_t blockSize() const noexcept { return cipher_info(spec_.algorithm).block_size; }
    size_t keySize() const noexcept { return cipher_info(spec_.algorithm).key_size; }
    size_t tagSize() const noexcept;

private:
    void requireReady() const;

    CipherSpec spec_;
    std::unique_ptr<internal::ModeEngine> mode_;
    bool ready_ = false;
};

/**
 * @brief One-shot encryption on a fresh CipherEngine
 *
 * Padding applies to CBC only: the final partial block is padded, and a
 * block-aligned plaintext gains a full padding block.
 *
 * @throws UnsupportedAlgorithm if padding is requested for a non-CBC mode
 */
KCCOMP_API ByteVec cipher_encrypt(const CipherSpec& spec, const ByteVec& key, const ByteVec& iv,
                                  const ByteVec& plaintext,
                                  PaddingScheme padding = PaddingScheme::None,
                                  const ByteVec& aad = ByteVec());

/**
 * @brief One-shot decryption; strips CBC padding when requested
 * @throws InvalidPadding on malformed padding
 * @throws AuthenticationFailure on a GCM tag mismatch
 */
KCCOMP_API ByteVec cipher_decrypt(const CipherSpec& spec, const ByteVec& key, const ByteVec& iv,
                                  const ByteVec& ciphertext,
                                  PaddingScheme padding = PaddingScheme::None,
                                  const ByteVec& aad = ByteVec());

} // namespace kccomp

#endif // KCCOMP_CIPHER_CIPHER_H
