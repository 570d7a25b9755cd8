/**
 * @file raw_cipher.h
 * @brief Raw cipher primitive: single-block transform or native stream
 *
 * Block ciphers (AES-128/192/256) expose processBlock(), the bare block
 * transform with no chaining or padding; chaining modes live in the cipher
 * composition layer. ChaCha20 exposes processBytes() with OpenSSL's 16-byte
 * IV layout: 32-bit little-endian block counter || 96-bit nonce.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef KCCOMP_ENGINE_RAW_CIPHER_H
#define KCCOMP_ENGINE_RAW_CIPHER_H

#include "kccomp/core/common.h"
#include "kccomp/core/types.h"
#include "kccomp/engine/algorithm.h"

#include <memory>

namespace kccomp {

enum class CipherDirection {
    Encrypt,
    Decrypt
};

class KCCOMP_API RawCipher {
public:
    /**
     * @throws UnsupportedAlgorithm if the provider lacks the cipher
     */
    explicit RawCipher(CipherAlgorithm alg);
    ~RawCipher();

    RawCipher(RawCipher&&) noexcept;
    RawCipher& operator=(RawCipher&&) noexcept;
    RawCipher(const RawCipher&) = delete;
    RawCipher& operator=(const RawCipher&) = delete;

    /**
     * @param iv Must be empty for block ciphers, ivSize() bytes for ChaCha20
     * @throws InvalidKeyMaterial on a key or IV size mismatch
     */
    void init(const uint8_t* key, size_t key_len, const uint8_t* iv, size_t iv_len,
              CipherDirection direction);
    void init(const ByteVec& key, const ByteVec& iv, CipherDirection direction) {
        init(key.data(), key.size(), iv.data(), iv.size(), direction);
    }

    /**
     * @brief Transform exactly blockSize() bytes; in and out may alias
     * @throws EngineNotInitialized before init()
     * @throws UnsupportedAlgorithm on a stream cipher
     */
    void processBlock(const uint8_t* in, uint8_t* out);
    ByteVec processBlock(const ByteVec& in);

    /**
     * @brief Stream transform of any length; in and out may alias
     * @throws UnsupportedAlgorithm on a block cipher
     */
    void processBytes(const uint8_t* in, size_t len, uint8_t* out);
    ByteVec processBytes(const ByteVec& in);

    /**
     * @brief Rewind to the state right after init() (same key and IV)
     */
    void reset();

    CipherAlgorithm algorithm() const noexcept { return alg_; }
    size_t blockSize() const noexcept { return cipher_info(alg_).block_size; }
    size_t keySize() const noexcept { return cipher_info(alg_).key_size; }
    size_t ivSize() const noexcept { return cipher_info(alg_).iv_size; }
    bool isStream() const noexcept { return blockSize() == 1; }
    bool isInitialized() const noexcept { return ready_; }
    CipherDirection direction() const noexcept { return direction_; }

private:
    void transform(const uint8_t* in, size_t len, uint8_t* out);

    struct Impl;
    std::unique_ptr<Impl> impl_;
    CipherAlgorithm alg_;
    CipherDirection direction_ = CipherDirection::Encrypt;
    bool ready_ = false;
};

} // namespace kccomp

#endif // KCCOMP_ENGINE_RAW_CIPHER_H
