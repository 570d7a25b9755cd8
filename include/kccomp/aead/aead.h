/**
 * @file aead.h
 * @brief AEAD schemes composed from cipher and MAC engines
 *
 * Envelope layout is always ciphertext || tag.
 *
 * Encrypt-then-MAC (RFC 7518 section 5.2):
 *   MAC_KEY = key[0, n/2), ENC_KEY = key[n/2, n)
 *   C = AES-CBC(ENC_KEY, IV, PKCS7(P))
 *   T = HMAC(MAC_KEY, A || IV || C || BE64(bits(A)))[0, tag)
 *
 * Native AEAD:
 *   AES-GCM (SP 800-38D) with a 96-bit IV
 *   ChaCha20-Poly1305 (RFC 8439)
 *
 * Decryption authenticates before any plaintext is produced. Every failure
 * on the decrypt path surfaces as AuthenticationFailure.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef KCCOMP_AEAD_AEAD_H
#define KCCOMP_AEAD_AEAD_H

#include "kccomp/core/common.h"
#include "kccomp/core/types.h"
#include "kccomp/engine/algorithm.h"

#include <string>

namespace kccomp {

enum class AeadScheme {
    AES128_CBC_HMAC_SHA256,
    AES192_CBC_HMAC_SHA384,
    AES256_CBC_HMAC_SHA512,
    AES128_GCM,
    AES192_GCM,
    AES256_GCM,
    CHACHA20_POLY1305
};

struct AeadInfo {
    const char* name;
    size_t key_size;
    size_t iv_size;
    size_t tag_size;
    bool encrypt_then_mac;
    CipherAlgorithm cipher;
    DigestAlgorithm digest;     ///< HMAC digest; unused by native schemes
};

KCCOMP_API const AeadInfo& aead_info(AeadScheme scheme);

/**
 * @brief Parse "aes128-cbc-hmac-sha256", "aes256-gcm", "chacha20-poly1305", ...
 * @throws UnsupportedAlgorithm on an unknown name
 */
KCCOMP_API AeadScheme parse_aead_scheme(const std::string& name);

namespace aead {

/**
 * @brief A scheme bound to a key
 *
 * Holds its own copy of the key and wipes it on destruction. Each call
 * builds fresh engines, so one AeadCipher may serve many messages.
 */
class KCCOMP_API AeadCipher {
public:
    /**
     * @throws InvalidKeyMaterial if key.size() != aead_info(scheme).key_size
     */
    AeadCipher(AeadScheme scheme, const ByteVec& key);
    ~AeadCipher();

    AeadCipher(const AeadCipher&) = delete;
    AeadCipher& operator=(const AeadCipher&) = delete;

    /**
     * @return ciphertext || tag
     * @throws InvalidKeyMaterial on a wrong IV length
     */
    ByteVec encrypt(const ByteVec& plaintext, const ByteVec& iv,
                    const ByteVec& aad = ByteVec()) const;

    /**
     * @throws AuthenticationFailure if the envelope does not verify
     * @throws InvalidKeyMaterial on a wrong IV length
     */
    ByteVec decrypt(const ByteVec& envelope, const ByteVec& iv,
                    const ByteVec& aad = ByteVec()) const;

    AeadScheme scheme() const noexcept { return scheme_; }
    size_t tagSize() const noexcept { return aead_info(scheme_).tag_size; }

private:
    void checkIv(const ByteVec& iv) const;

    AeadScheme scheme_;
    ByteVec key_;
};

/**
 * @brief Fresh IV for one message under scheme
 *
 * CBC schemes get a fully random IV; the native AEAD schemes get a
 * timestamp-prefixed nonce from randomNonce().
 */
KCCOMP_API ByteVec make_iv(AeadScheme scheme);

KCCOMP_API ByteVec encrypt(const ByteVec& plaintext, const ByteVec& key, const ByteVec& iv,
                           AeadScheme scheme, const ByteVec& aad = ByteVec());

KCCOMP_API ByteVec decrypt(const ByteVec& envelope, const ByteVec& key, const ByteVec& iv,
                           AeadScheme scheme, const ByteVec& aad = ByteVec());

} // namespace aead
} // namespace kccomp

#endif // KCCOMP_AEAD_AEAD_H
