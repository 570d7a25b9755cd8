/**
 * @file kccomp_api.h
 * @brief C API for the kccomp composition layer
 *
 * Every function returns a kccomp_error_t (or a plain value for the
 * informational calls). C++ exceptions never cross this boundary.
 *
 * Algorithms and schemes are selected by name, using the same identifiers
 * the C++ API parses: "sha256", "hkdf", "aes128-cbc-hmac-sha256", ...
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef KCCOMP_KCCOMP_API_H
#define KCCOMP_KCCOMP_API_H

#include "kccomp/core/common.h"
#include "kccomp/version.h"
#include "kccomp/utils/random.h"
#include "kccomp/utils/encoding.h"

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/* ============================================================================
 * Library lifecycle
 * ============================================================================ */

/**
 * @brief Get the library version string
 * @return Version string "major.minor.patch"
 */
KCCOMP_API const char* kccomp_version(void);

/**
 * @brief Get the build platform name
 */
KCCOMP_API const char* kccomp_platform(void);

/**
 * @brief Load OpenSSL's crypto state and probe the default provider
 *
 * Safe to call more than once.
 *
 * @return KCCOMP_SUCCESS, or KCCOMP_ERROR_PROVIDER if SHA2-256 cannot be fetched
 */
KCCOMP_API kccomp_error_t kccomp_init(void);

KCCOMP_API void kccomp_cleanup(void);

/* ============================================================================
 * Digest
 * ============================================================================ */

/**
 * @brief One-shot digest
 *
 * @param algorithm Digest name ("sha256", "sha3-512", "blake2b512", "shake128", ...)
 * @param out Output buffer
 * @param out_size Capacity of out; for SHAKE this is also the requested length
 * @param out_len Receives the digest length
 * @return KCCOMP_ERROR_BUFFER_TOO_SMALL if out_size is below the digest size
 */
KCCOMP_API kccomp_error_t kccomp_digest(const char* algorithm,
                                        const uint8_t* data, size_t data_len,
                                        uint8_t* out, size_t out_size, size_t* out_len);

/* ============================================================================
 * Key derivation
 * ============================================================================ */

/**
 * @brief HKDF (RFC 5869); fills out_len bytes
 */
KCCOMP_API kccomp_error_t kccomp_hkdf(const char* digest,
                                      const uint8_t* ikm, size_t ikm_len,
                                      const uint8_t* salt, size_t salt_len,
                                      const uint8_t* info, size_t info_len,
                                      uint8_t* out, size_t out_len);

/**
 * @brief PBKDF2-HMAC (RFC 8018); fills out_len bytes
 */
KCCOMP_API kccomp_error_t kccomp_pbkdf2(const char* digest,
                                        const uint8_t* password, size_t password_len,
                                        const uint8_t* salt, size_t salt_len,
                                        uint32_t iterations,
                                        uint8_t* out, size_t out_len);

/* ============================================================================
 * AEAD
 * ============================================================================ */

/**
 * @brief Encrypt and authenticate; out receives ciphertext || tag
 *
 * @param scheme Scheme name, e.g. "aes128-cbc-hmac-sha256", "aes256-gcm"
 * @param out_size Capacity of out
 * @param out_len Receives the envelope length
 */
KCCOMP_API kccomp_error_t kccomp_aead_encrypt(const char* scheme,
                                              const uint8_t* key, size_t key_len,
                                              const uint8_t* iv, size_t iv_len,
                                              const uint8_t* aad, size_t aad_len,
                                              const uint8_t* plaintext, size_t plaintext_len,
                                              uint8_t* out, size_t out_size, size_t* out_len);

/**
 * @brief Verify and decrypt ciphertext || tag
 * @return KCCOMP_ERROR_AUTH_FAILED if the envelope does not verify; out is
 *         left untouched in that case
 */
KCCOMP_API kccomp_error_t kccomp_aead_decrypt(const char* scheme,
                                              const uint8_t* key, size_t key_len,
                                              const uint8_t* iv, size_t iv_len,
                                              const uint8_t* aad, size_t aad_len,
                                              const uint8_t* envelope, size_t envelope_len,
                                              uint8_t* out, size_t out_size, size_t* out_len);

#ifdef __cplusplus
}
#endif

#endif /* KCCOMP_KCCOMP_API_H */
