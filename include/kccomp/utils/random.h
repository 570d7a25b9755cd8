/**
 * @file random.h
 * @brief Secure random number generation over the provider PRNG
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#ifndef KCCOMP_UTILS_RANDOM_H
#define KCCOMP_UTILS_RANDOM_H

#include "kccomp/core/common.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Generate cryptographically secure random bytes
 * @param buffer Output buffer
 * @param len Number of bytes to generate
 * @return KCCOMP_SUCCESS or KCCOMP_ERROR_RANDOM_FAILED
 */
KCCOMP_API kccomp_error_t kccomp_random_bytes(uint8_t* buffer, size_t len);

#ifdef __cplusplus
}
#endif

#ifdef __cplusplus

#include "kccomp/core/types.h"

namespace kccomp {

/** Minimum nonce length accepted by randomNonce() */
constexpr size_t kMinNonceSize = 8;

/**
 * @brief Fill a fresh buffer with len random bytes
 * @throws CryptoError (KCCOMP_ERROR_RANDOM_FAILED) when the PRNG fails
 */
KCCOMP_API ByteVec randomBytes(size_t len);

/**
 * @brief Generate a time-prefixed nonce
 *
 * The first 8 bytes are the current Unix time in milliseconds, big-endian;
 * the remaining len - 8 bytes are random.
 *
 * @throws std::invalid_argument if len < 8
 */
KCCOMP_API ByteVec randomNonce(size_t len);

} // namespace kccomp

#endif // __cplusplus

#endif // KCCOMP_UTILS_RANDOM_H
