/**
 * @file random.cpp
 * @brief Random bytes and nonces from the OpenSSL DRBG
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "kccomp/utils/random.h"
#include "kccomp/utils/byte_order.h"
#include "kccomp/core/error.h"

#include <openssl/rand.h>

#include <chrono>
#include <climits>
#include <stdexcept>

namespace kccomp {

namespace {

bool fill_random(uint8_t* buffer, size_t len) {
    // RAND_bytes takes an int length
    while (len > 0) {
        int chunk = len > static_cast<size_t>(INT_MAX) ? INT_MAX : static_cast<int>(len);
        if (RAND_bytes(buffer, chunk) != 1) {
            return false;
        }
        buffer += chunk;
        len -= static_cast<size_t>(chunk);
    }
    return true;
}

} // anonymous namespace

ByteVec randomBytes(size_t len) {
    ByteVec out(len);
    if (len > 0 && !fill_random(out.data(), len)) {
        throw CryptoError(KCCOMP_ERROR_RANDOM_FAILED, "Random generation failed");
    }
    return out;
}

ByteVec randomNonce(size_t len) {
    if (len < kMinNonceSize) {
        throw std::invalid_argument("Nonce must be at least 8 bytes");
    }

    ByteVec nonce = randomBytes(len);
    auto now = std::chrono::system_clock::now().time_since_epoch();
    uint64_t millis = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
    byte_order::store_be64(nonce.data(), millis);
    return nonce;
}

} // namespace kccomp

extern "C" {

kccomp_error_t kccomp_random_bytes(uint8_t* buffer, size_t len) {
    if (buffer == nullptr && len > 0) {
        return KCCOMP_ERROR_INVALID_PARAM;
    }
    if (len == 0) {
        return KCCOMP_SUCCESS;
    }
    return kccomp::fill_random(buffer, len) ? KCCOMP_SUCCESS : KCCOMP_ERROR_RANDOM_FAILED;
}

} // extern "C"
