/**
 * @file ghash.h
 * @brief GHASH universal hash for GCM (internal)
 *
 * Reference: NIST SP 800-38D section 6.4
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef KCCOMP_SRC_CIPHER_GHASH_H
#define KCCOMP_SRC_CIPHER_GHASH_H

#include <cstddef>
#include <cstdint>

namespace kccomp {
namespace internal {

/**
 * @brief Incremental GHASH over a byte stream
 *
 * Input is absorbed in 16-byte blocks; pad() zero-fills a trailing partial
 * block, separating the AAD section from the ciphertext section.
 */
class Ghash {
public:
    Ghash() = default;
    ~Ghash();

    void init(const uint8_t h[16]);
    void update(const uint8_t* data, size_t len);

    /** Close a partial block with zero fill */
    void pad();

    /**
     * @brief Absorb [len(A)]64 || [len(C)]64 and write the digest
     */
    void final(uint64_t aad_bits, uint64_t data_bits, uint8_t out[16]);

private:
    void absorb(const uint8_t block[16]);

    uint64_t h_[2] = {0, 0};
    uint64_t y_[2] = {0, 0};
    uint8_t buffer_[16] = {0};
    size_t buffer_len_ = 0;
};

} // namespace internal
} // namespace kccomp

#endif // KCCOMP_SRC_CIPHER_GHASH_H
