/**
 * @file security.h
 * @brief Security primitives for kccomp - Side-channel resistant operations
 * 
 * This header provides security-critical functions including:
 * - Constant-time comparison for tag verification
 * - Secure memory zeroing of key material
 * 
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef KCCOMP_CORE_SECURITY_H
#define KCCOMP_CORE_SECURITY_H

#include "kccomp/core/common.h"
#include "kccomp/core/types.h"

#ifdef __cplusplus

namespace kccomp {

/**
 * @brief Securely zero memory, never optimized away
 */
KCCOMP_API void secure_zero(void* ptr, size_t len);

/**
 * @brief Constant-time memory comparison
 *
 * Always touches every byte; the running time depends only on len.
 *
 * @return true if both regions hold the same bytes
 */
KCCOMP_API bool secure_compare(const void* a, const void* b, size_t len);

/**
 * @brief Constant-time comparison for C++ containers
 *
 * Differing sizes compare unequal; sizes are not secret.
 */
template<typename Container>
bool secure_compare(const Container& a, const Container& b) {
    if (a.size() != b.size()) return false;
    return secure_compare(a.data(), b.data(),
                          a.size() * sizeof(typename Container::value_type));
}

/**
 * @brief Zero a byte vector's contents and empty it
 */
inline void secure_wipe(ByteVec& v) {
    secure_zero(v.data(), v.size());
    v.clear();
}

/**
 * @brief RAII guard that wipes a byte vector when the scope ends
 *
 * Used for derived subkeys so they are scrubbed on both the normal and the
 * exceptional path.
 */
class ScopedWipe {
public:
    explicit ScopedWipe(ByteVec& v) noexcept : v_(v) {}
    ~ScopedWipe() { secure_wipe(v_); }

    ScopedWipe(const ScopedWipe&) = delete;
    ScopedWipe& operator=(const ScopedWipe&) = delete;

private:
    ByteVec& v_;
};

} // namespace kccomp

#endif // __cplusplus

#endif // KCCOMP_CORE_SECURITY_H
