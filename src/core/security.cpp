/**
 * @file security.cpp
 * @brief Security Primitives Implementation
 *
 * Constant-time comparison and secure memory zeroing used by every engine
 * that holds key material or verifies a tag.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "kccomp/core/security.h"

#include <cstring>
#include <cstdint>

#include <openssl/crypto.h>

namespace kccomp {

// ============================================================================
// Compiler Memory Barrier
// ============================================================================

#if defined(__GNUC__) || defined(__clang__)
#define COMPILER_BARRIER() __asm__ __volatile__("" ::: "memory")
#elif defined(_MSC_VER)
#include <intrin.h>
#define COMPILER_BARRIER() _ReadWriteBarrier()
#else
#define COMPILER_BARRIER()
#endif

// ============================================================================
// Secure Memory Operations
// ============================================================================

void secure_zero(void* ptr, size_t len) {
    if (!ptr || len == 0) return;

    // OPENSSL_cleanse goes through a volatile function pointer internally
    OPENSSL_cleanse(ptr, len);

    COMPILER_BARRIER();
}

bool secure_compare(const void* a, const void* b, size_t len) {
    if (len == 0) return true;
    if (!a || !b) return false;

    const volatile unsigned char* pa = static_cast<const volatile unsigned char*>(a);
    const volatile unsigned char* pb = static_cast<const volatile unsigned char*>(b);

    volatile unsigned char diff = 0;

    // Always iterate through all bytes
    for (size_t i = 0; i < len; i++) {
        diff |= static_cast<unsigned char>(pa[i] ^ pb[i]);
    }

    COMPILER_BARRIER();

    return diff == 0;
}

}  // namespace kccomp

// ============================================================================
// C ABI Exports
// ============================================================================

extern "C" {

void kccomp_secure_zero(void* ptr, size_t len) {
    kccomp::secure_zero(ptr, len);
}

int kccomp_secure_compare(const void* a, const void* b, size_t len) {
    return kccomp::secure_compare(a, b, len) ? 1 : 0;
}

}  // extern "C"
