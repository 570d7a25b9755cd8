/**
 * @file common.h
 * @brief Common definitions and utility macros for kccomp library
 * 
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#ifndef KCCOMP_CORE_COMMON_H
#define KCCOMP_CORE_COMMON_H

#include <stdint.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

// ============================================================================
// Platform detection
// ============================================================================
#if defined(_WIN32) || defined(_WIN64)
    #define KCCOMP_PLATFORM_WINDOWS 1
    #define KCCOMP_PLATFORM_NAME "Windows"
#elif defined(__linux__)
    #define KCCOMP_PLATFORM_LINUX 1
    #define KCCOMP_PLATFORM_NAME "Linux"
#elif defined(__APPLE__)
    #define KCCOMP_PLATFORM_MACOS 1
    #define KCCOMP_PLATFORM_NAME "macOS"
#else
    #define KCCOMP_PLATFORM_UNKNOWN 1
    #define KCCOMP_PLATFORM_NAME "Unknown"
#endif

// ============================================================================
// Export/Import macros for shared library
// ============================================================================
#ifdef KCCOMP_PLATFORM_WINDOWS
    #ifdef KCCOMP_SHARED_LIBRARY
        #ifdef KCCOMP_BUILDING
            #define KCCOMP_API __declspec(dllexport)
        #else
            #define KCCOMP_API __declspec(dllimport)
        #endif
    #else
        #define KCCOMP_API
    #endif
#else
    #ifdef KCCOMP_SHARED_LIBRARY
        #define KCCOMP_API __attribute__((visibility("default")))
    #else
        #define KCCOMP_API
    #endif
#endif

// ============================================================================
// Error codes
// ============================================================================
typedef enum {
    KCCOMP_SUCCESS = 0,
    KCCOMP_ERROR_INVALID_PARAM = -1,
    KCCOMP_ERROR_BUFFER_TOO_SMALL = -2,
    KCCOMP_ERROR_MEMORY_ALLOC = -3,
    KCCOMP_ERROR_UNSUPPORTED_ALGORITHM = -4,
    KCCOMP_ERROR_INVALID_KEY_MATERIAL = -5,
    KCCOMP_ERROR_NOT_INITIALIZED = -6,
    KCCOMP_ERROR_INVALID_PADDING = -7,
    KCCOMP_ERROR_AUTH_FAILED = -8,      // MAC or AEAD tag mismatch
    KCCOMP_ERROR_INVALID_LENGTH = -9,   // Block-mode input not aligned
    KCCOMP_ERROR_OUTPUT_LIMIT = -10,    // KDF counter space exhausted
    KCCOMP_ERROR_RANDOM_FAILED = -11,   // CSPRNG failure
    KCCOMP_ERROR_PROVIDER = -12,        // OpenSSL call failed
    KCCOMP_ERROR_INTERNAL = -13
} kccomp_error_t;

// Key sizes
#define KCCOMP_AES_128_KEY_SIZE   16
#define KCCOMP_AES_192_KEY_SIZE   24
#define KCCOMP_AES_256_KEY_SIZE   32
#define KCCOMP_AES_BLOCK_SIZE     16

#define KCCOMP_CHACHA20_KEY_SIZE  32
#define KCCOMP_CHACHA20_NONCE_SIZE 12

#define KCCOMP_GCM_IV_SIZE        12
#define KCCOMP_GCM_TAG_SIZE       16
#define KCCOMP_POLY1305_KEY_SIZE  32

// Utility macros
#define KCCOMP_ARRAY_SIZE(arr) (sizeof(arr) / sizeof((arr)[0]))

/**
 * @brief Get error message for error code
 * @param error Error code
 * @return Human-readable error message
 */
KCCOMP_API const char* kccomp_error_string(kccomp_error_t error);

/**
 * @brief Secure memory zeroing
 * @param ptr Pointer to memory
 * @param size Size of memory to zero
 */
KCCOMP_API void kccomp_secure_zero(void* ptr, size_t size);

/**
 * @brief Constant-time memory comparison
 * @param a First buffer
 * @param b Second buffer
 * @param size Size to compare
 * @return 1 if equal, 0 otherwise
 */
KCCOMP_API int kccomp_secure_compare(const void* a, const void* b, size_t size);

#ifdef __cplusplus
}
#endif

#endif // KCCOMP_CORE_COMMON_H
