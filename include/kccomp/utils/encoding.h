/**
 * @file encoding.h
 * @brief Encoding utilities for key material, IVs and test vectors
 *
 * Provides encoding/decoding utilities for:
 * - Hexadecimal (lowercase output, either case accepted)
 * - Base64 (standard alphabet, padded)
 * - Bytes/String conversions
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef KCCOMP_UTILS_ENCODING_H
#define KCCOMP_UTILS_ENCODING_H

#include "kccomp/core/common.h"
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// ============================================================================
// Hexadecimal Encoding/Decoding (C API)
// ============================================================================

/**
 * @brief Encode binary data to hexadecimal string (lowercase)
 *
 * @param data Input binary data
 * @param len Length of input data
 * @param hex Output buffer (must be at least len*2+1 bytes)
 * @param hex_size Size of output buffer
 * @return Number of characters written (excluding null terminator), 0 on error
 */
KCCOMP_API size_t kccomp_hex_encode(const uint8_t* data, size_t len, char* hex, size_t hex_size);

/**
 * @brief Decode hexadecimal string to binary data
 *
 * @param hex Input hex string (may contain 0x prefix)
 * @param hex_len Length of hex string (0 for null-terminated)
 * @param data Output buffer
 * @param data_size Size of output buffer
 * @return Number of bytes written, 0 on error
 */
KCCOMP_API size_t kccomp_hex_decode(const char* hex, size_t hex_len, uint8_t* data, size_t data_size);

#ifdef __cplusplus
}
#endif

// ============================================================================
// C++ API
// ============================================================================
#ifdef __cplusplus

#include "kccomp/core/types.h"
#include <string>
#include <stdexcept>

namespace kccomp {
namespace encoding {

/**
 * @brief Encoding exception for invalid input
 */
class EncodingError : public std::invalid_argument {
public:
    explicit EncodingError(const std::string& msg) : std::invalid_argument(msg) {}
};

/**
 * @brief Encode bytes to lowercase hex string
 */
KCCOMP_API std::string hexEncode(const ByteVec& data);
KCCOMP_API std::string hexEncode(const uint8_t* data, size_t len);

/**
 * @brief Decode hex string to bytes
 * @throws EncodingError on odd length or non-hex characters
 */
KCCOMP_API ByteVec hexDecode(const std::string& hex);

KCCOMP_API bool isValidHex(const std::string& str) noexcept;

/**
 * @brief Encode bytes to standard Base64 string
 */
KCCOMP_API std::string base64Encode(const ByteVec& data);
KCCOMP_API std::string base64Encode(const uint8_t* data, size_t len);

/**
 * @brief Decode Base64 string to bytes
 * @throws EncodingError on invalid input
 */
KCCOMP_API ByteVec base64Decode(const std::string& b64);

// UTF-8 text is carried byte for byte
KCCOMP_API ByteVec stringToBytes(const std::string& str);
KCCOMP_API std::string bytesToString(const ByteVec& bytes);

} // namespace encoding

using encoding::hexEncode;
using encoding::hexDecode;
using encoding::base64Encode;
using encoding::base64Decode;
using encoding::stringToBytes;
using encoding::bytesToString;

} // namespace kccomp

#endif // __cplusplus

#endif // KCCOMP_UTILS_ENCODING_H
