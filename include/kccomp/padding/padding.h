/**
 * @file padding.h
 * @brief Block padding schemes (ZeroByte, PKCS#7, TBC, ISO 7816-4)
 *
 * A padding operation works on one fixed-size block. The block size is the
 * buffer's length and `offset` marks where content ends: bytes
 * [offset, size) are padding.
 *
 * Two call styles with distinct signatures:
 * - pad_in_place / unpad_in_place take the block by rvalue, mutate that
 *   storage and hand it back;
 * - pad / unpad borrow the block and return a fresh buffer, leaving the
 *   input untouched.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef KCCOMP_PADDING_PADDING_H
#define KCCOMP_PADDING_PADDING_H

#include "kccomp/core/common.h"
#include "kccomp/core/types.h"

#include <string>

namespace kccomp {

enum class PaddingScheme {
    None,
    ZeroByte,   ///< zeros; ambiguous when content ends in zero bytes
    PKCS7,      ///< every padding byte holds the padding length
    TBC,        ///< trailing-bit-complement: 0x00 or 0xFF runs
    ISO7816     ///< 0x80 marker then zeros
};

KCCOMP_API const char* padding_name(PaddingScheme scheme);

/**
 * @throws UnsupportedAlgorithm on an unknown name
 */
KCCOMP_API PaddingScheme parse_padding(const std::string& name);

namespace padding {

/**
 * @brief Fill [offset, size) of the block with padding, reusing its storage
 *
 * @return The same buffer, padded
 * @throws std::out_of_range if offset > block size
 * @throws std::invalid_argument for PaddingScheme::None with offset < size,
 *         or PKCS7 with a block longer than 255 bytes
 */
KCCOMP_API ByteVec pad_in_place(ByteVec&& block, size_t offset, PaddingScheme scheme);

/**
 * @brief Copying variant of pad_in_place(); block is not modified
 */
KCCOMP_API ByteVec pad(const ByteVec& block, size_t offset, PaddingScheme scheme);

/**
 * @brief Validate that [offset, size) holds exactly the scheme's padding and
 *        return the content [0, offset), reusing the storage
 *
 * @throws InvalidPadding if the padding region is malformed
 */
KCCOMP_API ByteVec unpad_in_place(ByteVec&& block, size_t offset, PaddingScheme scheme);

/**
 * @brief Copying variant of unpad_in_place(); block is not modified
 */
KCCOMP_API ByteVec unpad(const ByteVec& block, size_t offset, PaddingScheme scheme);

/**
 * @brief Number of padding bytes at the end of a padded block
 *
 * ZeroByte and TBC scan backward and never fail. PKCS7 reads the last byte
 * and checks every padding byte without early exit.
 *
 * @throws InvalidPadding on malformed PKCS7 or ISO 7816-4 padding
 */
KCCOMP_API size_t pad_count(const ByteVec& block, PaddingScheme scheme);
KCCOMP_API size_t pad_count(const uint8_t* block, size_t block_size, PaddingScheme scheme);

} // namespace padding
} // namespace kccomp

#endif // KCCOMP_PADDING_PADDING_H
