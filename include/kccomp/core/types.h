/**
 * @file types.h
 * @brief Type definitions for kccomp library
 * 
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#ifndef KCCOMP_CORE_TYPES_H
#define KCCOMP_CORE_TYPES_H

#include "kccomp/core/common.h"

// C++ types
#ifdef __cplusplus

#include <vector>
#include <array>

namespace kccomp {

// Byte vector
using ByteVec = std::vector<uint8_t>;

// Byte array templates
template<size_t N>
using ByteArray = std::array<uint8_t, N>;

// Common block sizes
using AESBlock = ByteArray<KCCOMP_AES_BLOCK_SIZE>;

} // namespace kccomp

#endif // __cplusplus

#endif // KCCOMP_CORE_TYPES_H
