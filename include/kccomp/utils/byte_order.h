/**
 * @file byte_order.h
 * @brief Big-endian load/store helpers for counters and length fields
 *
 * KDF counters, the SP 800-108 [L] field, GCM length blocks and the
 * encrypt-then-MAC AAD length are all big-endian on the wire.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef KCCOMP_UTILS_BYTE_ORDER_H
#define KCCOMP_UTILS_BYTE_ORDER_H

#include <cstdint>
#include <cstddef>

namespace kccomp {
namespace byte_order {

inline uint32_t load_be32(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) |
           (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) |
           static_cast<uint32_t>(p[3]);
}

inline uint64_t load_be64(const uint8_t* p) {
    return (static_cast<uint64_t>(load_be32(p)) << 32) | load_be32(p + 4);
}

inline void store_be32(uint8_t* p, uint32_t v) {
    p[0] = static_cast<uint8_t>(v >> 24);
    p[1] = static_cast<uint8_t>(v >> 16);
    p[2] = static_cast<uint8_t>(v >> 8);
    p[3] = static_cast<uint8_t>(v);
}

inline void store_be64(uint8_t* p, uint64_t v) {
    store_be32(p, static_cast<uint32_t>(v >> 32));
    store_be32(p + 4, static_cast<uint32_t>(v));
}

inline void store_le32(uint8_t* p, uint32_t v) {
    p[0] = static_cast<uint8_t>(v);
    p[1] = static_cast<uint8_t>(v >> 8);
    p[2] = static_cast<uint8_t>(v >> 16);
    p[3] = static_cast<uint8_t>(v >> 24);
}

inline void store_le64(uint8_t* p, uint64_t v) {
    store_le32(p, static_cast<uint32_t>(v));
    store_le32(p + 4, static_cast<uint32_t>(v >> 32));
}

/**
 * @brief Write the low `width` bytes of v big-endian (width 1..4)
 */
inline void store_be_var(uint8_t* p, uint32_t v, size_t width) {
    for (size_t i = 0; i < width; i++) {
        p[width - 1 - i] = static_cast<uint8_t>(v >> (8 * i));
    }
}

} // namespace byte_order
} // namespace kccomp

#endif // KCCOMP_UTILS_BYTE_ORDER_H
