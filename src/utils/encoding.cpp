/**
 * @file encoding.cpp
 * @brief Hex and Base64 encoding implementation
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "kccomp/utils/encoding.h"
#include <cstring>

// ============================================================================
// Internal Constants
// ============================================================================

static const char HEX_LOWER[] = "0123456789abcdef";

static const char BASE64_CHARS[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

static int hex_char_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

static int base64_char_value(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

// ============================================================================
// C API: Hex Encoding/Decoding
// ============================================================================

extern "C" {

size_t kccomp_hex_encode(const uint8_t* data, size_t len, char* hex, size_t hex_size) {
    if ((data == nullptr && len > 0) || hex == nullptr || hex_size < len * 2 + 1) {
        return 0;
    }

    for (size_t i = 0; i < len; i++) {
        hex[i * 2] = HEX_LOWER[data[i] >> 4];
        hex[i * 2 + 1] = HEX_LOWER[data[i] & 0x0F];
    }
    hex[len * 2] = '\0';

    return len * 2;
}

size_t kccomp_hex_decode(const char* hex, size_t hex_len, uint8_t* data, size_t data_size) {
    if (hex == nullptr || data == nullptr) {
        return 0;
    }

    if (hex_len == 0) {
        hex_len = strlen(hex);
    }

    // Skip 0x prefix if present
    if (hex_len >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex += 2;
        hex_len -= 2;
    }

    if (hex_len % 2 != 0 || data_size < hex_len / 2) {
        return 0;
    }

    for (size_t i = 0; i < hex_len / 2; i++) {
        int hi = hex_char_value(hex[i * 2]);
        int lo = hex_char_value(hex[i * 2 + 1]);
        if (hi < 0 || lo < 0) {
            return 0;
        }
        data[i] = static_cast<uint8_t>((hi << 4) | lo);
    }

    return hex_len / 2;
}

} // extern "C"

// ============================================================================
// C++ API
// ============================================================================

namespace kccomp {
namespace encoding {

std::string hexEncode(const ByteVec& data) {
    return hexEncode(data.data(), data.size());
}

std::string hexEncode(const uint8_t* data, size_t len) {
    std::string result;
    result.reserve(len * 2);
    for (size_t i = 0; i < len; i++) {
        result.push_back(HEX_LOWER[data[i] >> 4]);
        result.push_back(HEX_LOWER[data[i] & 0x0F]);
    }
    return result;
}

ByteVec hexDecode(const std::string& hex) {
    if (!isValidHex(hex)) {
        throw EncodingError("Invalid hex string: " + hex.substr(0, 20));
    }
    if (hex.empty()) {
        return ByteVec();
    }
    ByteVec result(hex.size() / 2);
    size_t decoded = kccomp_hex_decode(hex.c_str(), hex.size(), result.data(), result.size());
    result.resize(decoded);
    return result;
}

bool isValidHex(const std::string& str) noexcept {
    size_t start = 0;
    if (str.size() >= 2 && str[0] == '0' && (str[1] == 'x' || str[1] == 'X')) {
        start = 2;
    }

    if ((str.size() - start) % 2 != 0) {
        return false;
    }

    for (size_t i = start; i < str.size(); i++) {
        if (hex_char_value(str[i]) < 0) {
            return false;
        }
    }
    return true;
}

std::string base64Encode(const ByteVec& data) {
    return base64Encode(data.data(), data.size());
}

std::string base64Encode(const uint8_t* data, size_t len) {
    std::string result;
    result.reserve(((len + 2) / 3) * 4);

    size_t i = 0;
    for (; i + 3 <= len; i += 3) {
        uint32_t v = (static_cast<uint32_t>(data[i]) << 16) |
                     (static_cast<uint32_t>(data[i + 1]) << 8) |
                     static_cast<uint32_t>(data[i + 2]);
        result.push_back(BASE64_CHARS[(v >> 18) & 0x3F]);
        result.push_back(BASE64_CHARS[(v >> 12) & 0x3F]);
        result.push_back(BASE64_CHARS[(v >> 6) & 0x3F]);
        result.push_back(BASE64_CHARS[v & 0x3F]);
    }

    size_t rem = len - i;
    if (rem == 1) {
        uint32_t v = static_cast<uint32_t>(data[i]) << 16;
        result.push_back(BASE64_CHARS[(v >> 18) & 0x3F]);
        result.push_back(BASE64_CHARS[(v >> 12) & 0x3F]);
        result.append("==");
    } else if (rem == 2) {
        uint32_t v = (static_cast<uint32_t>(data[i]) << 16) |
                     (static_cast<uint32_t>(data[i + 1]) << 8);
        result.push_back(BASE64_CHARS[(v >> 18) & 0x3F]);
        result.push_back(BASE64_CHARS[(v >> 12) & 0x3F]);
        result.push_back(BASE64_CHARS[(v >> 6) & 0x3F]);
        result.push_back('=');
    }

    return result;
}

ByteVec base64Decode(const std::string& b64) {
    if (b64.size() % 4 != 0) {
        throw EncodingError("Invalid Base64 length");
    }

    ByteVec result;
    result.reserve(b64.size() / 4 * 3);

    for (size_t i = 0; i < b64.size(); i += 4) {
        bool last = (i + 4 == b64.size());
        size_t pad = 0;
        if (last) {
            if (b64[i + 3] == '=') pad++;
            if (b64[i + 2] == '=') pad++;
        }

        uint32_t v = 0;
        for (size_t j = 0; j < 4 - pad; j++) {
            int c = base64_char_value(b64[i + j]);
            if (c < 0) {
                throw EncodingError("Invalid Base64 character");
            }
            v |= static_cast<uint32_t>(c) << (18 - 6 * j);
        }

        result.push_back(static_cast<uint8_t>(v >> 16));
        if (pad < 2) result.push_back(static_cast<uint8_t>(v >> 8));
        if (pad < 1) result.push_back(static_cast<uint8_t>(v));
    }

    return result;
}

ByteVec stringToBytes(const std::string& str) {
    return ByteVec(str.begin(), str.end());
}

std::string bytesToString(const ByteVec& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

} // namespace encoding
} // namespace kccomp
