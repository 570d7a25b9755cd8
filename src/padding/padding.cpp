/**
 * @file padding.cpp
 * @brief Block padding schemes
 *
 * Validation accumulates differences over the whole padding region before
 * deciding, so malformed input is rejected without an early exit.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "kccomp/padding/padding.h"
#include "kccomp/core/error.h"
#include "engine/provider.h"

#include <stdexcept>
#include <utility>

namespace kccomp {

namespace {

constexpr uint8_t kIso7816Marker = 0x80;

// TBC fills with the complement of the last content bit
uint8_t tbc_code(uint8_t last_content_byte) {
    return (last_content_byte & 0x01) == 0 ? 0xFF : 0x00;
}

void check_offset(size_t size, size_t offset) {
    if (offset > size) {
        throw std::out_of_range("Padding offset " + std::to_string(offset) +
                                " exceeds block size " + std::to_string(size));
    }
}

void fill_padding(uint8_t* block, size_t size, size_t offset, PaddingScheme scheme) {
    const size_t len = size - offset;
    if (len == 0) {
        return;
    }

    switch (scheme) {
        case PaddingScheme::None:
            throw std::invalid_argument("PaddingScheme::None requires a full block");

        case PaddingScheme::ZeroByte:
            for (size_t i = offset; i < size; i++) block[i] = 0x00;
            break;

        case PaddingScheme::PKCS7:
            if (len > 255) {
                throw std::invalid_argument("PKCS7 padding is limited to 255 bytes");
            }
            for (size_t i = offset; i < size; i++) block[i] = static_cast<uint8_t>(len);
            break;

        case PaddingScheme::TBC: {
            const uint8_t code = offset > 0 ? tbc_code(block[offset - 1])
                                            : tbc_code(block[size - 1]);
            for (size_t i = offset; i < size; i++) block[i] = code;
            break;
        }

        case PaddingScheme::ISO7816:
            block[offset] = kIso7816Marker;
            for (size_t i = offset + 1; i < size; i++) block[i] = 0x00;
            break;
    }
}

// Returns true when [offset, size) is exactly the scheme's padding
bool region_is_valid(const uint8_t* block, size_t size, size_t offset, PaddingScheme scheme) {
    const size_t len = size - offset;
    if (len == 0) {
        return true;
    }

    uint8_t diff = 0;
    switch (scheme) {
        case PaddingScheme::None:
            return false;

        case PaddingScheme::ZeroByte:
            for (size_t i = offset; i < size; i++) diff |= block[i];
            break;

        case PaddingScheme::PKCS7:
            if (len > 255) {
                return false;
            }
            for (size_t i = offset; i < size; i++) {
                diff |= static_cast<uint8_t>(block[i] ^ static_cast<uint8_t>(len));
            }
            break;

        case PaddingScheme::TBC: {
            // With no content byte the fill may be either 0x00 or 0xFF
            const uint8_t code = offset > 0 ? tbc_code(block[offset - 1]) : block[offset];
            if (offset == 0 && code != 0x00 && code != 0xFF) {
                return false;
            }
            for (size_t i = offset; i < size; i++) {
                diff |= static_cast<uint8_t>(block[i] ^ code);
            }
            break;
        }

        case PaddingScheme::ISO7816:
            diff |= static_cast<uint8_t>(block[offset] ^ kIso7816Marker);
            for (size_t i = offset + 1; i < size; i++) diff |= block[i];
            break;
    }
    return diff == 0;
}

} // anonymous namespace

const char* padding_name(PaddingScheme scheme) {
    switch (scheme) {
        case PaddingScheme::None: return "none";
        case PaddingScheme::ZeroByte: return "zerobyte";
        case PaddingScheme::PKCS7: return "pkcs7";
        case PaddingScheme::TBC: return "tbc";
        case PaddingScheme::ISO7816: return "iso7816";
    }
    return "unknown";
}

PaddingScheme parse_padding(const std::string& name) {
    const std::string key = internal::canonical_name(name);
    if (key == "none" || key == "nopadding") return PaddingScheme::None;
    if (key == "zerobyte" || key == "zero") return PaddingScheme::ZeroByte;
    if (key == "pkcs7" || key == "pkcs5") return PaddingScheme::PKCS7;
    if (key == "tbc") return PaddingScheme::TBC;
    if (key == "iso7816" || key == "iso78164") return PaddingScheme::ISO7816;
    throw UnsupportedAlgorithm("Unsupported padding: " + name);
}

namespace padding {

ByteVec pad_in_place(ByteVec&& block, size_t offset, PaddingScheme scheme) {
    check_offset(block.size(), offset);
    fill_padding(block.data(), block.size(), offset, scheme);
    return std::move(block);
}

ByteVec pad(const ByteVec& block, size_t offset, PaddingScheme scheme) {
    return pad_in_place(ByteVec(block), offset, scheme);
}

ByteVec unpad_in_place(ByteVec&& block, size_t offset, PaddingScheme scheme) {
    check_offset(block.size(), offset);
    if (!region_is_valid(block.data(), block.size(), offset, scheme)) {
        throw InvalidPadding(std::string("Invalid ") + padding_name(scheme) + " padding");
    }
    block.resize(offset);
    return std::move(block);
}

ByteVec unpad(const ByteVec& block, size_t offset, PaddingScheme scheme) {
    check_offset(block.size(), offset);
    if (!region_is_valid(block.data(), block.size(), offset, scheme)) {
        throw InvalidPadding(std::string("Invalid ") + padding_name(scheme) + " padding");
    }
    return ByteVec(block.begin(), block.begin() + static_cast<std::ptrdiff_t>(offset));
}

size_t pad_count(const ByteVec& block, PaddingScheme scheme) {
    return pad_count(block.data(), block.size(), scheme);
}

size_t pad_count(const uint8_t* block, size_t size, PaddingScheme scheme) {
    switch (scheme) {
        case PaddingScheme::None:
            return 0;

        case PaddingScheme::ZeroByte: {
            size_t count = size;
            while (count > 0 && block[count - 1] == 0x00) count--;
            return size - count;
        }

        case PaddingScheme::PKCS7: {
            if (size == 0) {
                throw InvalidPadding("Invalid pkcs7 padding");
            }
            const size_t count = block[size - 1];
            bool bad = count == 0 || count > size;
            uint8_t diff = 0;
            // Visit every byte; only those in the padding region count
            for (size_t i = 0; i < size; i++) {
                const uint8_t in_region = static_cast<uint8_t>(0 - static_cast<uint8_t>(i + count >= size));
                diff |= static_cast<uint8_t>(in_region & (block[i] ^ static_cast<uint8_t>(count)));
            }
            if (bad || diff != 0) {
                throw InvalidPadding("Invalid pkcs7 padding");
            }
            return count;
        }

        case PaddingScheme::TBC: {
            if (size == 0) {
                return 0;
            }
            const uint8_t code = block[size - 1];
            size_t count = size;
            while (count > 0 && block[count - 1] == code) count--;
            return size - count;
        }

        case PaddingScheme::ISO7816: {
            size_t i = size;
            while (i > 0 && block[i - 1] == 0x00) i--;
            if (i == 0 || block[i - 1] != kIso7816Marker) {
                throw InvalidPadding("Invalid iso7816 padding");
            }
            return size - (i - 1);
        }
    }
    return 0;
}

} // namespace padding
} // namespace kccomp
