/**
 * @file cli_utils.h
 * @brief Common utility functions for kccomp CLI commands
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#ifndef KCCOMP_CLI_UTILS_H
#define KCCOMP_CLI_UTILS_H

#include "kccomp/core/types.h"
#include "kccomp/utils/encoding.h"

#include <fstream>
#include <iterator>
#include <string>
#include <stdexcept>

namespace kccomp {
namespace cli {

/**
 * @brief Read file into byte vector
 */
inline ByteVec read_file(const std::string& filename) {
    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open input file: " + filename);
    }
    return ByteVec(
        std::istreambuf_iterator<char>(file),
        std::istreambuf_iterator<char>()
    );
}

/**
 * @brief Write byte vector to file
 */
inline void write_file(const std::string& filename, const ByteVec& data) {
    std::ofstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open output file: " + filename);
    }
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!file) {
        throw std::runtime_error("Failed to write output file: " + filename);
    }
}

/**
 * @brief Decode a byte-string argument
 *
 * "str:<text>" is taken as UTF-8 text; anything else must be hex.
 */
inline ByteVec parse_bytes_arg(const std::string& value) {
    static const std::string kTextPrefix = "str:";
    if (value.compare(0, kTextPrefix.size(), kTextPrefix) == 0) {
        return stringToBytes(value.substr(kTextPrefix.size()));
    }
    return hexDecode(value);
}

/**
 * @brief Parse a non-negative decimal option value
 */
inline unsigned long parse_count_arg(const std::string& option, const std::string& value) {
    size_t pos = 0;
    unsigned long n = 0;
    try {
        n = std::stoul(value, &pos);
    } catch (const std::logic_error&) {
        throw std::invalid_argument("Invalid number for " + option + ": " + value);
    }
    if (pos != value.size() || value[0] == '-') {
        throw std::invalid_argument("Invalid number for " + option + ": " + value);
    }
    return n;
}

} // namespace cli
} // namespace kccomp

#endif // KCCOMP_CLI_UTILS_H
