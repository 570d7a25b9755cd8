/**
 * @file algorithm.cpp
 * @brief Algorithm tables and name parsing
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "kccomp/engine/algorithm.h"
#include "kccomp/core/error.h"
#include "provider.h"

namespace kccomp {

namespace {

// Indexed by DigestAlgorithm
const DigestInfo kDigestTable[] = {
    {"sha1",        "SHA1",         20,  64, false},
    {"sha224",      "SHA2-224",     28,  64, false},
    {"sha256",      "SHA2-256",     32,  64, false},
    {"sha384",      "SHA2-384",     48, 128, false},
    {"sha512",      "SHA2-512",     64, 128, false},
    {"sha512-256",  "SHA2-512/256", 32, 128, false},
    {"sha3-256",    "SHA3-256",     32, 136, false},
    {"sha3-384",    "SHA3-384",     48, 104, false},
    {"sha3-512",    "SHA3-512",     64,  72, false},
    {"blake2b-512", "BLAKE2B-512",  64, 128, false},
    {"blake2s-256", "BLAKE2S-256",  32,  64, false},
    {"shake128",    "SHAKE-128",    32, 168, true},
    {"shake256",    "SHAKE-256",    64, 136, true},
};

struct DigestAlias {
    const char* canonical;
    DigestAlgorithm alg;
};

const DigestAlias kDigestAliases[] = {
    {"sha1",       DigestAlgorithm::SHA1},
    {"sha224",     DigestAlgorithm::SHA224},
    {"sha2224",    DigestAlgorithm::SHA224},
    {"sha256",     DigestAlgorithm::SHA256},
    {"sha2256",    DigestAlgorithm::SHA256},
    {"sha384",     DigestAlgorithm::SHA384},
    {"sha2384",    DigestAlgorithm::SHA384},
    {"sha512",     DigestAlgorithm::SHA512},
    {"sha2512",    DigestAlgorithm::SHA512},
    {"sha512256",  DigestAlgorithm::SHA512_256},
    {"sha2512256", DigestAlgorithm::SHA512_256},
    {"sha3256",    DigestAlgorithm::SHA3_256},
    {"sha3384",    DigestAlgorithm::SHA3_384},
    {"sha3512",    DigestAlgorithm::SHA3_512},
    {"blake2b",    DigestAlgorithm::BLAKE2B_512},
    {"blake2b512", DigestAlgorithm::BLAKE2B_512},
    {"blake2s",    DigestAlgorithm::BLAKE2S_256},
    {"blake2s256", DigestAlgorithm::BLAKE2S_256},
    {"shake128",   DigestAlgorithm::SHAKE128},
    {"shake256",   DigestAlgorithm::SHAKE256},
};

// Indexed by CipherAlgorithm
const CipherInfo kCipherTable[] = {
    {"aes128",   "AES-128-ECB", KCCOMP_AES_128_KEY_SIZE,  KCCOMP_AES_BLOCK_SIZE, 0},
    {"aes192",   "AES-192-ECB", KCCOMP_AES_192_KEY_SIZE,  KCCOMP_AES_BLOCK_SIZE, 0},
    {"aes256",   "AES-256-ECB", KCCOMP_AES_256_KEY_SIZE,  KCCOMP_AES_BLOCK_SIZE, 0},
    // IV = 32-bit little-endian block counter || 96-bit nonce
    {"chacha20", "ChaCha20",    KCCOMP_CHACHA20_KEY_SIZE, 1, 4 + KCCOMP_CHACHA20_NONCE_SIZE},
};

} // anonymous namespace

// ============================================================================
// Digests
// ============================================================================

const DigestInfo& digest_info(DigestAlgorithm alg) {
    return kDigestTable[static_cast<size_t>(alg)];
}

DigestAlgorithm parse_digest(const std::string& name) {
    const std::string key = internal::canonical_name(name);
    for (const auto& alias : kDigestAliases) {
        if (key == alias.canonical) {
            return alias.alg;
        }
    }
    throw UnsupportedAlgorithm("Unsupported digest: " + name);
}

// ============================================================================
// Ciphers
// ============================================================================

const CipherInfo& cipher_info(CipherAlgorithm alg) {
    return kCipherTable[static_cast<size_t>(alg)];
}

CipherAlgorithm parse_cipher_algorithm(const std::string& name) {
    const std::string key = internal::canonical_name(name);
    if (key == "aes128") return CipherAlgorithm::AES128;
    if (key == "aes192") return CipherAlgorithm::AES192;
    if (key == "aes256") return CipherAlgorithm::AES256;
    if (key == "chacha20") return CipherAlgorithm::CHACHA20;
    throw UnsupportedAlgorithm("Unsupported cipher: " + name);
}

const char* mode_name(CipherMode mode) {
    switch (mode) {
        case CipherMode::CBC: return "cbc";
        case CipherMode::CTR: return "ctr";
        case CipherMode::OFB: return "ofb";
        case CipherMode::GCM: return "gcm";
        case CipherMode::STREAM: return "stream";
    }
    return "unknown";
}

CipherSpec CipherSpec::parse(const std::string& name) {
    CipherSpec spec;
    const size_t dash = name.rfind('-');
    std::string mode = dash == std::string::npos
        ? std::string()
        : internal::canonical_name(name.substr(dash + 1));

    if (mode == "cbc") {
        spec.mode = CipherMode::CBC;
    } else if (mode == "ctr" || mode == "sic") {
        spec.mode = CipherMode::CTR;
    } else if (mode == "ofb") {
        spec.mode = CipherMode::OFB;
    } else if (mode == "gcm") {
        spec.mode = CipherMode::GCM;
    } else {
        // No mode suffix: only a stream cipher stands alone
        spec.algorithm = parse_cipher_algorithm(name);
        spec.mode = CipherMode::STREAM;
        spec.validate();
        return spec;
    }

    spec.algorithm = parse_cipher_algorithm(name.substr(0, dash));
    spec.validate();
    return spec;
}

void CipherSpec::validate() const {
    const bool stream = cipher_info(algorithm).block_size == 1;
    if (stream != (mode == CipherMode::STREAM)) {
        throw UnsupportedAlgorithm(std::string("Cipher ") + cipher_info(algorithm).name +
                                   " cannot be used in " + mode_name(mode) + " mode");
    }
}

std::string CipherSpec::name() const {
    if (mode == CipherMode::STREAM) {
        return cipher_info(algorithm).name;
    }
    return std::string(cipher_info(algorithm).name) + "-" + mode_name(mode);
}

// ============================================================================
// MACs
// ============================================================================

MacSpec MacSpec::parse(const std::string& name) {
    const std::string key = internal::canonical_name(name);
    MacSpec spec;

    if (key == "poly1305") {
        spec = poly1305();
    } else if (key.compare(0, 4, "hmac") == 0) {
        spec = hmac(parse_digest(key.substr(4)));
    } else if (key.compare(0, 4, "cmac") == 0) {
        spec = cmac(parse_cipher_algorithm(key.substr(4)));
    } else if (key.compare(0, 4, "gmac") == 0) {
        spec = gmac(parse_cipher_algorithm(key.substr(4)));
    } else {
        throw UnsupportedAlgorithm("Unsupported MAC: " + name);
    }

    spec.validate();
    return spec;
}

void MacSpec::validate() const {
    switch (algorithm) {
        case MacAlgorithm::HMAC:
            if (digest_info(digest).xof) {
                throw UnsupportedAlgorithm(std::string("HMAC requires a fixed-size digest, got ") +
                                           digest_info(digest).name);
            }
            break;
        case MacAlgorithm::CMAC:
        case MacAlgorithm::GMAC:
            if (cipher == CipherAlgorithm::CHACHA20) {
                throw UnsupportedAlgorithm("CMAC/GMAC require a block cipher");
            }
            break;
        case MacAlgorithm::POLY1305:
            break;
    }
}

std::string MacSpec::name() const {
    switch (algorithm) {
        case MacAlgorithm::HMAC:
            return std::string("hmac-") + digest_info(digest).name;
        case MacAlgorithm::CMAC:
            return std::string("cmac-") + cipher_info(cipher).name;
        case MacAlgorithm::GMAC:
            return std::string("gmac-") + cipher_info(cipher).name;
        case MacAlgorithm::POLY1305:
            return "poly1305";
    }
    return "unknown";
}

} // namespace kccomp
