/**
 * @file algorithm.h
 * @brief Algorithm identifiers and their fixed size tables
 *
 * Every identifier maps to exactly one (key size, IV size, block size,
 * output/tag size) tuple. Textual names ("sha256", "hmac-sha256",
 * "cmac-aes128", "aes128-cbc") parse to identifiers; an unknown name or an
 * invalid pairing raises UnsupportedAlgorithm.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef KCCOMP_ENGINE_ALGORITHM_H
#define KCCOMP_ENGINE_ALGORITHM_H

#include "kccomp/core/common.h"

#include <cstddef>
#include <string>

namespace kccomp {

// ============================================================================
// Digests
// ============================================================================

enum class DigestAlgorithm {
    SHA1,
    SHA224,
    SHA256,
    SHA384,
    SHA512,
    SHA512_256,
    SHA3_256,
    SHA3_384,
    SHA3_512,
    BLAKE2B_512,
    BLAKE2S_256,
    SHAKE128,       ///< XOF, caller-chosen output size
    SHAKE256        ///< XOF, caller-chosen output size
};

struct DigestInfo {
    const char* name;           ///< kccomp name, e.g. "sha256"
    const char* provider_name;  ///< OpenSSL fetch name, e.g. "SHA2-256"
    size_t output_size;         ///< default output size for XOFs
    size_t block_size;
    bool xof;
};

KCCOMP_API const DigestInfo& digest_info(DigestAlgorithm alg);
KCCOMP_API DigestAlgorithm parse_digest(const std::string& name);

// ============================================================================
// Ciphers
// ============================================================================

enum class CipherAlgorithm {
    AES128,
    AES192,
    AES256,
    CHACHA20
};

enum class CipherMode {
    CBC,
    CTR,        ///< SIC: full-width big-endian counter block
    OFB,
    GCM,
    STREAM      ///< native stream cipher (ChaCha20)
};

struct CipherInfo {
    const char* name;           ///< "aes128", "chacha20"
    const char* provider_name;  ///< raw transform fetched from OpenSSL
    size_t key_size;
    size_t block_size;          ///< 1 for stream ciphers
    size_t iv_size;             ///< raw transform IV (0 for ECB)
};

KCCOMP_API const CipherInfo& cipher_info(CipherAlgorithm alg);
KCCOMP_API CipherAlgorithm parse_cipher_algorithm(const std::string& name);
KCCOMP_API const char* mode_name(CipherMode mode);

/**
 * @brief A validated (cipher, mode) pairing
 */
struct CipherSpec {
    CipherAlgorithm algorithm = CipherAlgorithm::AES128;
    CipherMode mode = CipherMode::CBC;

    /**
     * @brief Parse "aes128-cbc", "aes256-gcm", "chacha20", ...
     * @throws UnsupportedAlgorithm
     */
    static CipherSpec parse(const std::string& name);

    /**
     * @throws UnsupportedAlgorithm for AES in STREAM mode or ChaCha20 in a block mode
     */
    void validate() const;

    std::string name() const;
};

// ============================================================================
// MACs
// ============================================================================

enum class MacAlgorithm {
    HMAC,
    CMAC,
    GMAC,
    POLY1305
};

/**
 * @brief MAC kind plus the primitive it is built over
 *
 * HMAC uses `digest`; CMAC and GMAC use `cipher`; Poly1305 uses neither.
 */
struct MacSpec {
    MacAlgorithm algorithm = MacAlgorithm::HMAC;
    DigestAlgorithm digest = DigestAlgorithm::SHA256;
    CipherAlgorithm cipher = CipherAlgorithm::AES128;

    static MacSpec hmac(DigestAlgorithm d) {
        MacSpec s;
        s.algorithm = MacAlgorithm::HMAC;
        s.digest = d;
        return s;
    }
    static MacSpec cmac(CipherAlgorithm c) {
        MacSpec s;
        s.algorithm = MacAlgorithm::CMAC;
        s.cipher = c;
        return s;
    }
    static MacSpec gmac(CipherAlgorithm c) {
        MacSpec s;
        s.algorithm = MacAlgorithm::GMAC;
        s.cipher = c;
        return s;
    }
    static MacSpec poly1305() {
        MacSpec s;
        s.algorithm = MacAlgorithm::POLY1305;
        return s;
    }

    /**
     * @brief Parse "hmac-sha256", "cmac-aes128", "gmac-aes256", "poly1305"
     * @throws UnsupportedAlgorithm
     */
    static MacSpec parse(const std::string& name);

    /**
     * @throws UnsupportedAlgorithm for HMAC over an XOF or CMAC/GMAC over ChaCha20
     */
    void validate() const;

    std::string name() const;
};

} // namespace kccomp

#endif // KCCOMP_ENGINE_ALGORITHM_H
