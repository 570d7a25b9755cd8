/**
 * @file export.cpp
 * @brief C API: library initialization and exception-free entry points
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include "kccomp/kccomp_api.h"
#include "kccomp/aead/aead.h"
#include "kccomp/core/error.h"
#include "kccomp/core/security.h"
#include "kccomp/engine/digest.h"
#include "kccomp/kdf/kdf.h"

#include <openssl/crypto.h>
#include <openssl/evp.h>

#include <cstring>
#include <new>
#include <stdexcept>
#include <string>

// Global initialization state
static int g_kccomp_initialized = 0;

namespace {

using kccomp::ByteVec;

// Maps the C++ exception taxonomy onto error codes
template <typename Fn>
kccomp_error_t guarded(Fn&& fn) {
    try {
        fn();
        return KCCOMP_SUCCESS;
    } catch (const kccomp::CryptoError& e) {
        return e.code();
    } catch (const std::invalid_argument&) {
        return KCCOMP_ERROR_INVALID_PARAM;
    } catch (const std::out_of_range&) {
        return KCCOMP_ERROR_INVALID_PARAM;
    } catch (const std::bad_alloc&) {
        return KCCOMP_ERROR_MEMORY_ALLOC;
    } catch (const std::exception&) {
        return KCCOMP_ERROR_INTERNAL;
    }
}

bool valid_span(const void* p, size_t len) {
    return p != nullptr || len == 0;
}

ByteVec to_vec(const uint8_t* p, size_t len) {
    return len == 0 ? ByteVec() : ByteVec(p, p + len);
}

kccomp_error_t run_kdf(const kccomp::KdfParams& params, uint8_t* out, size_t out_len) {
    return guarded([&] {
        ByteVec derived = kccomp::kdf::derive(params, out_len);
        if (!derived.empty()) {
            std::memcpy(out, derived.data(), derived.size());
        }
        kccomp::secure_wipe(derived);
    });
}

} // anonymous namespace

extern "C" {

const char* kccomp_version(void) {
    return KCCOMP_VERSION_STRING;
}

const char* kccomp_platform(void) {
    return KCCOMP_PLATFORM_NAME;
}

kccomp_error_t kccomp_init(void) {
    if (g_kccomp_initialized) {
        return KCCOMP_SUCCESS;
    }

    if (OPENSSL_init_crypto(OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr) != 1) {
        return KCCOMP_ERROR_PROVIDER;
    }

    // The default provider has to be reachable for anything else to work
    EVP_MD* probe = EVP_MD_fetch(nullptr, "SHA2-256", nullptr);
    if (probe == nullptr) {
        return KCCOMP_ERROR_PROVIDER;
    }
    EVP_MD_free(probe);

    g_kccomp_initialized = 1;
    return KCCOMP_SUCCESS;
}

void kccomp_cleanup(void) {
    g_kccomp_initialized = 0;
}

const char* kccomp_error_string(kccomp_error_t error) {
    switch (error) {
        case KCCOMP_SUCCESS:
            return "Success";
        case KCCOMP_ERROR_INVALID_PARAM:
            return "Invalid parameter";
        case KCCOMP_ERROR_BUFFER_TOO_SMALL:
            return "Buffer too small";
        case KCCOMP_ERROR_MEMORY_ALLOC:
            return "Memory allocation failed";
        case KCCOMP_ERROR_UNSUPPORTED_ALGORITHM:
            return "Unsupported algorithm";
        case KCCOMP_ERROR_INVALID_KEY_MATERIAL:
            return "Invalid key material";
        case KCCOMP_ERROR_NOT_INITIALIZED:
            return "Engine not initialized";
        case KCCOMP_ERROR_INVALID_PADDING:
            return "Invalid padding";
        case KCCOMP_ERROR_AUTH_FAILED:
            return "Authentication failed";
        case KCCOMP_ERROR_INVALID_LENGTH:
            return "Invalid input length";
        case KCCOMP_ERROR_OUTPUT_LIMIT:
            return "Output limit exceeded";
        case KCCOMP_ERROR_RANDOM_FAILED:
            return "Random generation failed";
        case KCCOMP_ERROR_PROVIDER:
            return "Crypto provider error";
        case KCCOMP_ERROR_INTERNAL:
            return "Internal error";
    }
    return "Unknown error";
}

kccomp_error_t kccomp_digest(const char* algorithm, const uint8_t* data, size_t data_len,
                             uint8_t* out, size_t out_size, size_t* out_len) {
    if (algorithm == nullptr || !valid_span(data, data_len) || out == nullptr || out_len == nullptr) {
        return KCCOMP_ERROR_INVALID_PARAM;
    }

    return guarded([&] {
        const kccomp::DigestAlgorithm alg = kccomp::parse_digest(algorithm);
        const kccomp::DigestInfo& info = kccomp::digest_info(alg);
        if (!info.xof && out_size < info.output_size) {
            throw kccomp::CryptoError(KCCOMP_ERROR_BUFFER_TOO_SMALL, "Digest output buffer too small");
        }
        if (info.xof && out_size == 0) {
            throw std::invalid_argument("SHAKE output length must be non-zero");
        }

        kccomp::Digest md(alg, info.xof ? out_size : 0);
        md.update(data, data_len);
        ByteVec result = md.digest();
        std::memcpy(out, result.data(), result.size());
        *out_len = result.size();
    });
}

kccomp_error_t kccomp_hkdf(const char* digest, const uint8_t* ikm, size_t ikm_len,
                           const uint8_t* salt, size_t salt_len,
                           const uint8_t* info, size_t info_len,
                           uint8_t* out, size_t out_len) {
    if (digest == nullptr || !valid_span(ikm, ikm_len) || !valid_span(salt, salt_len) ||
        !valid_span(info, info_len) || !valid_span(out, out_len)) {
        return KCCOMP_ERROR_INVALID_PARAM;
    }

    kccomp::KdfParams params;
    kccomp::ScopedWipe wipe_key(params.key);
    kccomp_error_t rc = guarded([&] {
        params.algorithm = kccomp::KdfAlgorithm::HKDF;
        params.digest = kccomp::parse_digest(digest);
        params.key = to_vec(ikm, ikm_len);
        params.salt = to_vec(salt, salt_len);
        params.info = to_vec(info, info_len);
    });
    if (rc != KCCOMP_SUCCESS) {
        return rc;
    }
    return run_kdf(params, out, out_len);
}

kccomp_error_t kccomp_pbkdf2(const char* digest, const uint8_t* password, size_t password_len,
                             const uint8_t* salt, size_t salt_len, uint32_t iterations,
                             uint8_t* out, size_t out_len) {
    if (digest == nullptr || !valid_span(password, password_len) || !valid_span(salt, salt_len) ||
        !valid_span(out, out_len) || iterations == 0) {
        return KCCOMP_ERROR_INVALID_PARAM;
    }

    kccomp::KdfParams params;
    kccomp::ScopedWipe wipe_key(params.key);
    kccomp_error_t rc = guarded([&] {
        params.algorithm = kccomp::KdfAlgorithm::PBKDF2;
        params.digest = kccomp::parse_digest(digest);
        params.key = to_vec(password, password_len);
        params.salt = to_vec(salt, salt_len);
        params.iterations = iterations;
    });
    if (rc != KCCOMP_SUCCESS) {
        return rc;
    }
    return run_kdf(params, out, out_len);
}

kccomp_error_t kccomp_aead_encrypt(const char* scheme, const uint8_t* key, size_t key_len,
                                   const uint8_t* iv, size_t iv_len,
                                   const uint8_t* aad, size_t aad_len,
                                   const uint8_t* plaintext, size_t plaintext_len,
                                   uint8_t* out, size_t out_size, size_t* out_len) {
    if (scheme == nullptr || !valid_span(key, key_len) || !valid_span(iv, iv_len) ||
        !valid_span(aad, aad_len) || !valid_span(plaintext, plaintext_len) ||
        out == nullptr || out_len == nullptr) {
        return KCCOMP_ERROR_INVALID_PARAM;
    }

    return guarded([&] {
        ByteVec k = to_vec(key, key_len);
        kccomp::ScopedWipe wipe_key(k);
        const kccomp::AeadScheme s = kccomp::parse_aead_scheme(scheme);
        kccomp::aead::AeadCipher cipher(s, k);

        ByteVec envelope = cipher.encrypt(to_vec(plaintext, plaintext_len), to_vec(iv, iv_len),
                                          to_vec(aad, aad_len));
        if (envelope.size() > out_size) {
            throw kccomp::CryptoError(KCCOMP_ERROR_BUFFER_TOO_SMALL, "AEAD output buffer too small");
        }
        std::memcpy(out, envelope.data(), envelope.size());
        *out_len = envelope.size();
    });
}

kccomp_error_t kccomp_aead_decrypt(const char* scheme, const uint8_t* key, size_t key_len,
                                   const uint8_t* iv, size_t iv_len,
                                   const uint8_t* aad, size_t aad_len,
                                   const uint8_t* envelope, size_t envelope_len,
                                   uint8_t* out, size_t out_size, size_t* out_len) {
    if (scheme == nullptr || !valid_span(key, key_len) || !valid_span(iv, iv_len) ||
        !valid_span(aad, aad_len) || !valid_span(envelope, envelope_len) ||
        out_len == nullptr || !valid_span(out, out_size)) {
        return KCCOMP_ERROR_INVALID_PARAM;
    }

    return guarded([&] {
        ByteVec k = to_vec(key, key_len);
        kccomp::ScopedWipe wipe_key(k);
        const kccomp::AeadScheme s = kccomp::parse_aead_scheme(scheme);
        kccomp::aead::AeadCipher cipher(s, k);

        ByteVec plaintext = cipher.decrypt(to_vec(envelope, envelope_len), to_vec(iv, iv_len),
                                           to_vec(aad, aad_len));
        kccomp::ScopedWipe wipe_pt(plaintext);
        if (plaintext.size() > out_size) {
            throw kccomp::CryptoError(KCCOMP_ERROR_BUFFER_TOO_SMALL, "AEAD output buffer too small");
        }
        if (!plaintext.empty()) {
            std::memcpy(out, plaintext.data(), plaintext.size());
        }
        *out_len = plaintext.size();
    });
}

} // extern "C"
