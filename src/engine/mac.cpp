/**
 * @file mac.cpp
 * @brief MAC engine over OpenSSL EVP_MAC (HMAC, CMAC, GMAC, Poly1305)
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "kccomp/engine/mac.h"
#include "kccomp/core/error.h"
#include "kccomp/core/security.h"
#include "provider.h"

#include <openssl/core_names.h>
#include <openssl/params.h>

#include <new>
#include <stdexcept>

namespace kccomp {

namespace {

constexpr size_t kBlockMacSize = 16;

const char* provider_mac_name(MacAlgorithm alg) {
    switch (alg) {
        case MacAlgorithm::HMAC: return "HMAC";
        case MacAlgorithm::CMAC: return "CMAC";
        case MacAlgorithm::GMAC: return "GMAC";
        case MacAlgorithm::POLY1305: return "POLY1305";
    }
    return "";
}

// CMAC runs over CBC, GMAC over GCM
std::string provider_cipher_name(MacAlgorithm alg, CipherAlgorithm cipher) {
    const size_t bits = cipher_info(cipher).key_size * 8;
    return "AES-" + std::to_string(bits) + (alg == MacAlgorithm::GMAC ? "-GCM" : "-CBC");
}

} // anonymous namespace

struct Mac::Impl {
    internal::EvpMacPtr mac;
    internal::EvpMacCtxPtr ctx;
    std::string param_name;     ///< digest or cipher name handed to the provider
    ByteVec key;                ///< kept for reset(); wiped on destruction
    ByteVec iv;

    ~Impl() {
        secure_wipe(key);
    }
};

Mac::Mac(const MacSpec& spec) : impl_(new Impl), spec_(spec), mac_size_(kBlockMacSize) {
    spec_.validate();

    switch (spec_.algorithm) {
        case MacAlgorithm::HMAC:
            impl_->param_name = digest_info(spec_.digest).provider_name;
            mac_size_ = digest_info(spec_.digest).output_size;
            break;
        case MacAlgorithm::CMAC:
        case MacAlgorithm::GMAC:
            impl_->param_name = provider_cipher_name(spec_.algorithm, spec_.cipher);
            break;
        case MacAlgorithm::POLY1305:
            break;
    }

    impl_->mac.reset(EVP_MAC_fetch(nullptr, provider_mac_name(spec_.algorithm), nullptr));
    if (!impl_->mac) {
        throw UnsupportedAlgorithm("MAC not available from provider: " + spec_.name());
    }
    impl_->ctx.reset(EVP_MAC_CTX_new(impl_->mac.get()));
    if (!impl_->ctx) {
        throw std::bad_alloc();
    }
}

Mac::~Mac() = default;
Mac::Mac(Mac&&) noexcept = default;
Mac& Mac::operator=(Mac&&) noexcept = default;

void Mac::init(const uint8_t* key, size_t key_len, const uint8_t* iv, size_t iv_len) {
    if (!impl_) {
        throw EngineNotInitialized("MAC has been moved from");
    }
    if (key == nullptr && key_len > 0) {
        throw std::invalid_argument("MAC key pointer is null");
    }

    switch (spec_.algorithm) {
        case MacAlgorithm::HMAC:
            break;
        case MacAlgorithm::CMAC:
        case MacAlgorithm::GMAC:
            if (key_len != cipher_info(spec_.cipher).key_size) {
                throw InvalidKeyMaterial(spec_.name() + " requires a " +
                                         std::to_string(cipher_info(spec_.cipher).key_size) +
                                         "-byte key");
            }
            break;
        case MacAlgorithm::POLY1305:
            if (key_len != KCCOMP_POLY1305_KEY_SIZE) {
                throw InvalidKeyMaterial("poly1305 requires a 32-byte key");
            }
            break;
    }

    if (spec_.algorithm == MacAlgorithm::GMAC) {
        if (iv == nullptr || iv_len == 0) {
            throw InvalidKeyMaterial("GMAC requires a non-empty IV");
        }
    } else if (iv_len != 0) {
        throw InvalidKeyMaterial(spec_.name() + " does not take an IV");
    }

    secure_wipe(impl_->key);
    impl_->key.assign(key, key + key_len);
    impl_->iv.assign(iv, iv + iv_len);
    keyed_ = true;
    rekey();
}

void Mac::rekey() {
    OSSL_PARAM params[3];
    size_t n = 0;

    switch (spec_.algorithm) {
        case MacAlgorithm::HMAC:
            params[n++] = OSSL_PARAM_construct_utf8_string(OSSL_MAC_PARAM_DIGEST,
                                                           &impl_->param_name[0], 0);
            break;
        case MacAlgorithm::CMAC:
            params[n++] = OSSL_PARAM_construct_utf8_string(OSSL_MAC_PARAM_CIPHER,
                                                           &impl_->param_name[0], 0);
            break;
        case MacAlgorithm::GMAC:
            params[n++] = OSSL_PARAM_construct_utf8_string(OSSL_MAC_PARAM_CIPHER,
                                                           &impl_->param_name[0], 0);
            params[n++] = OSSL_PARAM_construct_octet_string(OSSL_MAC_PARAM_IV,
                                                            impl_->iv.data(), impl_->iv.size());
            break;
        case MacAlgorithm::POLY1305:
            break;
    }
    params[n] = OSSL_PARAM_construct_end();

    // An empty HMAC key still has to be passed as a key, not as "keep old key"
    static const uint8_t kEmptyKey = 0;
    const uint8_t* key = impl_->key.empty() ? &kEmptyKey : impl_->key.data();

    ready_ = false;
    if (EVP_MAC_init(impl_->ctx.get(), key, impl_->key.size(), params) != 1) {
        internal::throw_provider_error("EVP_MAC_init failed for " + spec_.name());
    }
    ready_ = true;
}

void Mac::update(const uint8_t* data, size_t len) {
    if (!impl_ || !ready_) {
        throw EngineNotInitialized(spec_.name() + " is not initialized; call init() or reset()");
    }
    if (len == 0) {
        return;
    }
    if (EVP_MAC_update(impl_->ctx.get(), data, len) != 1) {
        internal::throw_provider_error("EVP_MAC_update failed");
    }
}

void Mac::update(const std::string& data) {
    update(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

void Mac::update(const ByteVec& data, size_t offset, size_t length) {
    if (offset > data.size() || length > data.size() - offset) {
        throw std::out_of_range("MAC input window exceeds buffer");
    }
    update(data.data() + offset, length);
}

ByteVec Mac::final() {
    if (!impl_ || !ready_) {
        throw EngineNotInitialized(spec_.name() + " is not initialized; call init() or reset()");
    }

    ByteVec out(mac_size_);
    size_t out_len = 0;
    ready_ = false;
    if (EVP_MAC_final(impl_->ctx.get(), out.data(), &out_len, out.size()) != 1) {
        internal::throw_provider_error("EVP_MAC_final failed");
    }
    out.resize(out_len);
    return out;
}

void Mac::reset() {
    if (!impl_ || !keyed_) {
        throw EngineNotInitialized(spec_.name() + " has no key; call init()");
    }
    rekey();
}

ByteVec mac(const MacSpec& spec, const ByteVec& key, const ByteVec& data) {
    Mac m(spec);
    m.init(key);
    m.update(data);
    return m.final();
}

ByteVec hmac(DigestAlgorithm digest, const ByteVec& key, const ByteVec& data) {
    return mac(MacSpec::hmac(digest), key, data);
}

} // namespace kccomp
