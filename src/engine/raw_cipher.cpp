/**
 * @file raw_cipher.cpp
 * @brief Raw block / stream transform over OpenSSL EVP_CIPHER
 *
 * AES is driven as ECB with padding disabled, one block per call.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "kccomp/engine/raw_cipher.h"
#include "kccomp/core/error.h"
#include "provider.h"

#include <climits>
#include <new>
#include <string>

namespace kccomp {

struct RawCipher::Impl {
    internal::EvpCipherPtr cipher;
    internal::EvpCipherCtxPtr ctx;
    ByteVec iv;     ///< retained so reset() can rewind a stream cipher
};

RawCipher::RawCipher(CipherAlgorithm alg) : impl_(new Impl), alg_(alg) {
    const CipherInfo& info = cipher_info(alg);
    impl_->cipher.reset(EVP_CIPHER_fetch(nullptr, info.provider_name, nullptr));
    if (!impl_->cipher) {
        throw UnsupportedAlgorithm(std::string("Cipher not available from provider: ") + info.name);
    }
    impl_->ctx.reset(EVP_CIPHER_CTX_new());
    if (!impl_->ctx) {
        throw std::bad_alloc();
    }
}

RawCipher::~RawCipher() = default;
RawCipher::RawCipher(RawCipher&&) noexcept = default;
RawCipher& RawCipher::operator=(RawCipher&&) noexcept = default;

void RawCipher::init(const uint8_t* key, size_t key_len, const uint8_t* iv, size_t iv_len,
                     CipherDirection direction) {
    if (!impl_) {
        throw EngineNotInitialized("RawCipher has been moved from");
    }
    const CipherInfo& info = cipher_info(alg_);
    if (key == nullptr || key_len != info.key_size) {
        throw InvalidKeyMaterial(std::string(info.name) + " requires a " +
                                 std::to_string(info.key_size) + "-byte key");
    }
    if (iv_len != info.iv_size || (iv_len > 0 && iv == nullptr)) {
        throw InvalidKeyMaterial(std::string(info.name) + " requires a " +
                                 std::to_string(info.iv_size) + "-byte IV");
    }

    ready_ = false;
    impl_->iv.assign(iv, iv + iv_len);
    const int enc = direction == CipherDirection::Encrypt ? 1 : 0;
    if (EVP_CipherInit_ex2(impl_->ctx.get(), impl_->cipher.get(), key,
                           iv_len > 0 ? impl_->iv.data() : nullptr, enc, nullptr) != 1) {
        internal::throw_provider_error(std::string("Cipher init failed for ") + info.name);
    }
    EVP_CIPHER_CTX_set_padding(impl_->ctx.get(), 0);
    direction_ = direction;
    ready_ = true;
}

void RawCipher::transform(const uint8_t* in, size_t len, uint8_t* out) {
    if (!impl_ || !ready_) {
        throw EngineNotInitialized(std::string(cipher_info(alg_).name) + " is not initialized");
    }
    while (len > 0) {
        int chunk = len > static_cast<size_t>(INT_MAX / 2) ? INT_MAX / 2 : static_cast<int>(len);
        int out_len = 0;
        if (EVP_CipherUpdate(impl_->ctx.get(), out, &out_len, in, chunk) != 1 ||
            out_len != chunk) {
            internal::throw_provider_error("EVP_CipherUpdate failed");
        }
        in += chunk;
        out += chunk;
        len -= static_cast<size_t>(chunk);
    }
}

void RawCipher::processBlock(const uint8_t* in, uint8_t* out) {
    if (isStream()) {
        throw UnsupportedAlgorithm(std::string(cipher_info(alg_).name) +
                                   " is a stream cipher; use processBytes()");
    }
    transform(in, blockSize(), out);
}

ByteVec RawCipher::processBlock(const ByteVec& in) {
    if (in.size() != blockSize()) {
        throw InvalidInputLength("processBlock requires exactly one block");
    }
    ByteVec out(in.size());
    processBlock(in.data(), out.data());
    return out;
}

void RawCipher::processBytes(const uint8_t* in, size_t len, uint8_t* out) {
    if (!isStream()) {
        throw UnsupportedAlgorithm(std::string(cipher_info(alg_).name) +
                                   " is a block cipher; use processBlock()");
    }
    transform(in, len, out);
}

ByteVec RawCipher::processBytes(const ByteVec& in) {
    ByteVec out(in.size());
    processBytes(in.data(), in.size(), out.data());
    return out;
}

void RawCipher::reset() {
    if (!impl_ || !ready_) {
        throw EngineNotInitialized(std::string(cipher_info(alg_).name) + " is not initialized");
    }
    // Key schedule is kept by the context; only the IV state is rewound
    if (EVP_CipherInit_ex2(impl_->ctx.get(), nullptr, nullptr,
                           impl_->iv.empty() ? nullptr : impl_->iv.data(), -1, nullptr) != 1) {
        internal::throw_provider_error("Cipher reset failed");
    }
}

} // namespace kccomp
