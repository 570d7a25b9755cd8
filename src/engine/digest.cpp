/**
 * @file digest.cpp
 * @brief Digest engine over OpenSSL EVP_MD
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "kccomp/engine/digest.h"
#include "kccomp/core/error.h"
#include "provider.h"

#include <new>
#include <stdexcept>

namespace kccomp {

struct Digest::Impl {
    internal::EvpMdPtr md;
    internal::EvpMdCtxPtr ctx;
};

Digest::Digest(DigestAlgorithm alg, size_t output_size)
    : impl_(new Impl), alg_(alg), output_size_(digest_info(alg).output_size) {
    const DigestInfo& info = digest_info(alg);
    if (output_size != 0) {
        if (!info.xof && output_size != info.output_size) {
            throw std::invalid_argument(std::string("Output size is fixed for ") + info.name);
        }
        output_size_ = output_size;
    }

    impl_->md.reset(EVP_MD_fetch(nullptr, info.provider_name, nullptr));
    if (!impl_->md) {
        throw UnsupportedAlgorithm(std::string("Digest not available from provider: ") + info.name);
    }
    impl_->ctx.reset(EVP_MD_CTX_new());
    if (!impl_->ctx) {
        throw std::bad_alloc();
    }
    reset();
}

Digest::~Digest() = default;
Digest::Digest(Digest&&) noexcept = default;
Digest& Digest::operator=(Digest&&) noexcept = default;

void Digest::update(const uint8_t* data, size_t len) {
    if (!impl_ || finalized_) {
        throw EngineNotInitialized("Digest already finalized; call reset()");
    }
    if (len == 0) {
        return;
    }
    if (EVP_DigestUpdate(impl_->ctx.get(), data, len) != 1) {
        internal::throw_provider_error("EVP_DigestUpdate failed");
    }
}

void Digest::update(const std::string& data) {
    update(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

ByteVec Digest::digest() {
    if (!impl_ || finalized_) {
        throw EngineNotInitialized("Digest already finalized; call reset()");
    }

    ByteVec out(output_size_);
    int ok;
    if (digest_info(alg_).xof) {
        ok = EVP_DigestFinalXOF(impl_->ctx.get(), out.data(), out.size());
    } else {
        unsigned int len = 0;
        ok = EVP_DigestFinal_ex(impl_->ctx.get(), out.data(), &len);
    }
    finalized_ = true;
    if (ok != 1) {
        internal::throw_provider_error("Digest finalization failed");
    }
    return out;
}

void Digest::reset() {
    if (!impl_) {
        throw EngineNotInitialized("Digest has been moved from");
    }
    if (EVP_DigestInit_ex2(impl_->ctx.get(), impl_->md.get(), nullptr) != 1) {
        internal::throw_provider_error("EVP_DigestInit_ex2 failed");
    }
    finalized_ = false;
}

ByteVec digest(DigestAlgorithm alg, const ByteVec& data) {
    Digest d(alg);
    d.update(data);
    return d.digest();
}

ByteVec digest(DigestAlgorithm alg, const DataSource& source) {
    Digest d(alg);
    d.update(source);
    return d.digest();
}

} // namespace kccomp
