/**
 * @file kdf.cpp
 * @brief KDF factory, names and the buffered keystream base
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "kccomp/kdf/kdf.h"
#include "kccomp/core/error.h"
#include "kccomp/core/security.h"
#include "engine/provider.h"

#include <algorithm>

namespace kccomp {

const char* kdf_name(KdfAlgorithm alg) {
    switch (alg) {
        case KdfAlgorithm::HKDF: return "hkdf";
        case KdfAlgorithm::KDF1: return "kdf1";
        case KdfAlgorithm::KDF2: return "kdf2";
        case KdfAlgorithm::CMKDF: return "cmkdf";
        case KdfAlgorithm::FMKDF: return "fmkdf";
        case KdfAlgorithm::DPIMKDF: return "dpimkdf";
        case KdfAlgorithm::PBKDF2: return "pbkdf2";
    }
    return "unknown";
}

KdfAlgorithm parse_kdf(const std::string& name) {
    const std::string key = internal::canonical_name(name);
    if (key == "hkdf") return KdfAlgorithm::HKDF;
    if (key == "kdf1") return KdfAlgorithm::KDF1;
    if (key == "kdf2") return KdfAlgorithm::KDF2;
    if (key == "cmkdf" || key == "counter") return KdfAlgorithm::CMKDF;
    if (key == "fmkdf" || key == "feedback") return KdfAlgorithm::FMKDF;
    if (key == "dpimkdf" || key == "doublepipeline") return KdfAlgorithm::DPIMKDF;
    if (key == "pbkdf2") return KdfAlgorithm::PBKDF2;
    throw UnsupportedAlgorithm("Unsupported KDF: " + name);
}

namespace kdf {

// ============================================================================
// StreamingKdf
// ============================================================================

StreamingKdf::~StreamingKdf() {
    secure_wipe(pending_);
}

ByteVec StreamingKdf::getBytes(size_t n) {
    ByteVec out;
    out.reserve(n);

    while (out.size() < n) {
        if (pending_pos_ == pending_.size()) {
            ByteVec block;
            try {
                block = nextBlock();
            } catch (const CryptoError&) {
                // Hand back what this call already took so the next call sees it first
                secure_wipe(pending_);
                pending_.swap(out);
                pending_pos_ = 0;
                throw;
            }
            if (block.empty()) {
                throw ProviderError(std::string(kdf_name(algorithm())) + " produced an empty round");
            }
            secure_wipe(pending_);
            pending_.swap(block);
            pending_pos_ = 0;
        }

        const size_t take = std::min(n - out.size(), pending_.size() - pending_pos_);
        out.insert(out.end(),
                   pending_.begin() + static_cast<std::ptrdiff_t>(pending_pos_),
                   pending_.begin() + static_cast<std::ptrdiff_t>(pending_pos_ + take));
        pending_pos_ += take;
    }

    return out;
}

// ============================================================================
// Factory
// ============================================================================

std::unique_ptr<KdfEngine> make_kdf(const KdfParams& params) {
    switch (params.algorithm) {
        case KdfAlgorithm::HKDF:
            return std::unique_ptr<KdfEngine>(
                new HkdfEngine(params.digest, params.key, params.salt, params.info));
        case KdfAlgorithm::KDF1:
        case KdfAlgorithm::KDF2:
            return std::unique_ptr<KdfEngine>(
                new DigestCounterKdf(params.algorithm, params.digest, params.key, params.salt));
        case KdfAlgorithm::CMKDF:
            return std::unique_ptr<KdfEngine>(new CounterModeKdf(params));
        case KdfAlgorithm::FMKDF:
            return std::unique_ptr<KdfEngine>(new FeedbackModeKdf(params));
        case KdfAlgorithm::DPIMKDF:
            return std::unique_ptr<KdfEngine>(new DoublePipelineKdf(params));
        case KdfAlgorithm::PBKDF2:
            return std::unique_ptr<KdfEngine>(
                new Pbkdf2Engine(params.digest, params.key, params.salt, params.iterations));
    }
    throw UnsupportedAlgorithm("Unsupported KDF");
}

ByteVec derive(const KdfParams& params, size_t n) {
    return make_kdf(params)->getBytes(n);
}

} // namespace kdf
} // namespace kccomp
