/**
 * @file digest_kdf.cpp
 * @brief Digest-based KDFs: HKDF, KDF1/KDF2 and PBKDF2
 *
 * Reference:
 * - RFC 5869 (HKDF)
 * - ISO/IEC 18033-2 (KDF1, KDF2)
 * - RFC 8018 section 5.2 (PBKDF2)
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "kccomp/kdf/kdf.h"
#include "kccomp/core/error.h"
#include "kccomp/core/security.h"
#include "kccomp/utils/byte_order.h"

#include <algorithm>
#include <stdexcept>

namespace kccomp {
namespace kdf {

namespace {

constexpr unsigned kHkdfMaxRounds = 255;
constexpr uint64_t kMaxCounter32 = 0xFFFFFFFFULL;

void require_key(const ByteVec& key, KdfAlgorithm alg) {
    if (key.empty()) {
        throw InvalidKeyMaterial(std::string(kdf_name(alg)) + " requires a non-empty key");
    }
}

} // anonymous namespace

// ============================================================================
// HKDF
// ============================================================================

HkdfEngine::HkdfEngine(DigestAlgorithm digest, const ByteVec& key, const ByteVec& salt,
                       const ByteVec& info)
    : expand_(MacSpec::hmac(digest)), info_(info) {
    require_key(key, KdfAlgorithm::HKDF);

    // Extract: PRK = HMAC(salt, IKM); absent salt is HashLen zeros
    Mac extract(MacSpec::hmac(digest));
    if (salt.empty()) {
        extract.init(ByteVec(extract.macSize(), 0x00));
    } else {
        extract.init(salt);
    }
    extract.update(key);

    ByteVec prk = extract.final();
    ScopedWipe wipe_prk(prk);
    expand_.init(prk);
}

HkdfEngine::~HkdfEngine() {
    secure_wipe(prev_);
}

ByteVec HkdfEngine::nextBlock() {
    if (counter_ > kHkdfMaxRounds) {
        throw OutputLimitExceeded("HKDF output limited to 255 rounds");
    }

    const uint8_t counter = static_cast<uint8_t>(counter_);
    expand_.reset();
    expand_.update(prev_);
    expand_.update(info_);
    expand_.update(&counter, 1);

    ByteVec block = expand_.final();
    secure_wipe(prev_);
    prev_ = block;
    counter_++;
    return block;
}

// ============================================================================
// KDF1 / KDF2
// ============================================================================

DigestCounterKdf::DigestCounterKdf(KdfAlgorithm alg, DigestAlgorithm digest,
                                   const ByteVec& key, const ByteVec& shared_info)
    : alg_(alg), digest_(digest), key_(key), shared_info_(shared_info),
      counter_(alg == KdfAlgorithm::KDF1 ? 0 : 1) {
    if (alg != KdfAlgorithm::KDF1 && alg != KdfAlgorithm::KDF2) {
        throw std::invalid_argument("DigestCounterKdf implements KDF1 and KDF2 only");
    }
    if (digest_info(digest).xof) {
        throw UnsupportedAlgorithm(std::string(kdf_name(alg)) +
                                   " requires a fixed-size digest");
    }
    require_key(key_, alg);
}

DigestCounterKdf::~DigestCounterKdf() {
    secure_wipe(key_);
}

ByteVec DigestCounterKdf::nextBlock() {
    if (counter_ > kMaxCounter32) {
        throw OutputLimitExceeded(std::string(kdf_name(alg_)) + " counter exhausted");
    }

    uint8_t be[4];
    byte_order::store_be32(be, static_cast<uint32_t>(counter_));

    digest_.reset();
    digest_.update(key_);
    digest_.update(be, sizeof(be));
    digest_.update(shared_info_);
    counter_++;
    return digest_.digest();
}

// ============================================================================
// PBKDF2
// ============================================================================

Pbkdf2Engine::Pbkdf2Engine(DigestAlgorithm digest, const ByteVec& password,
                           const ByteVec& salt, uint32_t iterations)
    : prf_(MacSpec::hmac(digest)), salt_(salt), iterations_(iterations) {
    require_key(password, KdfAlgorithm::PBKDF2);
    if (iterations == 0) {
        throw std::invalid_argument("PBKDF2 iteration count must be at least 1");
    }
    prf_.init(password);
}

ByteVec Pbkdf2Engine::getBytes(size_t n) {
    const size_t h_len = prf_.macSize();
    if (n / h_len >= kMaxCounter32) {
        throw OutputLimitExceeded("PBKDF2 derived key too long");
    }

    ByteVec out;
    out.reserve(n);

    for (uint32_t block = 1; out.size() < n; block++) {
        uint8_t be[4];
        byte_order::store_be32(be, block);

        // U1 = PRF(P, S || INT(i))
        prf_.reset();
        prf_.update(salt_);
        prf_.update(be, sizeof(be));
        ByteVec u = prf_.final();
        ByteVec t = u;
        ScopedWipe wipe_u(u);
        ScopedWipe wipe_t(t);

        // Uj = PRF(P, Uj-1), T = U1 ^ ... ^ Uc
        for (uint32_t j = 1; j < iterations_; j++) {
            prf_.reset();
            prf_.update(u);
            ByteVec next = prf_.final();
            for (size_t k = 0; k < h_len; k++) {
                t[k] ^= next[k];
            }
            secure_wipe(u);
            u.swap(next);
        }

        const size_t take = std::min(h_len, n - out.size());
        out.insert(out.end(), t.begin(), t.begin() + static_cast<std::ptrdiff_t>(take));
    }

    return out;
}

} // namespace kdf
} // namespace kccomp
