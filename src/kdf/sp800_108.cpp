/**
 * @file sp800_108.cpp
 * @brief NIST SP 800-108 KDFs in counter, feedback and double-pipeline mode
 *
 * The fixed input is label || context, followed by the 32-bit big-endian
 * [L] field. Counter mode always carries [L]; the feedback and
 * double-pipeline modes carry it when length_bits is non-zero. Callers
 * wanting the 0x00 separator of the standard's example layout append it to
 * the label.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "kccomp/kdf/kdf.h"
#include "kccomp/core/error.h"
#include "kccomp/core/security.h"
#include "kccomp/utils/byte_order.h"

#include <stdexcept>

namespace kccomp {
namespace kdf {

namespace {

const MacSpec& checked_prf(const MacSpec& prf) {
    if (prf.algorithm == MacAlgorithm::GMAC || prf.algorithm == MacAlgorithm::POLY1305) {
        throw UnsupportedAlgorithm(prf.name() + " cannot serve as an SP 800-108 PRF");
    }
    return prf;
}

size_t checked_counter_bytes(size_t counter_bits) {
    if (counter_bits != 8 && counter_bits != 16 && counter_bits != 24 && counter_bits != 32) {
        throw std::invalid_argument("SP 800-108 counter width must be 8, 16, 24 or 32 bits");
    }
    return counter_bits / 8;
}

} // anonymous namespace

// ============================================================================
// Common state
// ============================================================================

Sp800108Kdf::Sp800108Kdf(KdfAlgorithm alg, const KdfParams& params)
    : alg_(alg),
      prf_(checked_prf(params.prf)),
      counter_bytes_(checked_counter_bytes(params.counter_bits)),
      counter_max_((uint64_t(1) << params.counter_bits) - 1) {
    if (params.key.empty()) {
        throw InvalidKeyMaterial(std::string(kdf_name(alg)) + " requires a non-empty key");
    }
    if (alg == KdfAlgorithm::CMKDF && params.length_bits == 0) {
        throw std::invalid_argument("cmkdf requires the output length field (length_bits)");
    }
    prf_.init(params.key);

    fixed_input_ = params.label;
    fixed_input_.insert(fixed_input_.end(), params.context.begin(), params.context.end());
    if (params.length_bits != 0) {
        uint8_t be[4];
        byte_order::store_be32(be, params.length_bits);
        fixed_input_.insert(fixed_input_.end(), be, be + sizeof(be));
    }
}

void Sp800108Kdf::checkCounter() const {
    if (counter_ > counter_max_) {
        throw OutputLimitExceeded(std::string(kdf_name(alg_)) + " counter exhausted");
    }
}

void Sp800108Kdf::feedCounter() {
    checkCounter();
    uint8_t be[4];
    byte_order::store_be_var(be, static_cast<uint32_t>(counter_), counter_bytes_);
    prf_.update(be, counter_bytes_);
    counter_++;
}

// ============================================================================
// Counter mode
// ============================================================================

CounterModeKdf::CounterModeKdf(const KdfParams& params)
    : Sp800108Kdf(KdfAlgorithm::CMKDF, params) {}

ByteVec CounterModeKdf::nextBlock() {
    checkCounter();
    prf_.reset();
    feedCounter();
    prf_.update(fixed_input_);
    return prf_.final();
}

// ============================================================================
// Feedback mode
// ============================================================================

FeedbackModeKdf::FeedbackModeKdf(const KdfParams& params)
    : Sp800108Kdf(KdfAlgorithm::FMKDF, params), prev_(params.iv) {}

FeedbackModeKdf::~FeedbackModeKdf() {
    secure_wipe(prev_);
}

ByteVec FeedbackModeKdf::nextBlock() {
    checkCounter();
    prf_.reset();
    prf_.update(prev_);
    feedCounter();
    prf_.update(fixed_input_);

    ByteVec block = prf_.final();
    secure_wipe(prev_);
    prev_ = block;
    return block;
}

// ============================================================================
// Double-pipeline iteration mode
// ============================================================================

DoublePipelineKdf::DoublePipelineKdf(const KdfParams& params)
    : Sp800108Kdf(KdfAlgorithm::DPIMKDF, params), chain_(fixed_input_) {}

DoublePipelineKdf::~DoublePipelineKdf() {
    secure_wipe(chain_);
}

ByteVec DoublePipelineKdf::nextBlock() {
    checkCounter();

    // First pipeline: A(i) = PRF(key, A(i-1))
    prf_.reset();
    prf_.update(chain_);
    ByteVec next = prf_.final();
    secure_wipe(chain_);
    chain_.swap(next);

    // Second pipeline: T(i) = PRF(key, A(i) || counter || fixed)
    prf_.reset();
    prf_.update(chain_);
    feedCounter();
    prf_.update(fixed_input_);
    return prf_.final();
}

} // namespace kdf
} // namespace kccomp
