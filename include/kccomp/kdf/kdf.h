/**
 * @file kdf.h
 * @brief Key derivation engines
 *
 * Every algorithm except PBKDF2 is an infinite pseudorandom byte stream:
 * successive getBytes() calls return consecutive, non-overlapping segments
 * of one keystream. Round output a call does not consume is buffered for the
 * next call, so getBytes(8) twice equals getBytes(16) once.
 *
 * PBKDF2 is fixed-output: each getBytes(n) returns PBKDF2(key, salt,
 * iterations, n), and identical lengths give identical bytes.
 *
 * Supported:
 * - HKDF (RFC 5869), HMAC over a fixed-size digest
 * - KDF1 / KDF2 (ISO 18033-2), digest with counter from 0 / from 1
 * - CMKDF / FMKDF / DPIMKDF (NIST SP 800-108 counter, feedback and
 *   double-pipeline modes), HMAC or CMAC as PRF
 * - PBKDF2 (RFC 8018), HMAC PRF
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef KCCOMP_KDF_KDF_H
#define KCCOMP_KDF_KDF_H

#include "kccomp/core/common.h"
#include "kccomp/core/types.h"
#include "kccomp/engine/algorithm.h"
#include "kccomp/engine/digest.h"
#include "kccomp/engine/mac.h"

#include <cstdint>
#include <memory>
#include <string>

namespace kccomp {

enum class KdfAlgorithm {
    HKDF,
    KDF1,
    KDF2,
    CMKDF,
    FMKDF,
    DPIMKDF,
    PBKDF2
};

KCCOMP_API const char* kdf_name(KdfAlgorithm alg);

/**
 * @throws UnsupportedAlgorithm on an unknown name
 */
KCCOMP_API KdfAlgorithm parse_kdf(const std::string& name);

/**
 * @brief Everything a KDF engine is seeded with
 *
 * Fields an algorithm does not use are ignored.
 */
struct KdfParams {
    KdfAlgorithm algorithm = KdfAlgorithm::HKDF;

    /** Digest for HKDF, KDF1, KDF2 and PBKDF2 */
    DigestAlgorithm digest = DigestAlgorithm::SHA256;

    /** PRF for CMKDF, FMKDF and DPIMKDF (HMAC or CMAC) */
    MacSpec prf = MacSpec::hmac(DigestAlgorithm::SHA256);

    ByteVec key;        ///< IKM / shared secret / KDK / password
    ByteVec salt;       ///< HKDF, PBKDF2; shared info for KDF1/KDF2
    ByteVec info;       ///< HKDF
    ByteVec label;      ///< SP 800-108
    ByteVec context;    ///< SP 800-108
    ByteVec iv;         ///< FMKDF T(0)

    uint32_t iterations = 1;    ///< PBKDF2
    size_t counter_bits = 32;   ///< SP 800-108 counter width: 8, 16, 24 or 32
    uint32_t length_bits = 0;   ///< SP 800-108 [L] field; required by CMKDF, 0 leaves it out elsewhere
};

namespace kdf {

class KCCOMP_API KdfEngine {
public:
    virtual ~KdfEngine() = default;

    /**
     * @brief Next n bytes of output
     * @throws OutputLimitExceeded when the counter space runs out
     */
    virtual ByteVec getBytes(size_t n) = 0;

    virtual KdfAlgorithm algorithm() const = 0;
};

/**
 * @brief Buffered round-by-round keystream
 *
 * Subclasses produce one round per nextBlock(); this class slices rounds
 * into requests and carries the unconsumed tail between calls.
 */
class KCCOMP_API StreamingKdf : public KdfEngine {
public:
    ~StreamingKdf() override;

    ByteVec getBytes(size_t n) final;

protected:
    StreamingKdf() = default;

    virtual ByteVec nextBlock() = 0;

private:
    ByteVec pending_;
    size_t pending_pos_ = 0;
};

/**
 * @brief HKDF extract-then-expand; at most 255 rounds of output
 */
class KCCOMP_API HkdfEngine final : public StreamingKdf {
public:
    HkdfEngine(DigestAlgorithm digest, const ByteVec& key, const ByteVec& salt,
               const ByteVec& info);
    ~HkdfEngine() override;

    KdfAlgorithm algorithm() const override { return KdfAlgorithm::HKDF; }

protected:
    ByteVec nextBlock() override;

private:
    Mac expand_;
    ByteVec info_;
    ByteVec prev_;
    unsigned counter_ = 1;
};

/**
 * @brief KDF1 / KDF2: T(i) = Digest(key || BE32(counter) || shared_info)
 *
 * KDF1 counts from 0, KDF2 from 1.
 */
class KCCOMP_API DigestCounterKdf final : public StreamingKdf {
public:
    DigestCounterKdf(KdfAlgorithm alg, DigestAlgorithm digest, const ByteVec& key,
                     const ByteVec& shared_info);
    ~DigestCounterKdf() override;

    KdfAlgorithm algorithm() const override { return alg_; }

protected:
    ByteVec nextBlock() override;

private:
    KdfAlgorithm alg_;
    Digest digest_;
    ByteVec key_;
    ByteVec shared_info_;
    uint64_t counter_;
};

/**
 * @brief Shared state of the SP 800-108 modes
 *
 * fixed input = label || context [|| BE32(L)]; CMKDF always carries L
 */
class KCCOMP_API Sp800108Kdf : public StreamingKdf {
public:
    KdfAlgorithm algorithm() const override { return alg_; }

protected:
    Sp800108Kdf(KdfAlgorithm alg, const KdfParams& params);

    /** @throws OutputLimitExceeded once the counter passes 2^r - 1 */
    void checkCounter() const;

    /** Feed the current counter, then advance it */
    void feedCounter();

    KdfAlgorithm alg_;
    Mac prf_;
    ByteVec fixed_input_;

private:
    size_t counter_bytes_;
    uint64_t counter_ = 1;
    uint64_t counter_max_;
};

/** T(i) = PRF(key, counter(i) || label || context || BE32(L)) */
class KCCOMP_API CounterModeKdf final : public Sp800108Kdf {
public:
    explicit CounterModeKdf(const KdfParams& params);

protected:
    ByteVec nextBlock() override;
};

/** T(i) = PRF(key, T(i-1) || counter(i) || fixed), T(0) = iv */
class KCCOMP_API FeedbackModeKdf final : public Sp800108Kdf {
public:
    explicit FeedbackModeKdf(const KdfParams& params);
    ~FeedbackModeKdf() override;

protected:
    ByteVec nextBlock() override;

private:
    ByteVec prev_;
};

/**
 * A(0) = fixed, A(i) = PRF(key, A(i-1));
 * T(i) = PRF(key, A(i) || counter(i) || fixed)
 */
class KCCOMP_API DoublePipelineKdf final : public Sp800108Kdf {
public:
    explicit DoublePipelineKdf(const KdfParams& params);
    ~DoublePipelineKdf() override;

protected:
    ByteVec nextBlock() override;

private:
    ByteVec chain_;
};

/**
 * @brief PBKDF2-HMAC; fixed output, recomputed from scratch on every call
 */
class KCCOMP_API Pbkdf2Engine final : public KdfEngine {
public:
    Pbkdf2Engine(DigestAlgorithm digest, const ByteVec& password, const ByteVec& salt,
                 uint32_t iterations);

    ByteVec getBytes(size_t n) override;
    KdfAlgorithm algorithm() const override { return KdfAlgorithm::PBKDF2; }

private:
    Mac prf_;
    ByteVec salt_;
    uint32_t iterations_;
};

/**
 * @brief Build the engine named by params.algorithm
 *
 * All validation happens here: UnsupportedAlgorithm for a bad digest/PRF
 * pairing, InvalidKeyMaterial for an empty key, std::invalid_argument for
 * zero iterations, a bad counter width, or a CMKDF without length_bits.
 */
KCCOMP_API std::unique_ptr<KdfEngine> make_kdf(const KdfParams& params);

/**
 * @brief One-shot: first n bytes from a fresh engine
 */
KCCOMP_API ByteVec derive(const KdfParams& params, size_t n);

} // namespace kdf
} // namespace kccomp

#endif // KCCOMP_KDF_KDF_H
