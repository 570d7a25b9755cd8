/**
 * @file digest.h
 * @brief Streaming message digest engine
 *
 * Wraps an OpenSSL EVP_MD behind the engine lifecycle
 * construct (ready) -> update* -> digest() (consumed) -> reset() (ready).
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef KCCOMP_ENGINE_DIGEST_H
#define KCCOMP_ENGINE_DIGEST_H

#include "kccomp/core/common.h"
#include "kccomp/core/types.h"
#include "kccomp/engine/algorithm.h"
#include "kccomp/engine/source.h"

#include <memory>
#include <string>

namespace kccomp {

class KCCOMP_API Digest : public Updatable {
public:
    /**
     * @brief Fetch and initialize a digest
     * @param alg Digest algorithm
     * @param output_size Output bytes for SHAKE128/SHAKE256 (0 = default);
     *        must be 0 for fixed-size digests
     * @throws UnsupportedAlgorithm if the provider lacks the digest
     * @throws std::invalid_argument on an output size for a fixed digest
     */
    explicit Digest(DigestAlgorithm alg, size_t output_size = 0);
    ~Digest() override;

    Digest(Digest&&) noexcept;
    Digest& operator=(Digest&&) noexcept;
    Digest(const Digest&) = delete;
    Digest& operator=(const Digest&) = delete;

    /**
     * @throws EngineNotInitialized after digest() until reset()
     */
    void update(const uint8_t* data, size_t len) override;
    void update(const ByteVec& data) { update(data.data(), data.size()); }
    void update(const std::string& data);
    void update(const DataSource& source) { source.feedInto(*this); }

    /**
     * @brief Finalize and return outputSize() bytes
     * @throws EngineNotInitialized if already finalized
     */
    ByteVec digest();

    /**
     * @brief Return to the freshly-initialized state
     */
    void reset();

    DigestAlgorithm algorithm() const noexcept { return alg_; }
    size_t outputSize() const noexcept { return output_size_; }
    size_t blockSize() const noexcept { return digest_info(alg_).block_size; }

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    DigestAlgorithm alg_;
    size_t output_size_;
    bool finalized_ = false;
};

/**
 * @brief One-shot digest of a buffer
 */
KCCOMP_API ByteVec digest(DigestAlgorithm alg, const ByteVec& data);

/**
 * @brief One-shot digest of any source
 */
KCCOMP_API ByteVec digest(DigestAlgorithm alg, const DataSource& source);

} // namespace kccomp

#endif // KCCOMP_ENGINE_DIGEST_H
