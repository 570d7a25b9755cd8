/**
 * @file mac.h
 * @brief Message Authentication Code engine
 *
 * One engine type covers HMAC (any fixed-size digest), CMAC and GMAC (AES)
 * and Poly1305, all delegated to OpenSSL EVP_MAC.
 *
 * Lifecycle: init(key[, iv]) -> update* -> final() -> reset() or init().
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef KCCOMP_ENGINE_MAC_H
#define KCCOMP_ENGINE_MAC_H

#include "kccomp/core/common.h"
#include "kccomp/core/types.h"
#include "kccomp/engine/algorithm.h"
#include "kccomp/engine/source.h"

#include <memory>
#include <string>

namespace kccomp {

class KCCOMP_API Mac : public Updatable {
public:
    /**
     * @throws UnsupportedAlgorithm on an invalid spec or missing provider support
     */
    explicit Mac(const MacSpec& spec);
    ~Mac() override;

    Mac(Mac&&) noexcept;
    Mac& operator=(Mac&&) noexcept;
    Mac(const Mac&) = delete;
    Mac& operator=(const Mac&) = delete;

    /**
     * @brief Key the engine
     *
     * HMAC accepts any key length. CMAC/GMAC need the cipher's key size,
     * Poly1305 needs 32 bytes. GMAC requires a non-empty IV; the other kinds
     * reject one.
     *
     * @throws InvalidKeyMaterial on a size mismatch
     */
    void init(const uint8_t* key, size_t key_len, const uint8_t* iv = nullptr, size_t iv_len = 0);
    void init(const ByteVec& key) { init(key.data(), key.size()); }
    void init(const ByteVec& key, const ByteVec& iv) {
        init(key.data(), key.size(), iv.data(), iv.size());
    }

    /**
     * @throws EngineNotInitialized before init() or after final()
     */
    void update(const uint8_t* data, size_t len) override;
    void update(const ByteVec& data) { update(data.data(), data.size()); }
    void update(const std::string& data);
    void update(const DataSource& source) { source.feedInto(*this); }

    /**
     * @brief Feed data[offset, offset + length)
     * @throws std::out_of_range if the window exceeds the buffer
     */
    void update(const ByteVec& data, size_t offset, size_t length);

    /**
     * @brief Produce the tag; the engine is consumed until reset()/init()
     */
    ByteVec final();

    /**
     * @brief Re-key with the key (and IV) given to the last init()
     */
    void reset();

    const MacSpec& spec() const noexcept { return spec_; }
    size_t macSize() const noexcept { return mac_size_; }
    bool isInitialized() const noexcept { return ready_; }

private:
    void rekey();

    struct Impl;
    std::unique_ptr<Impl> impl_;
    MacSpec spec_;
    size_t mac_size_;
    bool keyed_ = false;
    bool ready_ = false;
};

/**
 * @brief One-shot MAC
 */
KCCOMP_API ByteVec mac(const MacSpec& spec, const ByteVec& key, const ByteVec& data);

/**
 * @brief One-shot HMAC
 */
KCCOMP_API ByteVec hmac(DigestAlgorithm digest, const ByteVec& key, const ByteVec& data);

} // namespace kccomp

#endif // KCCOMP_ENGINE_MAC_H
