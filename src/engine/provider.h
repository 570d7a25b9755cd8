/**
 * @file provider.h
 * @brief Internal OpenSSL ownership helpers shared by the engines
 *
 * Not installed; included only by src/ translation units.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef KCCOMP_SRC_ENGINE_PROVIDER_H
#define KCCOMP_SRC_ENGINE_PROVIDER_H

#include <openssl/evp.h>

#include <memory>
#include <string>

namespace kccomp {
namespace internal {

// ============================================================================
// unique_ptr deleters for fetched algorithms and contexts
// ============================================================================

struct EvpMdDeleter {
    void operator()(EVP_MD* p) const noexcept { EVP_MD_free(p); }
};
struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* p) const noexcept { EVP_MD_CTX_free(p); }
};
struct EvpMacDeleter {
    void operator()(EVP_MAC* p) const noexcept { EVP_MAC_free(p); }
};
struct EvpMacCtxDeleter {
    void operator()(EVP_MAC_CTX* p) const noexcept { EVP_MAC_CTX_free(p); }
};
struct EvpCipherDeleter {
    void operator()(EVP_CIPHER* p) const noexcept { EVP_CIPHER_free(p); }
};
struct EvpCipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* p) const noexcept { EVP_CIPHER_CTX_free(p); }
};

using EvpMdPtr = std::unique_ptr<EVP_MD, EvpMdDeleter>;
using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;
using EvpMacPtr = std::unique_ptr<EVP_MAC, EvpMacDeleter>;
using EvpMacCtxPtr = std::unique_ptr<EVP_MAC_CTX, EvpMacCtxDeleter>;
using EvpCipherPtr = std::unique_ptr<EVP_CIPHER, EvpCipherDeleter>;
using EvpCipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, EvpCipherCtxDeleter>;

/**
 * @brief Throw ProviderError carrying the oldest queued OpenSSL error
 *
 * Drains the thread's OpenSSL error queue.
 */
[[noreturn]] void throw_provider_error(const std::string& what);

/**
 * @brief Lowercase an algorithm name and strip '-', '_' and '/'
 */
std::string canonical_name(const std::string& name);

} // namespace internal
} // namespace kccomp

#endif // KCCOMP_SRC_ENGINE_PROVIDER_H
