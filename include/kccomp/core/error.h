/**
 * @file error.h
 * @brief Exception hierarchy of the kccomp C++ API
 *
 * Every failure raised by an engine derives from CryptoError and carries the
 * kccomp_error_t the C ABI reports for it. Caller misuse that is not a
 * cryptographic condition (bad offsets, zero iteration counts) is reported
 * with the standard std::invalid_argument / std::out_of_range.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef KCCOMP_CORE_ERROR_H
#define KCCOMP_CORE_ERROR_H

#include "kccomp/core/common.h"

#include <stdexcept>
#include <string>

namespace kccomp {

class CryptoError : public std::runtime_error {
public:
    CryptoError(kccomp_error_t code, const std::string& what)
        : std::runtime_error(what), code_(code) {}

    kccomp_error_t code() const noexcept { return code_; }

private:
    kccomp_error_t code_;
};

/** Unknown algorithm identifier or an invalid pairing of identifiers */
class UnsupportedAlgorithm : public CryptoError {
public:
    explicit UnsupportedAlgorithm(const std::string& what)
        : CryptoError(KCCOMP_ERROR_UNSUPPORTED_ALGORITHM, what) {}
};

/** Key or IV length outside the algorithm's size class */
class InvalidKeyMaterial : public CryptoError {
public:
    explicit InvalidKeyMaterial(const std::string& what)
        : CryptoError(KCCOMP_ERROR_INVALID_KEY_MATERIAL, what) {}
};

/** Engine used before init, or updated after finalize */
class EngineNotInitialized : public CryptoError {
public:
    explicit EngineNotInitialized(const std::string& what)
        : CryptoError(KCCOMP_ERROR_NOT_INITIALIZED, what) {}
};

class InvalidPadding : public CryptoError {
public:
    explicit InvalidPadding(const std::string& what)
        : CryptoError(KCCOMP_ERROR_INVALID_PADDING, what) {}
};

/** Tag mismatch; the message never carries intermediate MAC values */
class AuthenticationFailure : public CryptoError {
public:
    explicit AuthenticationFailure(const std::string& what)
        : CryptoError(KCCOMP_ERROR_AUTH_FAILED, what) {}
};

class InvalidInputLength : public CryptoError {
public:
    explicit InvalidInputLength(const std::string& what)
        : CryptoError(KCCOMP_ERROR_INVALID_LENGTH, what) {}
};

class OutputLimitExceeded : public CryptoError {
public:
    explicit OutputLimitExceeded(const std::string& what)
        : CryptoError(KCCOMP_ERROR_OUTPUT_LIMIT, what) {}
};

/** OpenSSL reported a failure; the message carries its error queue text */
class ProviderError : public CryptoError {
public:
    explicit ProviderError(const std::string& what)
        : CryptoError(KCCOMP_ERROR_PROVIDER, what) {}
};

} // namespace kccomp

#endif // KCCOMP_CORE_ERROR_H
