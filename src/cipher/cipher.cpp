/**
 * @file cipher.cpp
 * @brief CipherEngine state machine and one-shot helpers
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "kccomp/cipher/cipher.h"
#include "kccomp/core/error.h"
#include "kccomp/core/security.h"
#include "modes.h"

#include <algorithm>
#include <utility>

namespace kccomp {

CipherEngine::CipherEngine(const CipherSpec& spec)
    : spec_(spec), mode_(internal::make_mode(spec)) {}

CipherEngine::CipherEngine(const std::string& name)
    : CipherEngine(CipherSpec::parse(name)) {}

CipherEngine::~CipherEngine() = default;
CipherEngine::CipherEngine(CipherEngine&&) noexcept = default;
CipherEngine& CipherEngine::operator=(CipherEngine&&) noexcept = default;

void CipherEngine::requireReady() const {
    if (!mode_ || !ready_) {
        throw EngineNotInitialized(spec_.name() + " is not initialized; call init()");
    }
}

void CipherEngine::init(CipherDirection direction, const uint8_t* key, size_t key_len,
                        const uint8_t* iv, size_t iv_len) {
    if (!mode_) {
        throw EngineNotInitialized("CipherEngine has been moved from");
    }
    ready_ = false;
    mode_->clear();
    mode_->init(direction, key, key_len, iv, iv_len);
    ready_ = true;
}

void CipherEngine::updateAad(const uint8_t* aad, size_t len) {
    requireReady();
    mode_->updateAad(aad, len);
}

void CipherEngine::processBlock(const uint8_t* in, uint8_t* out) {
    requireReady();
    mode_->processBlock(in, out);
}

ByteVec CipherEngine::processBytes(const uint8_t* in, size_t len) {
    requireReady();
    ByteVec out;
    out.reserve(len);
    mode_->processBytes(in, len, out);
    return out;
}

ByteVec CipherEngine::doFinal() {
    requireReady();
    ready_ = false;
    ByteVec out;
    try {
        mode_->doFinal(out);
    } catch (const CryptoError&) {
        mode_->clear();
        throw;
    }
    mode_->clear();
    return out;
}

size_t CipherEngine::outputSize(size_t input_len) const {
    requireReady();
    return mode_->outputSize(input_len);
}

void CipherEngine::reset() {
    if (mode_) {
        mode_->clear();
    }
    ready_ = false;
}

size_t CipherEngine::tagSize() const noexcept {
    return mode_ ? mode_->tagSize() : 0;
}

// ============================================================================
// One-shot helpers
// ============================================================================

namespace {

void check_padding_mode(const CipherSpec& spec, PaddingScheme padding) {
    if (padding != PaddingScheme::None && spec.mode != CipherMode::CBC) {
        throw UnsupportedAlgorithm("Padding is only defined for CBC, not " + spec.name());
    }
}

} // anonymous namespace

ByteVec cipher_encrypt(const CipherSpec& spec, const ByteVec& key, const ByteVec& iv,
                       const ByteVec& plaintext, PaddingScheme padding, const ByteVec& aad) {
    check_padding_mode(spec, padding);

    CipherEngine engine(spec);
    engine.init(CipherDirection::Encrypt, key, iv);
    if (!aad.empty()) {
        engine.updateAad(aad);
    }

    if (padding == PaddingScheme::None) {
        ByteVec out = engine.processBytes(plaintext);
        ByteVec tail = engine.doFinal();
        out.insert(out.end(), tail.begin(), tail.end());
        return out;
    }

    const size_t block_size = engine.blockSize();
    const size_t full = plaintext.size() / block_size * block_size;
    const size_t rem = plaintext.size() - full;

    ByteVec last(block_size, 0);
    std::copy(plaintext.begin() + static_cast<std::ptrdiff_t>(full), plaintext.end(), last.begin());
    if (rem == 0 && padding == PaddingScheme::TBC && !plaintext.empty()) {
        // A whole TBC block takes its fill from the last content byte
        last[block_size - 1] = plaintext.back();
    }
    last = padding::pad_in_place(std::move(last), rem, padding);

    ByteVec out = engine.processBytes(plaintext.data(), full);
    ByteVec tail = engine.processBytes(last);
    out.insert(out.end(), tail.begin(), tail.end());
    engine.doFinal();
    secure_wipe(last);
    return out;
}

ByteVec cipher_decrypt(const CipherSpec& spec, const ByteVec& key, const ByteVec& iv,
                       const ByteVec& ciphertext, PaddingScheme padding, const ByteVec& aad) {
    check_padding_mode(spec, padding);

    CipherEngine engine(spec);
    engine.init(CipherDirection::Decrypt, key, iv);
    if (!aad.empty()) {
        engine.updateAad(aad);
    }

    ByteVec out = engine.processBytes(ciphertext);
    ByteVec tail = engine.doFinal();
    out.insert(out.end(), tail.begin(), tail.end());

    if (padding == PaddingScheme::None) {
        return out;
    }

    const size_t block_size = engine.blockSize();
    if (out.size() < block_size) {
        secure_wipe(out);
        throw InvalidPadding(std::string("Invalid ") + padding_name(padding) + " padding");
    }

    const size_t body = out.size() - block_size;
    ByteVec last(out.begin() + static_cast<std::ptrdiff_t>(body), out.end());
    try {
        const size_t count = padding::pad_count(last, padding);
        last = padding::unpad_in_place(std::move(last), block_size - count, padding);
    } catch (const InvalidPadding&) {
        secure_wipe(out);
        throw;
    }

    out.resize(body);
    out.insert(out.end(), last.begin(), last.end());
    return out;
}

} // namespace kccomp
