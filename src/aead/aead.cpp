/**
 * @file aead.cpp
 * @brief Encrypt-then-MAC and native AEAD schemes
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "kccomp/aead/aead.h"
#include "kccomp/cipher/cipher.h"
#include "kccomp/core/error.h"
#include "kccomp/core/security.h"
#include "kccomp/engine/mac.h"
#include "kccomp/engine/raw_cipher.h"
#include "kccomp/utils/byte_order.h"
#include "kccomp/utils/random.h"
#include "engine/provider.h"

#include <algorithm>
#include <string>

namespace kccomp {

namespace {

const AeadInfo kAeadTable[] = {
    {"aes128-cbc-hmac-sha256", 32, 16, 16, true, CipherAlgorithm::AES128, DigestAlgorithm::SHA256},
    {"aes192-cbc-hmac-sha384", 48, 16, 24, true, CipherAlgorithm::AES192, DigestAlgorithm::SHA384},
    {"aes256-cbc-hmac-sha512", 64, 16, 32, true, CipherAlgorithm::AES256, DigestAlgorithm::SHA512},
    {"aes128-gcm", 16, 12, 16, false, CipherAlgorithm::AES128, DigestAlgorithm::SHA256},
    {"aes192-gcm", 24, 12, 16, false, CipherAlgorithm::AES192, DigestAlgorithm::SHA256},
    {"aes256-gcm", 32, 12, 16, false, CipherAlgorithm::AES256, DigestAlgorithm::SHA256},
    {"chacha20-poly1305", 32, 12, 16, false, CipherAlgorithm::CHACHA20, DigestAlgorithm::SHA256},
};

const char kAuthFailed[] = "AEAD authentication failed";

// ============================================================================
// Encrypt-then-MAC (AES-CBC + HMAC)
// ============================================================================

ByteVec cbc_hmac_tag(const AeadInfo& info, const ByteVec& mac_key, const ByteVec& aad,
                     const ByteVec& iv, const uint8_t* ct, size_t ct_len) {
    uint8_t al[8];
    byte_order::store_be64(al, static_cast<uint64_t>(aad.size()) * 8);

    Mac mac(MacSpec::hmac(info.digest));
    mac.init(mac_key);
    mac.update(aad);
    mac.update(iv);
    mac.update(ct, ct_len);
    mac.update(al, sizeof(al));

    ByteVec tag = mac.final();
    tag.resize(info.tag_size);
    return tag;
}

ByteVec cbc_hmac_encrypt(const AeadInfo& info, const ByteVec& key, const ByteVec& iv,
                         const ByteVec& plaintext, const ByteVec& aad) {
    const size_t half = info.key_size / 2;
    ByteVec mac_key(key.begin(), key.begin() + static_cast<std::ptrdiff_t>(half));
    ByteVec enc_key(key.begin() + static_cast<std::ptrdiff_t>(half), key.end());
    ScopedWipe wipe_mac(mac_key);
    ScopedWipe wipe_enc(enc_key);

    const CipherSpec spec{info.cipher, CipherMode::CBC};
    ByteVec out = cipher_encrypt(spec, enc_key, iv, plaintext, PaddingScheme::PKCS7);
    ByteVec tag = cbc_hmac_tag(info, mac_key, aad, iv, out.data(), out.size());
    out.insert(out.end(), tag.begin(), tag.end());
    return out;
}

ByteVec cbc_hmac_decrypt(const AeadInfo& info, const ByteVec& key, const ByteVec& iv,
                         const ByteVec& envelope, const ByteVec& aad) {
    if (envelope.size() < info.tag_size) {
        throw AuthenticationFailure(kAuthFailed);
    }
    const size_t ct_len = envelope.size() - info.tag_size;
    const size_t block = cipher_info(info.cipher).block_size;
    if (ct_len == 0 || ct_len % block != 0) {
        throw AuthenticationFailure(kAuthFailed);
    }

    const size_t half = info.key_size / 2;
    ByteVec mac_key(key.begin(), key.begin() + static_cast<std::ptrdiff_t>(half));
    ByteVec enc_key(key.begin() + static_cast<std::ptrdiff_t>(half), key.end());
    ScopedWipe wipe_mac(mac_key);
    ScopedWipe wipe_enc(enc_key);

    ByteVec expected = cbc_hmac_tag(info, mac_key, aad, iv, envelope.data(), ct_len);
    ScopedWipe wipe_tag(expected);
    if (!secure_compare(expected.data(), envelope.data() + ct_len, info.tag_size)) {
        throw AuthenticationFailure(kAuthFailed);
    }

    ByteVec ct(envelope.begin(), envelope.begin() + static_cast<std::ptrdiff_t>(ct_len));
    try {
        return cipher_decrypt(CipherSpec{info.cipher, CipherMode::CBC}, enc_key, iv, ct,
                              PaddingScheme::PKCS7);
    } catch (const InvalidPadding&) {
        throw AuthenticationFailure(kAuthFailed);
    }
}

// ============================================================================
// ChaCha20-Poly1305 (RFC 8439)
// ============================================================================

// Keys the stream at block 0 and pulls the one-time Poly1305 key from it;
// the stream is left positioned at block 1.
ByteVec chacha_poly_setup(RawCipher& stream, const ByteVec& key, const ByteVec& nonce) {
    uint8_t iv[16];
    byte_order::store_le32(iv, 0);
    std::copy(nonce.begin(), nonce.end(), iv + 4);
    stream.init(key.data(), key.size(), iv, sizeof(iv), CipherDirection::Encrypt);

    ByteVec block0(64, 0);
    block0 = stream.processBytes(block0);
    ByteVec otk(block0.begin(), block0.begin() + KCCOMP_POLY1305_KEY_SIZE);
    secure_wipe(block0);
    return otk;
}

ByteVec poly1305_tag(const ByteVec& otk, const ByteVec& aad, const uint8_t* ct, size_t ct_len) {
    static const uint8_t kZeros[16] = {0};

    Mac mac(MacSpec::poly1305());
    mac.init(otk);
    mac.update(aad);
    mac.update(kZeros, (16 - aad.size() % 16) % 16);
    mac.update(ct, ct_len);
    mac.update(kZeros, (16 - ct_len % 16) % 16);

    uint8_t lengths[16];
    byte_order::store_le64(lengths, aad.size());
    byte_order::store_le64(lengths + 8, ct_len);
    mac.update(lengths, sizeof(lengths));
    return mac.final();
}

ByteVec chacha_poly_encrypt(const ByteVec& key, const ByteVec& nonce, const ByteVec& plaintext,
                            const ByteVec& aad) {
    RawCipher stream(CipherAlgorithm::CHACHA20);
    ByteVec otk = chacha_poly_setup(stream, key, nonce);
    ScopedWipe wipe_otk(otk);

    ByteVec out = stream.processBytes(plaintext);
    ByteVec tag = poly1305_tag(otk, aad, out.data(), out.size());
    out.insert(out.end(), tag.begin(), tag.end());
    return out;
}

ByteVec chacha_poly_decrypt(const ByteVec& key, const ByteVec& nonce, const ByteVec& envelope,
                            const ByteVec& aad) {
    if (envelope.size() < KCCOMP_GCM_TAG_SIZE) {
        throw AuthenticationFailure(kAuthFailed);
    }
    const size_t ct_len = envelope.size() - KCCOMP_GCM_TAG_SIZE;

    RawCipher stream(CipherAlgorithm::CHACHA20);
    ByteVec otk = chacha_poly_setup(stream, key, nonce);
    ScopedWipe wipe_otk(otk);

    ByteVec expected = poly1305_tag(otk, aad, envelope.data(), ct_len);
    if (!secure_compare(expected.data(), envelope.data() + ct_len, KCCOMP_GCM_TAG_SIZE)) {
        throw AuthenticationFailure(kAuthFailed);
    }

    ByteVec out(ct_len);
    if (ct_len > 0) {
        stream.processBytes(envelope.data(), ct_len, out.data());
    }
    return out;
}

} // anonymous namespace

const AeadInfo& aead_info(AeadScheme scheme) {
    return kAeadTable[static_cast<size_t>(scheme)];
}

AeadScheme parse_aead_scheme(const std::string& name) {
    const std::string key = internal::canonical_name(name);
    for (size_t i = 0; i < KCCOMP_ARRAY_SIZE(kAeadTable); i++) {
        if (internal::canonical_name(kAeadTable[i].name) == key) {
            return static_cast<AeadScheme>(i);
        }
    }
    throw UnsupportedAlgorithm("Unsupported AEAD scheme: " + name);
}

namespace aead {

AeadCipher::AeadCipher(AeadScheme scheme, const ByteVec& key) : scheme_(scheme) {
    const AeadInfo& info = aead_info(scheme);
    if (key.size() != info.key_size) {
        throw InvalidKeyMaterial(std::string(info.name) + " requires a " +
                                 std::to_string(info.key_size) + "-byte key");
    }
    key_ = key;
}

AeadCipher::~AeadCipher() {
    secure_wipe(key_);
}

void AeadCipher::checkIv(const ByteVec& iv) const {
    const AeadInfo& info = aead_info(scheme_);
    if (iv.size() != info.iv_size) {
        throw InvalidKeyMaterial(std::string(info.name) + " requires a " +
                                 std::to_string(info.iv_size) + "-byte IV");
    }
}

ByteVec AeadCipher::encrypt(const ByteVec& plaintext, const ByteVec& iv,
                            const ByteVec& aad) const {
    checkIv(iv);
    const AeadInfo& info = aead_info(scheme_);

    if (info.encrypt_then_mac) {
        return cbc_hmac_encrypt(info, key_, iv, plaintext, aad);
    }
    if (info.cipher == CipherAlgorithm::CHACHA20) {
        return chacha_poly_encrypt(key_, iv, plaintext, aad);
    }
    return cipher_encrypt(CipherSpec{info.cipher, CipherMode::GCM}, key_, iv, plaintext,
                          PaddingScheme::None, aad);
}

ByteVec AeadCipher::decrypt(const ByteVec& envelope, const ByteVec& iv,
                            const ByteVec& aad) const {
    checkIv(iv);
    const AeadInfo& info = aead_info(scheme_);

    if (info.encrypt_then_mac) {
        return cbc_hmac_decrypt(info, key_, iv, envelope, aad);
    }
    if (info.cipher == CipherAlgorithm::CHACHA20) {
        return chacha_poly_decrypt(key_, iv, envelope, aad);
    }
    return cipher_decrypt(CipherSpec{info.cipher, CipherMode::GCM}, key_, iv, envelope,
                          PaddingScheme::None, aad);
}

ByteVec make_iv(AeadScheme scheme) {
    const AeadInfo& info = aead_info(scheme);
    // A CBC IV must be unpredictable, not merely unique
    return info.encrypt_then_mac ? randomBytes(info.iv_size) : randomNonce(info.iv_size);
}

ByteVec encrypt(const ByteVec& plaintext, const ByteVec& key, const ByteVec& iv,
                AeadScheme scheme, const ByteVec& aad) {
    return AeadCipher(scheme, key).encrypt(plaintext, iv, aad);
}

ByteVec decrypt(const ByteVec& envelope, const ByteVec& key, const ByteVec& iv,
                AeadScheme scheme, const ByteVec& aad) {
    return AeadCipher(scheme, key).decrypt(envelope, iv, aad);
}

} // namespace aead
} // namespace kccomp
