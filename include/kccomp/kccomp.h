/**
 * @file kccomp.h
 * @brief kccomp - Cryptographic Composition Layer over OpenSSL 3
 *
 * Unified header for the composition modules. Primitives come from the
 * OpenSSL 3 default provider; this library composes them into padding
 * schemes, streaming KDFs, chaining modes and AEAD envelopes.
 *
 * Modules:
 * - Engine: Digest, Mac, RawCipher, DataSource
 * - Padding: ZeroByte, PKCS#7, TBC, ISO 7816-4
 * - KDF: HKDF, KDF1, KDF2, SP 800-108 (counter, feedback, double pipeline), PBKDF2
 * - Cipher: CBC, CTR, OFB, GCM, ChaCha20
 * - AEAD: AES-CBC-HMAC-SHA2, AES-GCM, ChaCha20-Poly1305
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef KCCOMP_KCCOMP_H
#define KCCOMP_KCCOMP_H

// ============================================================================
// Core
// ============================================================================

#include "kccomp/version.h"
#include "kccomp/kccomp_api.h"
#include "kccomp/core/common.h"
#include "kccomp/core/types.h"
#include "kccomp/core/error.h"
#include "kccomp/core/security.h"

// ============================================================================
// Utilities
// ============================================================================

#include "kccomp/utils/byte_order.h"
#include "kccomp/utils/encoding.h"
#include "kccomp/utils/random.h"

// ============================================================================
// Composition modules
// ============================================================================

#include "kccomp/engine/algorithm.h"
#include "kccomp/engine/source.h"
#include "kccomp/engine/digest.h"
#include "kccomp/engine/mac.h"
#include "kccomp/engine/raw_cipher.h"
#include "kccomp/padding/padding.h"
#include "kccomp/kdf/kdf.h"
#include "kccomp/cipher/cipher.h"
#include "kccomp/aead/aead.h"

#endif // KCCOMP_KCCOMP_H
