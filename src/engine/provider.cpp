/**
 * @file provider.cpp
 * @brief OpenSSL error translation
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "provider.h"
#include "kccomp/core/error.h"

#include <openssl/err.h>

#include <cctype>

namespace kccomp {
namespace internal {

void throw_provider_error(const std::string& what) {
    unsigned long code = ERR_get_error();
    std::string message = what;
    if (code != 0) {
        char buf[256];
        ERR_error_string_n(code, buf, sizeof(buf));
        message += ": ";
        message += buf;
    }
    ERR_clear_error();
    throw ProviderError(message);
}

std::string canonical_name(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        if (c == '-' || c == '_' || c == '/') {
            continue;
        }
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

} // namespace internal
} // namespace kccomp
