/**
 * @file kccomp_main.cpp
 * @brief kccomp Command-Line Interface - Main Entry Point
 *
 * Usage:
 *   kccomp <command> [options]
 *
 * Commands:
 *   hash         Message digests (SHA-2, SHA-3, BLAKE2, SHAKE)
 *   mac          Message authentication codes (HMAC, CMAC, GMAC, Poly1305)
 *   kdf          Key derivation (HKDF, KDF1/2, SP 800-108, PBKDF2)
 *   aead         Authenticated encryption (CBC-HMAC, GCM, ChaCha20-Poly1305)
 *   version      Display version information
 *   help         Show help message
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include <algorithm>
#include <cctype>
#include <iostream>
#include <string>

#include "kccomp/kccomp.h"

#include <openssl/crypto.h>

// Subcommand handlers (forward declarations)
int cmd_hash(int argc, char* argv[]);
int cmd_mac(int argc, char* argv[]);
int cmd_kdf(int argc, char* argv[]);
int cmd_aead(int argc, char* argv[]);
void cmd_version();
void cmd_help();

/**
 * @brief Print general usage information
 */
void print_usage() {
    std::cout << "\nUsage: kccomp <command> [options]\n\n";
    std::cout << "Available Commands:\n";
    std::cout << "  hash         Compute digests (sha256, sha3-256, blake2b512, shake128, ...)\n";
    std::cout << "  mac          Compute MACs (hmac-sha256, cmac-aes128, gmac-aes256, poly1305)\n";
    std::cout << "  kdf          Derive keys (hkdf, kdf1, kdf2, cmkdf, fmkdf, dpimkdf, pbkdf2)\n";
    std::cout << "  aead         AEAD encrypt/decrypt (aes128-cbc-hmac-sha256, aes256-gcm, ...)\n";
    std::cout << "  version      Display version and build information\n";
    std::cout << "  help         Show this help message\n\n";
    std::cout << "Byte arguments (-key, -iv, -salt, ...) are hex, or text when prefixed with str:\n\n";
    std::cout << "Examples:\n";
    std::cout << "  kccomp hash -algorithm sha3-256 -in file.txt\n";
    std::cout << "  kccomp mac -algorithm hmac-sha256 -key str:secret -str \"hello\"\n";
    std::cout << "  kccomp kdf -algorithm hkdf -key str:mysecret -salt str:mysalt -length 32\n";
    std::cout << "  kccomp aead -encrypt -scheme aes256-gcm -key <hex> -in a.txt -out a.enc\n\n";
    std::cout << "For command-specific help, use: kccomp <command> --help\n\n";
}

/**
 * @brief Display version information
 */
void cmd_version() {
    std::cout << "\n";
    std::cout << KCCOMP_LIBRARY_NAME << " - " << KCCOMP_DESCRIPTION << "\n";
    std::cout << "\n";
    std::cout << "Version:      " << kccomp_version() << "\n";
    std::cout << "Release Date: " << KCCOMP_RELEASE_DATE << "\n";
    std::cout << "Build Type:   " << KCCOMP_BUILD_TYPE << "\n";
    std::cout << "Platform:     " << kccomp_platform() << "\n";
    std::cout << "License:      Apache License 2.0\n";
    std::cout << "\n";
    std::cout << "Supported Algorithms:\n";
    std::cout << "  - Digests: SHA-1, SHA-2, SHA-3, BLAKE2b/2s, SHAKE128/256\n";
    std::cout << "  - MACs: HMAC, CMAC, GMAC, Poly1305\n";
    std::cout << "  - KDFs: HKDF, KDF1, KDF2, SP 800-108 (counter, feedback, double pipeline), PBKDF2\n";
    std::cout << "  - Modes: CBC, CTR, OFB, GCM, ChaCha20\n";
    std::cout << "  - AEAD: AES-CBC-HMAC-SHA2, AES-GCM, ChaCha20-Poly1305\n";
    std::cout << "\n";
    std::cout << "Dependencies:\n";
    std::cout << "  - " << OpenSSL_version(OPENSSL_VERSION) << "\n";
    std::cout << "\n";
}

/**
 * @brief Display help message (alias for print_usage)
 */
void cmd_help() {
    print_usage();
}

/**
 * @brief Main entry point
 */
int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 0;
    }

    std::string command(argv[1]);
    std::transform(command.begin(), command.end(), command.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (command == "version" || command == "-v" || command == "--version") {
        cmd_version();
        return 0;
    }
    if (command == "help" || command == "-h" || command == "--help") {
        cmd_help();
        return 0;
    }

    kccomp_error_t rc = kccomp_init();
    if (rc != KCCOMP_SUCCESS) {
        std::cerr << "Error: " << kccomp_error_string(rc) << "\n";
        return 1;
    }

    int status = 1;
    if (command == "hash") {
        status = cmd_hash(argc - 1, argv + 1);
    } else if (command == "mac") {
        status = cmd_mac(argc - 1, argv + 1);
    } else if (command == "kdf") {
        status = cmd_kdf(argc - 1, argv + 1);
    } else if (command == "aead") {
        status = cmd_aead(argc - 1, argv + 1);
    } else {
        std::cerr << "\nError: Unknown command '" << command << "'\n";
        print_usage();
    }

    kccomp_cleanup();
    return status;
}
