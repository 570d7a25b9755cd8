/**
 * @file cmd_aead.cpp
 * @brief AEAD subcommand implementation for kccomp CLI
 *
 * The output file holds the envelope ciphertext || tag only; the IV is
 * printed (or supplied) separately.
 *
 * Usage:
 *   kccomp aead -encrypt -scheme aes256-gcm -key <hex> -in plain.txt -out plain.enc
 *   kccomp aead -decrypt -scheme aes256-gcm -key <hex> -iv <hex> -in plain.enc -out plain.txt
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include <iostream>
#include <string>

#include "kccomp/aead/aead.h"
#include "kccomp/core/security.h"
#include "kccomp/utils/encoding.h"

void print_aead_help() {
    std::cout << "\nUsage: kccomp aead [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -encrypt          Encrypt input file\n";
    std::cout << "  -decrypt          Decrypt input file\n";
    std::cout << "  -scheme <name>    AEAD scheme (default: aes128-cbc-hmac-sha256)\n";
    std::cout << "  -key <bytes>      Key, hex or str:<text> (required)\n";
    std::cout << "  -iv <bytes>       IV; generated on encryption when omitted\n";
    std::cout << "  -aad <bytes>      Associated data\n";
    std::cout << "  -in <file>        Input file path (required)\n";
    std::cout << "  -out <file>       Output file path (required)\n";
    std::cout << "  --help            Show this help message\n\n";
    std::cout << "Schemes:\n";
    std::cout << "  aes128-cbc-hmac-sha256   key 32, iv 16, tag 16\n";
    std::cout << "  aes192-cbc-hmac-sha384   key 48, iv 16, tag 24\n";
    std::cout << "  aes256-cbc-hmac-sha512   key 64, iv 16, tag 32\n";
    std::cout << "  aes128/192/256-gcm       key 16/24/32, iv 12, tag 16\n";
    std::cout << "  chacha20-poly1305        key 32, iv 12, tag 16\n\n";
}

#include "cli_utils.h"
using kccomp::cli::read_file;
using kccomp::cli::write_file;
using kccomp::cli::parse_bytes_arg;

int cmd_aead(int argc, char* argv[]) {
    bool encrypt = false, decrypt = false;
    std::string scheme_name = "aes128-cbc-hmac-sha256";
    std::string key_arg, iv_arg, aad_arg, input_file, output_file;

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        if (arg == "-encrypt") {
            encrypt = true;
        } else if (arg == "-decrypt") {
            decrypt = true;
        } else if (arg == "-scheme" && i + 1 < argc) {
            scheme_name = argv[++i];
        } else if (arg == "-key" && i + 1 < argc) {
            key_arg = argv[++i];
        } else if (arg == "-iv" && i + 1 < argc) {
            iv_arg = argv[++i];
        } else if (arg == "-aad" && i + 1 < argc) {
            aad_arg = argv[++i];
        } else if (arg == "-in" && i + 1 < argc) {
            input_file = argv[++i];
        } else if (arg == "-out" && i + 1 < argc) {
            output_file = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_aead_help();
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_aead_help();
            return 1;
        }
    }

    if (!encrypt && !decrypt) {
        std::cerr << "Error: Must specify -encrypt or -decrypt\n";
        print_aead_help();
        return 1;
    }
    if (encrypt && decrypt) {
        std::cerr << "Error: Cannot specify both -encrypt and -decrypt\n";
        return 1;
    }
    if (key_arg.empty() || input_file.empty() || output_file.empty()) {
        std::cerr << "Error: Missing required arguments (-key, -in, -out)\n";
        print_aead_help();
        return 1;
    }
    if (decrypt && iv_arg.empty()) {
        std::cerr << "Error: Decryption requires -iv\n";
        return 1;
    }

    try {
        const kccomp::AeadScheme scheme = kccomp::parse_aead_scheme(scheme_name);
        const kccomp::AeadInfo& info = kccomp::aead_info(scheme);

        kccomp::ByteVec key = parse_bytes_arg(key_arg);
        kccomp::ScopedWipe wipe_key(key);
        kccomp::ByteVec aad = aad_arg.empty() ? kccomp::ByteVec() : parse_bytes_arg(aad_arg);
        kccomp::ByteVec iv = iv_arg.empty() ? kccomp::aead::make_iv(scheme)
                                            : parse_bytes_arg(iv_arg);

        kccomp::aead::AeadCipher cipher(scheme, key);
        auto input_data = read_file(input_file);
        std::cout << "Read " << input_data.size() << " bytes from " << input_file << "\n";

        if (encrypt) {
            kccomp::ByteVec envelope = cipher.encrypt(input_data, iv, aad);
            write_file(output_file, envelope);
            std::cout << "Scheme: " << info.name << "\n";
            std::cout << "IV:     " << kccomp::hexEncode(iv) << "\n";
            std::cout << "Wrote " << envelope.size() << " bytes to " << output_file << "\n";
        } else {
            kccomp::ByteVec plaintext = cipher.decrypt(input_data, iv, aad);
            write_file(output_file, plaintext);
            std::cout << "Wrote " << plaintext.size() << " bytes to " << output_file << "\n";
            kccomp::secure_wipe(plaintext);
        }
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
