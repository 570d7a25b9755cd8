/**
 * @file cmd_mac.cpp
 * @brief MAC subcommand implementation for kccomp CLI
 *
 * Usage:
 *   kccomp mac -algorithm hmac-sha256 -key str:secret -in file.txt
 *   kccomp mac -algorithm gmac-aes128 -key <hex> -iv <hex> -str "Hello World."
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include <iostream>
#include <string>

#include "kccomp/core/security.h"
#include "kccomp/engine/mac.h"
#include "kccomp/engine/source.h"
#include "kccomp/utils/encoding.h"

void print_mac_help() {
    std::cout << "\nUsage: kccomp mac [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -algorithm <name>  hmac-<digest>, cmac-aes<bits>, gmac-aes<bits>, poly1305\n";
    std::cout << "  -key <bytes>       MAC key, hex or str:<text> (required)\n";
    std::cout << "  -iv <bytes>        GMAC IV\n";
    std::cout << "  -in <file>         Input file path\n";
    std::cout << "  -str <text>        MAC a literal string instead of a file\n";
    std::cout << "  --help             Show this help message\n\n";
    std::cout << "Examples:\n";
    std::cout << "  kccomp mac -algorithm hmac-sha256 -key str:key -str \"hello\"\n";
    std::cout << "  kccomp mac -algorithm cmac-aes128 -key 2b7e151628aed2a6abf7158809cf4f3c -in msg.bin\n\n";
}

#include "cli_utils.h"
using kccomp::cli::parse_bytes_arg;

int cmd_mac(int argc, char* argv[]) {
    std::string algorithm, key_arg, iv_arg, input_file, text;
    bool have_text = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        if ((arg == "-algorithm" || arg == "-algo") && i + 1 < argc) {
            algorithm = argv[++i];
        } else if (arg == "-key" && i + 1 < argc) {
            key_arg = argv[++i];
        } else if (arg == "-iv" && i + 1 < argc) {
            iv_arg = argv[++i];
        } else if (arg == "-in" && i + 1 < argc) {
            input_file = argv[++i];
        } else if (arg == "-str" && i + 1 < argc) {
            text = argv[++i];
            have_text = true;
        } else if (arg == "--help" || arg == "-h") {
            print_mac_help();
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_mac_help();
            return 1;
        }
    }

    if (algorithm.empty() || key_arg.empty() || (input_file.empty() && !have_text)) {
        std::cerr << "Error: Missing required arguments (-algorithm, -key, -in or -str)\n";
        print_mac_help();
        return 1;
    }

    try {
        kccomp::ByteVec key = parse_bytes_arg(key_arg);
        kccomp::ScopedWipe wipe_key(key);
        kccomp::ByteVec iv = iv_arg.empty() ? kccomp::ByteVec() : parse_bytes_arg(iv_arg);

        kccomp::Mac mac(kccomp::MacSpec::parse(algorithm));
        mac.init(key, iv);
        if (have_text) {
            mac.update(kccomp::BufferSource(text));
        } else {
            mac.update(kccomp::FileSource(input_file));
        }

        std::cout << mac.spec().name() << " = " << kccomp::hexEncode(mac.final()) << "\n";
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
