/**
 * @file cmd_hash.cpp
 * @brief Hash subcommand implementation for kccomp CLI
 *
 * Input files are streamed through the digest in fixed-size chunks.
 *
 * Usage:
 *   kccomp hash -algorithm sha3-256 -in file.txt
 *   kccomp hash -algorithm shake256 -length 64 -str "abc"
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include <iostream>
#include <string>

#include "kccomp/engine/digest.h"
#include "kccomp/engine/source.h"
#include "kccomp/utils/encoding.h"

/**
 * @brief Print hash subcommand help
 */
void print_hash_help() {
    std::cout << "\nUsage: kccomp hash [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -algorithm <algo>  Digest name (required)\n";
    std::cout << "  -in <file>         Input file path\n";
    std::cout << "  -str <text>        Hash a literal string instead of a file\n";
    std::cout << "  -length <bytes>    Output length for shake128/shake256\n";
    std::cout << "  -hex               Output in hexadecimal (default)\n";
    std::cout << "  -binary            Output raw binary\n";
    std::cout << "  --help             Show this help message\n\n";
    std::cout << "Supported Algorithms:\n";
    std::cout << "  sha1, sha224, sha256, sha384, sha512, sha512-256\n";
    std::cout << "  sha3-256, sha3-384, sha3-512, blake2b512, blake2s256\n";
    std::cout << "  shake128, shake256\n\n";
    std::cout << "Examples:\n";
    std::cout << "  kccomp hash -algorithm sha3-256 -in document.pdf\n";
    std::cout << "  kccomp hash -algorithm sha256 -str \"abc\"\n\n";
}

#include "cli_utils.h"
using kccomp::cli::parse_count_arg;

/**
 * @brief Hash subcommand handler
 */
int cmd_hash(int argc, char* argv[]) {
    std::string algorithm, input_file, text;
    std::string length_arg;
    bool have_text = false;
    bool hex_output = true;

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        if ((arg == "-algorithm" || arg == "-algo") && i + 1 < argc) {
            algorithm = argv[++i];
        } else if (arg == "-in" && i + 1 < argc) {
            input_file = argv[++i];
        } else if (arg == "-str" && i + 1 < argc) {
            text = argv[++i];
            have_text = true;
        } else if (arg == "-length" && i + 1 < argc) {
            length_arg = argv[++i];
        } else if (arg == "-hex") {
            hex_output = true;
        } else if (arg == "-binary") {
            hex_output = false;
        } else if (arg == "--help" || arg == "-h") {
            print_hash_help();
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_hash_help();
            return 1;
        }
    }

    if (algorithm.empty() || (input_file.empty() && !have_text)) {
        std::cerr << "Error: Missing required arguments (-algorithm, -in or -str)\n";
        print_hash_help();
        return 1;
    }
    if (!input_file.empty() && have_text) {
        std::cerr << "Error: Cannot specify both -in and -str\n";
        return 1;
    }

    try {
        const kccomp::DigestAlgorithm alg = kccomp::parse_digest(algorithm);
        const size_t length = length_arg.empty() ? 0 : parse_count_arg("-length", length_arg);
        kccomp::Digest md(alg, length);

        if (have_text) {
            md.update(kccomp::BufferSource(text));
        } else {
            md.update(kccomp::FileSource(input_file));
        }
        kccomp::ByteVec hash = md.digest();

        if (hex_output) {
            std::cout << kccomp::digest_info(alg).name << "("
                      << (have_text ? "\"" + text + "\"" : input_file) << ") = "
                      << kccomp::hexEncode(hash) << "\n";
        } else {
            std::cout.write(reinterpret_cast<const char*>(hash.data()),
                            static_cast<std::streamsize>(hash.size()));
        }
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
