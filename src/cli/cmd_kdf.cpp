/**
 * @file cmd_kdf.cpp
 * @brief KDF subcommand implementation for kccomp CLI
 *
 * Usage:
 *   kccomp kdf -algorithm hkdf -digest sha256 -key str:mysecret -salt str:mysalt -length 32
 *   kccomp kdf -algorithm cmkdf -prf hmac-sha256 -key <hex> -label str:L -context str:C -length 40
 *   kccomp kdf -algorithm pbkdf2 -key str:password -salt str:salt -iter 100000 -length 32
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include <iostream>
#include <string>

#include "kccomp/core/security.h"
#include "kccomp/kdf/kdf.h"
#include "kccomp/utils/encoding.h"

void print_kdf_help() {
    std::cout << "\nUsage: kccomp kdf [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -algorithm <name>  hkdf, kdf1, kdf2, cmkdf, fmkdf, dpimkdf, pbkdf2 (required)\n";
    std::cout << "  -key <bytes>       Input key material or password (required)\n";
    std::cout << "  -length <bytes>    Output length (required)\n";
    std::cout << "  -digest <name>     Digest for hkdf/kdf1/kdf2/pbkdf2 (default: sha256)\n";
    std::cout << "  -prf <name>        PRF for SP 800-108 modes (default: hmac-sha256)\n";
    std::cout << "  -salt <bytes>      Salt (hkdf, pbkdf2) or shared info (kdf1, kdf2)\n";
    std::cout << "  -info <bytes>      HKDF info\n";
    std::cout << "  -label <bytes>     SP 800-108 label\n";
    std::cout << "  -context <bytes>   SP 800-108 context\n";
    std::cout << "  -iv <bytes>        Feedback-mode IV\n";
    std::cout << "  -iter <n>          PBKDF2 iterations (default: 1)\n";
    std::cout << "  -rbits <n>         SP 800-108 counter width: 8, 16, 24, 32 (default: 32)\n";
    std::cout << "  -lbits <n>         SP 800-108 [L] field value (default: -length * 8 for cmkdf,\n";
    std::cout << "                     omitted for fmkdf/dpimkdf)\n";
    std::cout << "  --help             Show this help message\n\n";
    std::cout << "Byte arguments are hex, or text when prefixed with str:\n\n";
}

#include "cli_utils.h"
using kccomp::cli::parse_bytes_arg;
using kccomp::cli::parse_count_arg;

int cmd_kdf(int argc, char* argv[]) {
    std::string algorithm, key_arg, length_arg, digest = "sha256", prf = "hmac-sha256";
    std::string salt_arg, info_arg, label_arg, context_arg, iv_arg;
    std::string iter_arg, rbits_arg, lbits_arg;

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        if ((arg == "-algorithm" || arg == "-algo") && i + 1 < argc) {
            algorithm = argv[++i];
        } else if (arg == "-key" && i + 1 < argc) {
            key_arg = argv[++i];
        } else if (arg == "-length" && i + 1 < argc) {
            length_arg = argv[++i];
        } else if (arg == "-digest" && i + 1 < argc) {
            digest = argv[++i];
        } else if (arg == "-prf" && i + 1 < argc) {
            prf = argv[++i];
        } else if (arg == "-salt" && i + 1 < argc) {
            salt_arg = argv[++i];
        } else if (arg == "-info" && i + 1 < argc) {
            info_arg = argv[++i];
        } else if (arg == "-label" && i + 1 < argc) {
            label_arg = argv[++i];
        } else if (arg == "-context" && i + 1 < argc) {
            context_arg = argv[++i];
        } else if (arg == "-iv" && i + 1 < argc) {
            iv_arg = argv[++i];
        } else if (arg == "-iter" && i + 1 < argc) {
            iter_arg = argv[++i];
        } else if (arg == "-rbits" && i + 1 < argc) {
            rbits_arg = argv[++i];
        } else if (arg == "-lbits" && i + 1 < argc) {
            lbits_arg = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_kdf_help();
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_kdf_help();
            return 1;
        }
    }

    if (algorithm.empty() || key_arg.empty() || length_arg.empty()) {
        std::cerr << "Error: Missing required arguments (-algorithm, -key, -length)\n";
        print_kdf_help();
        return 1;
    }

    try {
        kccomp::KdfParams params;
        params.algorithm = kccomp::parse_kdf(algorithm);
        params.digest = kccomp::parse_digest(digest);
        params.prf = kccomp::MacSpec::parse(prf);
        params.key = parse_bytes_arg(key_arg);
        kccomp::ScopedWipe wipe_key(params.key);

        if (!salt_arg.empty()) params.salt = parse_bytes_arg(salt_arg);
        if (!info_arg.empty()) params.info = parse_bytes_arg(info_arg);
        if (!label_arg.empty()) params.label = parse_bytes_arg(label_arg);
        if (!context_arg.empty()) params.context = parse_bytes_arg(context_arg);
        if (!iv_arg.empty()) params.iv = parse_bytes_arg(iv_arg);
        if (!iter_arg.empty()) {
            params.iterations = static_cast<uint32_t>(parse_count_arg("-iter", iter_arg));
        }
        if (!rbits_arg.empty()) params.counter_bits = parse_count_arg("-rbits", rbits_arg);
        const size_t length = parse_count_arg("-length", length_arg);
        if (!lbits_arg.empty()) {
            params.length_bits = static_cast<uint32_t>(parse_count_arg("-lbits", lbits_arg));
        } else if (params.algorithm == kccomp::KdfAlgorithm::CMKDF) {
            params.length_bits = static_cast<uint32_t>(length * 8);
        }
        kccomp::ByteVec derived = kccomp::kdf::derive(params, length);
        std::cout << kccomp::hexEncode(derived) << "\n";
        kccomp::secure_wipe(derived);
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
