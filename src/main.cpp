//
//  main.cpp
//  PngReel
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include <charconv>
#include <cstdint>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>

#include "logging.hpp"
#include "pngreel.hpp"
#include "pngreel_version.hpp"

namespace {

void print_usage() {
    std::cerr << "PngReel " << PNGREEL_VERSION_DISPLAY << "\n"
              << "Copyright (c) 2025 Till Toenshoff\n\n"
              << "usage:\n"
              << "  pngreel [-i DIR] [-d FILE] [-o FILE] [--loops N] [--no-verify-crc] "
              << "[--log-level warn|info|debug]\n"
              << "  pngreel -m MANIFEST.json [-o FILE] [--log-level warn|info|debug]\n"
              << "Options:\n"
              << "  -i, --input DIR      The folder containing the source PNG files "
              << "(default: frames).\n"
              << "  -d, --delays FILE    Duration of each frame in milliseconds, one per line "
              << "(default: delays.txt).\n"
              << "  -o, --output FILE    The destination file (default: output.png).\n"
              << "  -m, --manifest FILE  JSON list of frames and delays; replaces -i and -d.\n"
              << "      --loops N        Number of plays, 0 loops forever (default: 0).\n"
              << "      --no-verify-crc  Trust input chunk checksums without checking them.\n"
              << "      --log-level LEVEL Set logging verbosity (default: info).\n";
}

bool parse_u32(const std::string &s, uint32_t &out) {
    const auto res = std::from_chars(s.data(), s.data() + s.size(), out);
    return res.ec == std::errc() && res.ptr == s.data() + s.size();
}

}  // namespace

int main(int argc, char **argv) {
    if (argc == 2 && (std::string(argv[1]) == "--version" || std::string(argv[1]) == "-v")) {
        std::cout << "PngReel " << PNGREEL_VERSION_DISPLAY << "\n";
        return 0;
    }

    pngreel::RunConfig config;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        const bool has_value = i + 1 < argc;
        if ((arg == "--input" || arg == "-i") && has_value) {
            config.input_dir = argv[++i];
        } else if ((arg == "--delays" || arg == "-d") && has_value) {
            config.delay_file = argv[++i];
        } else if ((arg == "--output" || arg == "-o") && has_value) {
            config.output = argv[++i];
        } else if ((arg == "--manifest" || arg == "-m") && has_value) {
            config.manifest = argv[++i];
        } else if (arg == "--loops" && has_value) {
            if (!parse_u32(argv[++i], config.options.loop_count)) {
                std::cerr << "Invalid loop count: " << argv[i] << "\n";
                return 2;
            }
        } else if (arg == "--no-verify-crc") {
            config.options.verify_crc = false;
        } else if (arg == "--log-level" && has_value) {
            config.log_level = pngreel::parse_log_verbosity(argv[++i]);
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage();
            return 2;
        }
    }
    pngreel::set_log_verbosity(config.log_level);

    auto status = pngreel::run(config);
    if (!status.ok) {
        PR_LOG("error", "pngreel: " << pngreel::error_kind_name(status.kind) << ": "
                                    << status.message);
        return 1;
    }

    std::cout << "Wrote: " << config.output << "\n";
    return 0;
}
