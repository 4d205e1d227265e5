//
//  assembly_config.hpp
//  PngReel
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <istream>
#include <optional>
#include <string>
#include <vector>

#include "frame_spec.hpp"
#include "logging.hpp"
#include "status.hpp"

namespace pngreel {

/**
 * @brief Everything a run needs, built once at startup and passed by const reference.
 *
 * When `manifest` is set, it supplies the frame list (and may override options); otherwise
 * frames are discovered in `input_dir` and delays come from `delay_file`.
 */
struct RunConfig {
    std::string input_dir = "frames";      ///< Folder containing the source PNG files
    std::string delay_file = "delays.txt"; ///< One delay in milliseconds per line
    std::string output = "output.png";     ///< Destination APNG
    std::string manifest;                  ///< Optional JSON frame manifest
    AssembleOptions options;
    LogVerbosity log_level = LogVerbosity::Info;
};

/// List `*.png` regular files in `dir`, sorted by file name.
Status discover_frames(const std::string &dir, std::vector<std::string> &files);

/// Parse one integer (milliseconds) per line; lines that are not integers are skipped.
std::vector<long long> parse_delay_lines(std::istream &in);

/// Read a delay file; std::nullopt when it cannot be opened.
std::optional<std::vector<long long>> read_delay_file(const std::string &path);

/// Pair files with delays. Extra delays are ignored; missing ones default to 100 ms.
std::vector<FrameSpec> build_frame_list(const std::vector<std::string> &files,
                                        const std::vector<long long> &delays_ms);

/**
 * @brief Load a JSON frame manifest.
 *
 * Layout: `{ "loops": 0, "max_chunk_size": 1048576, "verify_crc": true,
 *            "frames": [ { "file": "a.png", "delay_ms": 120 }, ... ] }`.
 * Relative file paths resolve against the manifest's directory. Keys other than `frames` are
 * optional and override the corresponding fields of `options`.
 */
Status load_manifest(const std::string &path, std::vector<FrameSpec> &frames,
                     AssembleOptions &options);

/// Produce the frame list and effective options for a run.
Status resolve_frames(const RunConfig &config, std::vector<FrameSpec> &frames,
                      AssembleOptions &options);

}  // namespace pngreel
