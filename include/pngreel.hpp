//
//  pngreel.hpp
//  PngReel
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "apng_assembler.hpp"
#include "assembly_config.hpp"
#include "frame_spec.hpp"
#include "status.hpp"

namespace pngreel {

/// @defgroup api PngReel Public API
/// Public, supported C++ interfaces for assembling PNG frames into an APNG file.
/// @{

/**
 * @brief Return the PngReel library version string.
 *
 * Follows the same formatting as the CLI banner (e.g. `v0.3`).
 */
std::string version_string();  ///< @ingroup api

/**
 * @brief Assemble single-frame PNG files into one animated PNG.
 *
 * @param frames Source files in display order with their delays; must not be empty.
 * @param output_path Destination .png file (created or truncated).
 * @param options Chunk limit, loop count and checksum policy.
 * @return `ok == true` on success; otherwise the error class and a message naming the file.
 */
Status assemble_apng(const std::vector<FrameSpec> &frames, const std::string &output_path,
                     const AssembleOptions &options = {});  ///< @ingroup api

/// Resolve frames from `config` (directory + delay file, or manifest) and assemble them.
Status run(const RunConfig &config, AssembleReport *report = nullptr);  ///< @ingroup api

/// @}

}  // namespace pngreel
