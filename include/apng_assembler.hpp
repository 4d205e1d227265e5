//
//  apng_assembler.hpp
//  PngReel
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#include "frame_spec.hpp"
#include "status.hpp"

namespace pngreel {

struct AssembleReport {
    uint32_t frames = 0;
    uint32_t width = 0;
    uint32_t height = 0;
    uint32_t sequence_numbers = 0;  // fcTL + fdAT chunks ("animation chunks")
    uint64_t chunks = 0;
    uint64_t bytes = 0;
};

// Complete APNG writer: signature, IHDR copied from the first frame, acTL, then per frame an
// fcTL followed by its data blocks (IDAT for frame 0, fdAT afterwards), then IEND.
// All frames must share the first frame's IHDR; this is not enforced.
// Exposed for embedding; prefer the file-level helper in pngreel.hpp.
Status write_apng(std::ostream &out, const std::vector<FrameSpec> &frames,
                  const AssembleOptions &options, AssembleReport *report = nullptr);

// Same, writing to `output_path` (created or truncated).
Status write_apng_file(const std::string &output_path, const std::vector<FrameSpec> &frames,
                       const AssembleOptions &options, AssembleReport *report = nullptr);

}  // namespace pngreel
