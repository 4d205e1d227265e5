//
//  frame_splicer.hpp
//  PngReel
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <istream>
#include <string>
#include <vector>

#include "chunk_writer.hpp"
#include "frame_spec.hpp"
#include "status.hpp"

namespace pngreel {

enum class SpliceMode {
    FirstFrame,  ///< data goes out as IDAT, no sequence prefix
    Subsequent,  ///< data goes out as fdAT with a 4-byte sequence prefix
};

struct SpliceStats {
    uint32_t data_blocks = 0;       // IDAT/fdAT chunks emitted
    uint64_t image_bytes = 0;       // compressed bytes copied from the source IDATs
    uint32_t sequence_numbers = 0;  // fcTL + fdAT values consumed
};

// Re-chunks one frame's compressed image data into size-bounded data blocks.
//
// Usage: begin() emits the fcTL, append() is fed each IDAT payload in order, finish() flushes
// the tail. Before an append, the pending block is flushed when its size plus the incoming
// chunk's on-wire size would pass the data payload limit (max_chunk_size - 20). A payload too
// large for an empty block is split across blocks.
class FrameSplicer {
   public:
    FrameSplicer(ChunkWriter &writer, SpliceMode mode, size_t max_chunk_size);

    Status begin(uint32_t width, uint32_t height, uint16_t delay_num);
    Status append(const uint8_t *data, size_t size);
    Status finish();

    const SpliceStats &stats() const { return stats_; }
    size_t payload_limit() const { return limit_; }

   private:
    void start_block();
    Status flush_block();
    size_t header_bytes() const { return mode_ == SpliceMode::Subsequent ? 4 : 0; }
    bool has_image_bytes() const { return buffer_.size() > header_bytes(); }

    ChunkWriter &writer_;
    SpliceMode mode_;
    size_t limit_;
    std::vector<uint8_t> buffer_;
    SpliceStats stats_;
};

// Stream one source PNG through a FrameSplicer. The first chunk after the signature must be
// IHDR; it is skipped (and compared against `reference_ihdr` when given, warning on mismatch).
// Ancillary chunks are skipped; reading stops at IEND. Error messages name `source_name`.
Status splice_frame(std::istream &in, const std::string &source_name, uint32_t width,
                    uint32_t height, uint16_t delay_num, SpliceMode mode, ChunkWriter &writer,
                    const AssembleOptions &options,
                    const std::vector<uint8_t> *reference_ihdr = nullptr,
                    SpliceStats *stats = nullptr);

// File variant of splice_frame.
Status splice_frame_file(const std::string &path, uint32_t width, uint32_t height,
                         uint16_t delay_num, SpliceMode mode, ChunkWriter &writer,
                         const AssembleOptions &options,
                         const std::vector<uint8_t> *reference_ihdr = nullptr,
                         SpliceStats *stats = nullptr);

}  // namespace pngreel
