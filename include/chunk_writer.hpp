//
//  chunk_writer.hpp
//  PngReel
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <ostream>
#include <vector>

#include "png_chunk.hpp"
#include "status.hpp"

namespace pngreel {

// Frame control fields written by this assembler; offsets, disposal and blend are fixed.
struct FrameControl {
    uint32_t sequence = 0;
    uint32_t width = 0;
    uint32_t height = 0;
    uint16_t delay_num = 0;  // hundredths of a second (denominator written as 0)
};

// Serializes chunks to an output stream and owns the APNG sequence counter shared by every
// fcTL and fdAT chunk of the file.
//
// Each call returns its own status. After the first failure the writer stays failed: later
// calls write nothing and return the original error, which `status()` also reports.
class ChunkWriter {
   public:
    explicit ChunkWriter(std::ostream &out);

    Status write_signature();

    // Length and CRC are always derived from `payload`.
    Status write_chunk(uint32_t type, const uint8_t *data, size_t size);
    Status write_chunk(uint32_t type, const std::vector<uint8_t> &payload) {
        return write_chunk(type, payload.data(), payload.size());
    }

    // acTL: frame count + loop count (0 = infinite).
    Status write_animation_control(uint32_t frame_count, uint32_t loop_count);

    // fcTL: 26-byte payload, full-canvas frame, no disposal, source blend.
    Status write_frame_control(const FrameControl &fc);

    // Zero-length IEND.
    Status write_end();

    // Sequence counter.
    uint32_t next_sequence() { return sequence_++; }
    void release_sequence();
    uint32_t sequence_count() const { return sequence_; }

    const Status &status() const { return status_; }
    uint64_t chunks_written() const { return chunks_written_; }
    uint64_t bytes_written() const { return bytes_written_; }

   private:
    Status emit(const uint8_t *header, const uint8_t *data, size_t size, const uint8_t *footer);
    Status fail(ErrorKind kind, std::string message);

    std::ostream &out_;
    Status status_;
    uint32_t sequence_ = 0;
    uint64_t chunks_written_ = 0;
    uint64_t bytes_written_ = 0;
};

}  // namespace pngreel
