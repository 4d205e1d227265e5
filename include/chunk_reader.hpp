//
//  chunk_reader.hpp
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

#include "png_chunk.hpp"
#include "status.hpp"

namespace pngreel {

// Pulls one length-prefixed, typed, checksummed chunk at a time from a PNG byte stream.
// The payload buffer is owned by the reader and reused across calls; it grows on demand but
// never beyond the configured maximum chunk size.
class ChunkReader {
   public:
    explicit ChunkReader(std::istream &in, size_t max_chunk_size = kDefaultMaxChunkSize,
                         bool verify_crc = true);

    // Consume and validate the 8-byte PNG signature.
    Status check_signature();

    // Read the next chunk. On success `wire_size` receives length + 12.
    Status next_chunk(uint32_t &wire_size);

    uint32_t type() const { return type_; }
    const std::vector<uint8_t> &payload() const { return payload_; }
    uint32_t stored_crc() const { return crc_; }

    // Copy of the most recent chunk, stored CRC included.
    Chunk current_chunk() const;

    // Bytes consumed from the stream so far.
    uint64_t offset() const { return offset_; }

   private:
    bool read_exact(uint8_t *dst, size_t n);

    std::istream &in_;
    size_t max_chunk_size_;
    bool verify_crc_;

    uint32_t type_ = 0;
    uint32_t crc_ = 0;
    std::vector<uint8_t> payload_;
    uint64_t offset_ = 0;
};

}  // namespace pngreel
