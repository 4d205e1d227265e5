//
//  png_chunk.hpp
//  PngReel
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

#include "fourcc_utils.hpp"

namespace pngreel {

// Fixed 8-byte PNG file signature.
inline constexpr std::array<uint8_t, 8> kPngSignature = {0x89, 'P',  'N',  'G',
                                                         0x0D, 0x0A, 0x1A, 0x0A};

// Length (4) + type (4) + CRC (4).
inline constexpr size_t kChunkOverhead = 12;

// Upper bound for one chunk on the wire (header, payload and CRC).
inline constexpr size_t kDefaultMaxChunkSize = 1024 * 1024;

// Bytes a data block leaves unused below the chunk limit: sequence prefix, length, type, CRC
// and one more word of slack.
inline constexpr size_t kDataBlockReserve = 5 * 4;

// PNG restricts chunk lengths to 2^31 - 1.
inline constexpr uint64_t kMaxChunkLength = 0x7FFFFFFFULL;

class Chunk {
   public:
    uint32_t type = 0;             // FourCC
    std::vector<uint8_t> payload;  // Data field only
    uint32_t crc = 0;              // As stored on the wire (see compute_crc)

    Chunk() = default;
    Chunk(uint32_t t, std::vector<uint8_t> p) : type(t), payload(std::move(p)) {}

    // Payload plus length, type and CRC fields.
    size_t wire_size() const { return payload.size() + kChunkOverhead; }

    // CRC-32 (IEEE) over the type tag followed by the payload.
    uint32_t compute_crc() const;
};

// CRC-32 over a tag and an arbitrary payload buffer.
uint32_t chunk_crc(uint32_t type, const uint8_t *data, size_t size);

// True when a payload of `size` bytes can be described by the length field.
inline constexpr bool fits_chunk_length(uint64_t size) { return size <= kMaxChunkLength; }

// ------------- Helper write functions ---------------------------------------

inline void write_u8(std::vector<uint8_t> &p, uint8_t v) { p.push_back(v); }

inline void write_u16(std::vector<uint8_t> &p, uint16_t v) {
    p.push_back((v >> 8) & 0xFF);
    p.push_back(v & 0xFF);
}

inline void write_u32(std::vector<uint8_t> &p, uint32_t v) {
    p.push_back((v >> 24) & 0xFF);
    p.push_back((v >> 16) & 0xFF);
    p.push_back((v >> 8) & 0xFF);
    p.push_back(v & 0xFF);
}

inline void put_u32(uint8_t *b, uint32_t v) {
    b[0] = static_cast<uint8_t>((v >> 24) & 0xFF);
    b[1] = static_cast<uint8_t>((v >> 16) & 0xFF);
    b[2] = static_cast<uint8_t>((v >> 8) & 0xFF);
    b[3] = static_cast<uint8_t>(v & 0xFF);
}

inline uint32_t get_u32(const uint8_t *b) {
    return (uint32_t(b[0]) << 24) | (uint32_t(b[1]) << 16) | (uint32_t(b[2]) << 8) |
           (uint32_t(b[3]));
}

}  // namespace pngreel
