//
//  png_chunk.cpp
//  PngReel
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "png_chunk.hpp"

#include <zlib.h>

#include "status.hpp"

namespace pngreel {

// -----------------------------------------------------------------------------
// CRC over type + data.
// -----------------------------------------------------------------------------
uint32_t chunk_crc(uint32_t type, const uint8_t *data, size_t size) {
    uint8_t tag[4];
    put_u32(tag, type);

    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, tag, 4);

    // zlib takes uInt lengths; feed large payloads in slices.
    while (size > 0) {
        const uInt slice = size > 0x40000000 ? 0x40000000u : static_cast<uInt>(size);
        crc = crc32(crc, data, slice);
        data += slice;
        size -= slice;
    }
    return static_cast<uint32_t>(crc);
}

uint32_t Chunk::compute_crc() const { return chunk_crc(type, payload.data(), payload.size()); }

// -----------------------------------------------------------------------------
// Error kind names, used in diagnostics.
// -----------------------------------------------------------------------------
const char *error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:
            return "none";
        case ErrorKind::Format:
            return "invalid format";
        case ErrorKind::Unsupported:
            return "unsupported feature";
        case ErrorKind::Io:
            return "i/o error";
        case ErrorKind::InvalidArgument:
            return "invalid argument";
    }
    return "unknown";
}

}  // namespace pngreel
