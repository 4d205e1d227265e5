//
//  chunk_reader.cpp
//  PngReel
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "chunk_reader.hpp"

#include <algorithm>
#include <sstream>

#include "logging.hpp"

namespace pngreel {

ChunkReader::ChunkReader(std::istream &in, size_t max_chunk_size, bool verify_crc)
    : in_(in), max_chunk_size_(max_chunk_size), verify_crc_(verify_crc) {}

bool ChunkReader::read_exact(uint8_t *dst, size_t n) {
    if (n == 0) {
        return true;
    }
    in_.read(reinterpret_cast<char *>(dst), static_cast<std::streamsize>(n));
    const auto got = in_.gcount();
    offset_ += static_cast<uint64_t>(got);
    return static_cast<size_t>(got) == n;
}

// -----------------------------------------------------------------------------
// Signature.
// -----------------------------------------------------------------------------
Status ChunkReader::check_signature() {
    uint8_t sig[kPngSignature.size()];
    if (!read_exact(sig, sizeof(sig))) {
        return Status::failure(ErrorKind::Io, "unexpected end of stream reading signature");
    }
    if (!std::equal(kPngSignature.begin(), kPngSignature.end(), sig)) {
        PR_LOG("debug", "signature mismatch, got " << hex_prefix(sig, sizeof(sig)));
        return Status::failure(ErrorKind::Format, "not a PNG file");
    }
    return Status::success();
}

// -----------------------------------------------------------------------------
// Chunk: length, type, payload, crc.
// -----------------------------------------------------------------------------
Status ChunkReader::next_chunk(uint32_t &wire_size) {
    const uint64_t chunk_offset = offset_;
    uint8_t header[8];
    if (!read_exact(header, sizeof(header))) {
        return Status::failure(ErrorKind::Io, "unexpected end of stream reading chunk header");
    }
    const uint32_t length = get_u32(header);
    const uint32_t type = get_u32(header + 4);

    if (!fits_chunk_length(length)) {
        std::ostringstream msg;
        msg << "chunk length " << length << " at offset " << chunk_offset
            << " exceeds the PNG limit";
        return Status::failure(ErrorKind::Format, msg.str());
    }
    if (!is_valid_chunk_tag(type)) {
        std::ostringstream msg;
        msg << "invalid chunk type " << hex_prefix(header + 4, 4) << " at offset "
            << chunk_offset;
        return Status::failure(ErrorKind::Format, msg.str());
    }
    // Reject before touching the buffer; the whole chunk must fit the configured bound.
    if (static_cast<uint64_t>(length) + kChunkOverhead > max_chunk_size_) {
        std::ostringstream msg;
        msg << fourcc_to_string(type) << " chunk too large: " << length << " bytes (limit "
            << (max_chunk_size_ > kChunkOverhead ? max_chunk_size_ - kChunkOverhead : 0) << ")";
        return Status::failure(ErrorKind::Format, msg.str());
    }

    payload_.resize(length);
    if (!read_exact(payload_.data(), length)) {
        std::ostringstream msg;
        msg << "unexpected end of stream in " << fourcc_to_string(type) << " payload";
        return Status::failure(ErrorKind::Io, msg.str());
    }
    uint8_t footer[4];
    if (!read_exact(footer, sizeof(footer))) {
        std::ostringstream msg;
        msg << "unexpected end of stream in " << fourcc_to_string(type) << " checksum";
        return Status::failure(ErrorKind::Io, msg.str());
    }
    type_ = type;
    crc_ = get_u32(footer);

    if (verify_crc_) {
        const uint32_t expected = chunk_crc(type_, payload_.data(), payload_.size());
        if (expected != crc_) {
            std::ostringstream msg;
            msg << fourcc_to_string(type_) << " checksum mismatch at offset " << chunk_offset
                << " (stored 0x" << std::hex << crc_ << ", computed 0x" << expected << ")";
            return Status::failure(ErrorKind::Format, msg.str());
        }
    }

    wire_size = length + static_cast<uint32_t>(kChunkOverhead);
    PR_LOG("reader", fourcc_to_string(type_) << " length=" << length << " offset="
                                             << chunk_offset
                                             << " hex=" << hex_prefix(payload_));
    return Status::success();
}

Chunk ChunkReader::current_chunk() const {
    Chunk c(type_, payload_);
    c.crc = crc_;
    return c;
}

}  // namespace pngreel
