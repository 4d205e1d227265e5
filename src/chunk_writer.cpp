//
//  chunk_writer.cpp
//  PngReel
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "chunk_writer.hpp"

#include <string>

#include "logging.hpp"

namespace pngreel {

ChunkWriter::ChunkWriter(std::ostream &out) : out_(out) {}

Status ChunkWriter::fail(ErrorKind kind, std::string message) {
    status_ = Status::failure(kind, std::move(message));
    return status_;
}

void ChunkWriter::release_sequence() {
    if (sequence_ > 0) {
        --sequence_;
    }
}

// -----------------------------------------------------------------------------
// Signature.
// -----------------------------------------------------------------------------
Status ChunkWriter::write_signature() {
    if (!status_.ok) {
        return status_;
    }
    out_.write(reinterpret_cast<const char *>(kPngSignature.data()), kPngSignature.size());
    if (!out_) {
        return fail(ErrorKind::Io, "failed to write PNG signature");
    }
    bytes_written_ += kPngSignature.size();
    return status_;
}

// -----------------------------------------------------------------------------
// Write header, payload, footer in that order.
// -----------------------------------------------------------------------------
Status ChunkWriter::emit(const uint8_t *header, const uint8_t *data, size_t size,
                         const uint8_t *footer) {
    out_.write(reinterpret_cast<const char *>(header), 8);
    if (size > 0) {
        out_.write(reinterpret_cast<const char *>(data), static_cast<std::streamsize>(size));
    }
    out_.write(reinterpret_cast<const char *>(footer), 4);
    if (!out_) {
        const uint32_t type = get_u32(header + 4);
        return fail(ErrorKind::Io, "failed to write " + fourcc_to_string(type) + " chunk");
    }
    ++chunks_written_;
    bytes_written_ += size + kChunkOverhead;
    return status_;
}

Status ChunkWriter::write_chunk(uint32_t type, const uint8_t *data, size_t size) {
    if (!status_.ok) {
        return status_;
    }
    if (!fits_chunk_length(size)) {
        return fail(ErrorKind::Unsupported, fourcc_to_string(type) +
                                                " chunk is too large: " + std::to_string(size));
    }
    uint8_t header[8];
    put_u32(header, static_cast<uint32_t>(size));
    put_u32(header + 4, type);
    uint8_t footer[4];
    put_u32(footer, chunk_crc(type, data, size));

    PR_LOG("writer", fourcc_to_string(type) << " length=" << size
                                            << " hex=" << hex_prefix(data, size));
    return emit(header, data, size, footer);
}

// -----------------------------------------------------------------------------
// APNG control chunks.
// -----------------------------------------------------------------------------
Status ChunkWriter::write_animation_control(uint32_t frame_count, uint32_t loop_count) {
    std::vector<uint8_t> p;
    p.reserve(8);
    write_u32(p, frame_count);  // number of frames, not the sequence number
    write_u32(p, loop_count);   // 0 = loop forever
    return write_chunk(kTagACTL, p);
}

Status ChunkWriter::write_frame_control(const FrameControl &fc) {
    std::vector<uint8_t> p;
    p.reserve(26);
    write_u32(p, fc.sequence);
    write_u32(p, fc.width);
    write_u32(p, fc.height);
    write_u32(p, 0);  // x_offset
    write_u32(p, 0);  // y_offset
    write_u16(p, fc.delay_num);
    write_u16(p, 0);  // delay_den; 0 is read as 100
    write_u8(p, 0);   // dispose_op: none
    write_u8(p, 0);   // blend_op: source
    return write_chunk(kTagFCTL, p);
}

Status ChunkWriter::write_end() { return write_chunk(kTagIEND, nullptr, 0); }

}  // namespace pngreel
