//
//  frame_splicer.cpp
//  PngReel
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "frame_splicer.hpp"

#include <cerrno>
#include <fstream>
#include <system_error>

#include "chunk_reader.hpp"
#include "logging.hpp"

namespace pngreel {

FrameSplicer::FrameSplicer(ChunkWriter &writer, SpliceMode mode, size_t max_chunk_size)
    : writer_(writer),
      mode_(mode),
      limit_(max_chunk_size > kDataBlockReserve + 4 ? max_chunk_size - kDataBlockReserve : 5) {
    buffer_.reserve(limit_);
}

// -----------------------------------------------------------------------------
// Block bookkeeping.
// -----------------------------------------------------------------------------
void FrameSplicer::start_block() {
    buffer_.clear();
    if (mode_ == SpliceMode::Subsequent) {
        // The sequence number is taken before any image byte of the block is buffered.
        write_u32(buffer_, writer_.next_sequence());
        ++stats_.sequence_numbers;
    }
}

Status FrameSplicer::flush_block() {
    const uint32_t tag = mode_ == SpliceMode::FirstFrame ? kTagIDAT : kTagFDAT;
    auto st = writer_.write_chunk(tag, buffer_);
    if (!st.ok) {
        return st;
    }
    ++stats_.data_blocks;
    start_block();
    return st;
}

// -----------------------------------------------------------------------------
// fcTL + first block.
// -----------------------------------------------------------------------------
Status FrameSplicer::begin(uint32_t width, uint32_t height, uint16_t delay_num) {
    FrameControl fc;
    fc.sequence = writer_.next_sequence();
    fc.width = width;
    fc.height = height;
    fc.delay_num = delay_num;
    ++stats_.sequence_numbers;
    auto st = writer_.write_frame_control(fc);
    if (!st.ok) {
        return st;
    }
    start_block();
    return st;
}

Status FrameSplicer::append(const uint8_t *data, size_t size) {
    // Pending bytes plus the whole incoming chunk as it sits on the wire.
    if (has_image_bytes() && buffer_.size() + size + kChunkOverhead > limit_) {
        auto st = flush_block();
        if (!st.ok) {
            return st;
        }
    }
    while (size > limit_ - buffer_.size()) {
        size_t take = limit_ - buffer_.size();
        // An IDAT remainder of 4 bytes or less would fall under the tail rule in finish();
        // split earlier so at least 5 bytes carry over.
        const size_t rest = size - take;
        if (mode_ == SpliceMode::FirstFrame && rest <= 4 && take > 4) {
            take -= 5 - rest;
        }
        buffer_.insert(buffer_.end(), data, data + take);
        stats_.image_bytes += take;
        data += take;
        size -= take;
        auto st = flush_block();
        if (!st.ok) {
            return st;
        }
    }
    if (size > 0) {
        buffer_.insert(buffer_.end(), data, data + size);
        stats_.image_bytes += size;
    }
    return Status::success();
}

Status FrameSplicer::finish() {
    // Tail of 4 bytes or less is dropped: in fdAT mode that is the bare sequence prefix, in
    // IDAT mode a fragment too short to matter.
    if (buffer_.size() > 4) {
        const uint32_t tag = mode_ == SpliceMode::FirstFrame ? kTagIDAT : kTagFDAT;
        auto st = writer_.write_chunk(tag, buffer_);
        if (!st.ok) {
            return st;
        }
        ++stats_.data_blocks;
    } else if (mode_ == SpliceMode::Subsequent) {
        // Only a block opened by start_block() holds a reserved number.
        if (buffer_.size() == 4) {
            writer_.release_sequence();
            --stats_.sequence_numbers;
            PR_LOG("splice", "discarded prefix-only fdAT, sequence released");
        }
    } else if (!buffer_.empty()) {
        stats_.image_bytes -= buffer_.size();
        PR_LOG("splice", "dropped " << buffer_.size() << " trailing IDAT bytes");
    }
    buffer_.clear();
    return Status::success();
}

// -----------------------------------------------------------------------------
// Stream one source file.
// -----------------------------------------------------------------------------
Status splice_frame(std::istream &in, const std::string &source_name, uint32_t width,
                    uint32_t height, uint16_t delay_num, SpliceMode mode, ChunkWriter &writer,
                    const AssembleOptions &options, const std::vector<uint8_t> *reference_ihdr,
                    SpliceStats *stats) {
    ChunkReader reader(in, options.max_chunk_size, options.verify_crc);
    auto st = reader.check_signature();
    if (!st.ok) {
        return with_source(st, source_name);
    }

    // Header block; identical across frames by precondition.
    uint32_t wire_size = 0;
    st = reader.next_chunk(wire_size);
    if (!st.ok) {
        return with_source(st, source_name);
    }
    if (reader.type() != kTagIHDR) {
        return with_source(Status::failure(ErrorKind::Format,
                                           "expected IHDR, found " +
                                               fourcc_to_string(reader.type())),
                           source_name);
    }
    if (reference_ihdr && reader.payload() != *reference_ihdr) {
        PR_LOG("warn", source_name << ": IHDR differs from the first frame; using first frame's");
    }

    FrameSplicer splicer(writer, mode, options.max_chunk_size);
    st = splicer.begin(width, height, delay_num);
    if (!st.ok) {
        return st;
    }

    for (;;) {
        st = reader.next_chunk(wire_size);
        if (!st.ok) {
            return with_source(st, source_name);
        }
        if (reader.type() == kTagIEND) {
            break;
        }
        if (reader.type() == kTagIDAT) {
            st = splicer.append(reader.payload().data(), reader.payload().size());
            if (!st.ok) {
                return st;
            }
        } else if (is_critical_chunk(reader.type())) {
            PR_LOG("warn", source_name << ": dropping critical chunk "
                                       << fourcc_to_string(reader.type()));
        } else {
            PR_LOG("splice", source_name << ": skipping " << fourcc_to_string(reader.type())
                                         << " (" << wire_size << " bytes)");
        }
    }

    st = splicer.finish();
    if (!st.ok) {
        return st;
    }
    PR_LOG("debug", source_name << ": blocks=" << splicer.stats().data_blocks
                                << " image_bytes=" << splicer.stats().image_bytes
                                << " seq_used=" << splicer.stats().sequence_numbers);
    if (stats) {
        *stats = splicer.stats();
    }
    return st;
}

Status splice_frame_file(const std::string &path, uint32_t width, uint32_t height,
                         uint16_t delay_num, SpliceMode mode, ChunkWriter &writer,
                         const AssembleOptions &options, const std::vector<uint8_t> *reference_ihdr,
                         SpliceStats *stats) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        PR_LOG("debug", "open failed for " << path << " errno=" << errno << " ("
                                           << std::generic_category().message(errno) << ")");
        return Status::failure(ErrorKind::Io, "could not open frame file: " + path);
    }
    return splice_frame(f, path, width, height, delay_num, mode, writer, options,
                        reference_ihdr, stats);
}

}  // namespace pngreel
