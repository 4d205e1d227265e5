//
//  apng_assembler.cpp
//  PngReel
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "apng_assembler.hpp"

#include <cerrno>
#include <chrono>
#include <fstream>
#include <limits>
#include <system_error>

#include "chunk_reader.hpp"
#include "chunk_writer.hpp"
#include "frame_splicer.hpp"
#include "logging.hpp"

namespace pngreel {

namespace {

constexpr size_t kIhdrMinPayload = 8;  // width + height

// Read signature + IHDR of the first frame.
Status read_first_header(const std::string &path, const AssembleOptions &options, Chunk &ihdr) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        PR_LOG("debug", "open failed for " << path << " errno=" << errno << " ("
                                           << std::generic_category().message(errno) << ")");
        return Status::failure(ErrorKind::Io, "could not open first frame file: " + path);
    }
    ChunkReader reader(f, options.max_chunk_size, options.verify_crc);
    auto st = reader.check_signature();
    if (!st.ok) {
        return with_source(st, path);
    }
    uint32_t wire_size = 0;
    st = reader.next_chunk(wire_size);
    if (!st.ok) {
        return with_source(st, path);
    }
    if (reader.type() != kTagIHDR) {
        return with_source(Status::failure(ErrorKind::Format,
                                           "expected IHDR, found " +
                                               fourcc_to_string(reader.type())),
                           path);
    }
    if (reader.payload().size() < kIhdrMinPayload) {
        return with_source(Status::failure(ErrorKind::Format, "IHDR too short"), path);
    }
    ihdr = reader.current_chunk();
    return st;
}

// Reject unusable requests before anything is read or written.
Status check_request(const std::vector<FrameSpec> &frames, const AssembleOptions &options) {
    if (frames.empty()) {
        return Status::failure(ErrorKind::InvalidArgument, "no input frames");
    }
    if (frames.size() > std::numeric_limits<uint32_t>::max()) {
        return Status::failure(ErrorKind::Unsupported, "too many frames");
    }
    if (options.max_chunk_size < kMinChunkSize) {
        return Status::failure(ErrorKind::InvalidArgument,
                               "max chunk size must be at least " + std::to_string(kMinChunkSize));
    }
    return Status::success();
}

}  // namespace

// -----------------------------------------------------------------------------
// Complete APNG writer.
// -----------------------------------------------------------------------------
Status write_apng(std::ostream &out, const std::vector<FrameSpec> &frames,
                  const AssembleOptions &options, AssembleReport *report) {
    auto now = [] { return std::chrono::steady_clock::now(); };
    const auto t_start = now();

    auto st = check_request(frames, options);
    if (!st.ok) {
        return st;
    }
    PR_LOG("debug", "write_apng begin frames=" << frames.size() << " max_chunk_size="
                                               << options.max_chunk_size
                                               << " loops=" << options.loop_count
                                               << " verify_crc=" << options.verify_crc);

    //
    // 1) Header of the first frame.
    //
    Chunk ihdr;
    st = read_first_header(frames[0].path, options, ihdr);
    if (!st.ok) {
        return st;
    }
    const uint32_t width = get_u32(ihdr.payload.data());
    const uint32_t height = get_u32(ihdr.payload.data() + 4);
    PR_LOG("info", "Image dimensions: " << width << " x " << height);

    ChunkWriter writer(out);
    st = writer.write_signature();
    if (!st.ok) {
        return st;
    }
    // Same bytes as the input IHDR when its stored CRC is sound.
    st = writer.write_chunk(kTagIHDR, ihdr.payload);
    if (!st.ok) {
        return st;
    }

    //
    // 2) Animation control.
    //
    st = writer.write_animation_control(static_cast<uint32_t>(frames.size()), options.loop_count);
    if (!st.ok) {
        return st;
    }

    //
    // 3) Frames, strictly in order; the sequence counter lives in the writer.
    //
    for (size_t i = 0; i < frames.size(); ++i) {
        const auto &frame = frames[i];
        PR_LOG("info", "Encoding: " << frame.path);
        const SpliceMode mode = i == 0 ? SpliceMode::FirstFrame : SpliceMode::Subsequent;
        SpliceStats stats;
        st = splice_frame_file(frame.path, width, height, frame.delay_num, mode, writer, options,
                               i == 0 ? nullptr : &ihdr.payload, &stats);
        if (!st.ok) {
            return st;
        }
        PR_LOG("debug", "frame[" << i << "] delay_num=" << frame.delay_num
                                 << " blocks=" << stats.data_blocks
                                 << " bytes=" << stats.image_bytes);
    }

    //
    // 4) IEND.
    //
    st = writer.write_end();
    if (!st.ok) {
        return st;
    }
    out.flush();
    if (!out) {
        return Status::failure(ErrorKind::Io, "failed to flush output");
    }

    // The writer keeps its first failure; check it before reporting success.
    if (!writer.status().ok) {
        return writer.status();
    }

    PR_LOG("info", "Wrote " << frames.size() << " frames split up in "
                            << writer.sequence_count() << " animation chunks");
    PR_LOG("debug", "write_apng done chunks=" << writer.chunks_written()
                                              << " bytes=" << writer.bytes_written()
                                              << " ms="
                                              << std::chrono::duration_cast<
                                                     std::chrono::milliseconds>(now() - t_start)
                                                     .count());
    if (report) {
        report->frames = static_cast<uint32_t>(frames.size());
        report->width = width;
        report->height = height;
        report->sequence_numbers = writer.sequence_count();
        report->chunks = writer.chunks_written();
        report->bytes = writer.bytes_written();
    }
    return Status::success();
}

Status write_apng_file(const std::string &output_path, const std::vector<FrameSpec> &frames,
                       const AssembleOptions &options, AssembleReport *report) {
    // An existing output file stays untouched when the request is rejected.
    auto st = check_request(frames, options);
    if (!st.ok) {
        return st;
    }
    std::ofstream out(output_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        PR_LOG("debug", "open failed for " << output_path << " errno=" << errno << " ("
                                           << std::generic_category().message(errno) << ")");
        return Status::failure(ErrorKind::Io, "could not open output file: " + output_path);
    }
    st = write_apng(out, frames, options, report);
    if (!st.ok) {
        return st;
    }
    out.close();
    if (out.fail()) {
        return Status::failure(ErrorKind::Io, "failed to close output file: " + output_path);
    }
    return st;
}

}  // namespace pngreel
