// Unit coverage for ChunkWriter: chunk layout, CRC, APNG control chunks, sequence counter and
// failure handling.
#include <cstdint>
#include <cstdio>
#include <sstream>
#include <string>
#include <vector>

#include "chunk_writer.hpp"
#include "logging.hpp"
#include "test_utils.hpp"

using pngreel::ChunkWriter;
using pngreel::ErrorKind;
using pngreel::FrameControl;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::fprintf(stderr, "[chunk_writer_unit] FAIL: %s\n", msg.c_str());
    }
    return cond;
}

std::vector<uint8_t> bytes_of(const std::ostringstream &out) {
    const std::string s = out.str();
    return std::vector<uint8_t>(s.begin(), s.end());
}

bool test_iend_bytes() {
    std::ostringstream out;
    ChunkWriter writer(out);
    bool ok = check(writer.write_end().ok, "IEND written");
    const std::vector<uint8_t> expected = {0x00, 0x00, 0x00, 0x00, 'I',  'E',
                                           'N',  'D',  0xAE, 0x42, 0x60, 0x82};
    ok &= check(bytes_of(out) == expected, "IEND matches the canonical 12 bytes");
    ok &= check(writer.chunks_written() == 1 && writer.bytes_written() == 12, "counters");
    return ok;
}

bool test_chunk_layout() {
    std::ostringstream out;
    ChunkWriter writer(out);
    const auto payload = test_utils::pattern(37, 9);
    bool ok = check(writer.write_chunk(kTagIDAT, payload).ok, "IDAT written");
    auto chunks = test_utils::parse_chunks(bytes_of(out));
    ok &= check(chunks && chunks->size() == 1, "one chunk parsed back");
    if (!ok) {
        return false;
    }
    const auto &c = chunks->front();
    ok &= check(c.type == "IDAT", "type tag");
    ok &= check(c.payload == payload, "payload bytes");
    ok &= check(c.crc_ok, "CRC covers type + payload");
    return ok;
}

bool test_signature_and_header() {
    std::ostringstream out;
    ChunkWriter writer(out);
    pngreel::Chunk ihdr(kTagIHDR, test_utils::make_ihdr(3, 2));
    ihdr.crc = 0x01020304;  // stale value from a damaged input
    bool ok = check(writer.write_signature().ok, "signature written");
    ok &= check(writer.write_chunk(ihdr.type, ihdr.payload).ok, "IHDR written");
    auto bytes = bytes_of(out);
    ok &= check(bytes.size() == 8 + 25, "signature + IHDR size");
    ok &= check(std::equal(test_utils::kSignature.begin(), test_utils::kSignature.end(),
                           bytes.begin()),
                "signature bytes");
    ok &= check(test_utils::be32(&bytes[bytes.size() - 4]) == ihdr.compute_crc(),
                "CRC recomputed from the payload");
    std::vector<uint8_t> expected = test_utils::kSignature;
    test_utils::append_chunk(expected, "IHDR", ihdr.payload);
    ok &= check(bytes == expected, "matches a well-formed IHDR byte for byte");
    return ok;
}

bool test_animation_control() {
    std::ostringstream out;
    ChunkWriter writer(out);
    bool ok = check(writer.write_animation_control(3, 0).ok, "acTL written");
    auto chunks = test_utils::parse_chunks(bytes_of(out));
    ok &= check(chunks && chunks->size() == 1, "acTL parsed");
    if (!ok) {
        return false;
    }
    const auto &c = chunks->front();
    ok &= check(c.type == "acTL" && c.payload.size() == 8, "acTL is 8 bytes");
    ok &= check(test_utils::be32(&c.payload[0]) == 3, "num_frames");
    ok &= check(test_utils::be32(&c.payload[4]) == 0, "num_plays 0 = infinite");
    ok &= check(c.crc_ok, "acTL CRC");
    return ok;
}

bool test_frame_control() {
    std::ostringstream out;
    ChunkWriter writer(out);
    FrameControl fc;
    fc.sequence = 7;
    fc.width = 640;
    fc.height = 480;
    fc.delay_num = 15;
    bool ok = check(writer.write_frame_control(fc).ok, "fcTL written");
    auto chunks = test_utils::parse_chunks(bytes_of(out));
    ok &= check(chunks && chunks->size() == 1, "fcTL parsed");
    if (!ok) {
        return false;
    }
    const auto &p = chunks->front().payload;
    ok &= check(chunks->front().type == "fcTL" && p.size() == 26, "fcTL is 26 bytes");
    ok &= check(test_utils::be32(&p[0]) == 7, "sequence_number");
    ok &= check(test_utils::be32(&p[4]) == 640 && test_utils::be32(&p[8]) == 480, "size");
    ok &= check(test_utils::be32(&p[12]) == 0 && test_utils::be32(&p[16]) == 0, "offsets 0");
    ok &= check(test_utils::be16(&p[20]) == 15, "delay_num");
    ok &= check(test_utils::be16(&p[22]) == 0, "delay_den 0");
    ok &= check(p[24] == 0 && p[25] == 0, "dispose none, blend source");
    return ok;
}

bool test_sequence_counter() {
    std::ostringstream out;
    ChunkWriter writer(out);
    bool ok = check(writer.sequence_count() == 0, "counter starts at 0");
    ok &= check(writer.next_sequence() == 0, "first value 0");
    ok &= check(writer.next_sequence() == 1, "second value 1");
    writer.release_sequence();
    ok &= check(writer.sequence_count() == 1, "release gives the last value back");
    ok &= check(writer.next_sequence() == 1, "released value handed out again");

    ChunkWriter fresh(out);
    fresh.release_sequence();
    ok &= check(fresh.sequence_count() == 0, "release never goes below 0");
    return ok;
}

bool test_failed_stream() {
    std::ostringstream out;
    out.setstate(std::ios::badbit);
    ChunkWriter writer(out);
    auto first = writer.write_chunk(kTagIDAT, test_utils::pattern(4, 1));
    bool ok = check(!first.ok && first.kind == ErrorKind::Io, "write failure is an I/O error");
    auto later = writer.write_end();
    ok &= check(!later.ok && later.message == first.message, "later calls keep the first error");
    ok &= check(!writer.status().ok && writer.status().message == first.message,
                "status() reports the first error");
    ok &= check(writer.chunks_written() == 0, "nothing counted as written");
    return ok;
}

bool test_length_limit() {
    bool ok = check(pngreel::fits_chunk_length(0), "empty fits");
    ok &= check(pngreel::fits_chunk_length(0x7FFFFFFFULL), "2^31-1 fits");
    ok &= check(!pngreel::fits_chunk_length(0x80000000ULL), "2^31 does not fit");
    ok &= check(!pngreel::fits_chunk_length(0x100000000ULL), "beyond 32 bits does not fit");
    return ok;
}

}  // namespace

int main() {
    pngreel::set_log_verbosity(pngreel::LogVerbosity::Error);
    bool ok = true;
    ok &= test_iend_bytes();
    ok &= test_chunk_layout();
    ok &= test_signature_and_header();
    ok &= test_animation_control();
    ok &= test_frame_control();
    ok &= test_sequence_counter();
    ok &= test_failed_stream();
    ok &= test_length_limit();
    return ok ? 0 : 1;
}
