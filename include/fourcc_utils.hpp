//
//  fourcc_utils.hpp
//  PngReel
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <string>

// FourCC helpers.
inline constexpr uint32_t fourcc(const char a, const char b, const char c, const char d) {
    return (uint32_t(uint8_t(a)) << 24) | (uint32_t(uint8_t(b)) << 16) |
           (uint32_t(uint8_t(c)) << 8) | (uint32_t(uint8_t(d)));
}

inline constexpr uint32_t fourcc(const char t[4]) { return fourcc(t[0], t[1], t[2], t[3]); }

// PNG chunk type codes are restricted to ASCII letters.
inline bool is_valid_chunk_tag(uint32_t type) {
    for (int i = 0; i < 4; ++i) {
        const uint8_t c = static_cast<uint8_t>(type >> (24 - 8 * i));
        const bool upper = c >= 'A' && c <= 'Z';
        const bool lower = c >= 'a' && c <= 'z';
        if (!upper && !lower) {
            return false;
        }
    }
    return true;
}

// Bit 5 of the first byte: uppercase = critical, lowercase = ancillary.
inline constexpr bool is_critical_chunk(uint32_t type) { return ((type >> 24) & 0x20) == 0; }

inline std::string fourcc_to_string(uint32_t type) {
    std::string s(4, ' ');
    s[0] = static_cast<char>((type >> 24) & 0xFF);
    s[1] = static_cast<char>((type >> 16) & 0xFF);
    s[2] = static_cast<char>((type >> 8) & 0xFF);
    s[3] = static_cast<char>(type & 0xFF);
    return s;
}

// Chunk tags used by the assembler.
inline constexpr uint32_t kTagIHDR = fourcc('I', 'H', 'D', 'R');
inline constexpr uint32_t kTagIDAT = fourcc('I', 'D', 'A', 'T');
inline constexpr uint32_t kTagIEND = fourcc('I', 'E', 'N', 'D');
inline constexpr uint32_t kTagACTL = fourcc('a', 'c', 'T', 'L');
inline constexpr uint32_t kTagFCTL = fourcc('f', 'c', 'T', 'L');
inline constexpr uint32_t kTagFDAT = fourcc('f', 'd', 'A', 'T');
