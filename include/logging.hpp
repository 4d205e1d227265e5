//
//  logging.hpp
//  PngReel
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace pngreel {

enum class LogVerbosity { Error = 0, Warn = 1, Info = 2, Debug = 3 };

// Set/get global logging verbosity.
void set_log_verbosity(LogVerbosity level);
LogVerbosity get_log_verbosity();

// Parse a CLI/manifest level name; unknown names map to Error.
LogVerbosity parse_log_verbosity(std::string_view name);

// Hex-preview helper used in debug logs to dump the first bytes of a chunk payload.
inline constexpr size_t kHexPreviewBytes = 8;
inline std::string hex_prefix(const uint8_t *data, size_t size,
                              size_t max_len = kHexPreviewBytes) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    const size_t limit = std::min(max_len, size);
    for (size_t i = 0; i < limit; ++i) {
        oss << std::setw(2) << static_cast<unsigned int>(data[i]);
        if (i + 1 != limit) {
            oss << ' ';
        }
    }
    return oss.str();
}

inline std::string hex_prefix(const std::vector<uint8_t> &data,
                              size_t max_len = kHexPreviewBytes) {
    return hex_prefix(data.data(), data.size(), max_len);
}

}  // namespace pngreel

inline constexpr pngreel::LogVerbosity pr_severity_for_tag(std::string_view tag) {
    if (tag == "error") {
        return pngreel::LogVerbosity::Error;
    }
    if (tag == "warn" || tag == "warning") {
        return pngreel::LogVerbosity::Warn;
    }
    if (tag == "info") {
        return pngreel::LogVerbosity::Info;
    }
    // Everything else (reader/writer/splice/etc.) treated as debug-level.
    return pngreel::LogVerbosity::Debug;
}

inline bool pr_should_log(const char *level) {
    const auto current = pngreel::get_log_verbosity();
    const auto sev = pr_severity_for_tag(level ? level : "");
    return static_cast<int>(sev) <= static_cast<int>(current);
}

inline void pr_log_impl(const char *level, const std::string &msg, const char *file, int line,
                        const char *func) {
    std::string lvl(level ? level : "");
    if (lvl == "error") {
        std::cerr << "[PngReel][" << level << "][" << file << ":" << line << " " << func
                  << "] " << msg << std::endl;
    } else {
        std::cerr << "[PngReel][" << level << "] " << msg << std::endl;
    }
}

#define PR_LOG(level, message)                                              \
    do {                                                                    \
        if (pr_should_log(level)) {                                         \
            std::ostringstream _pr_log_ss;                                  \
            _pr_log_ss << message;                                          \
            pr_log_impl(level, _pr_log_ss.str(), __FILE__, __LINE__,        \
                        __func__);                                          \
        }                                                                   \
    } while (0)
