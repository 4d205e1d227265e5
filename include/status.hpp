//
//  status.hpp
//  PngReel
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>
#include <utility>

namespace pngreel {

/// Failure classes reported by the reader, writer, splicer and assembler.
enum class ErrorKind {
    None = 0,
    Format,           ///< bad signature, malformed chunk framing, checksum mismatch
    Unsupported,      ///< payload too large for the 32-bit length field
    Io,               ///< open/read/write failure, premature end of stream
    InvalidArgument,  ///< caller supplied an unusable request (e.g. no frames)
};

/**
 * @brief Result object with success flag, error class and optional message.
 *
 * When `ok == true`, `kind` is `ErrorKind::None` and `message` is empty.
 */
struct Status {
    bool ok{true};
    ErrorKind kind{ErrorKind::None};
    std::string message;

    static Status success() { return Status{}; }
    static Status failure(ErrorKind kind, std::string message) {
        return Status{false, kind, std::move(message)};
    }
};

const char *error_kind_name(ErrorKind kind);

// Prefix a failure message with the file (or stream) it concerns.
inline Status with_source(Status st, const std::string &source) {
    if (!st.ok && !source.empty()) {
        st.message = source + ": " + st.message;
    }
    return st;
}

}  // namespace pngreel
