//
//  pngreel.cpp
//  PngReel
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//
#include "pngreel.hpp"
#include "pngreel_version.hpp"

#include <chrono>

#include "logging.hpp"

namespace pngreel {

std::string version_string() { return PNGREEL_VERSION_DISPLAY; }

Status assemble_apng(const std::vector<FrameSpec> &frames, const std::string &output_path,
                     const AssembleOptions &options) {
    PR_LOG("debug", "assemble_apng frames=" << frames.size() << " output=" << output_path);
    return write_apng_file(output_path, frames, options, nullptr);
}

Status run(const RunConfig &config, AssembleReport *report) {
    const auto t0 = std::chrono::steady_clock::now();
    std::vector<FrameSpec> frames;
    AssembleOptions options;
    auto st = resolve_frames(config, frames, options);
    if (!st.ok) {
        return st;
    }
    if (frames.empty()) {
        std::string msg = config.manifest.empty()
                              ? "no PNG files found in " + config.input_dir
                              : "manifest " + config.manifest + " lists no frames";
        return Status::failure(ErrorKind::InvalidArgument, msg);
    }

    st = write_apng_file(config.output, frames, options, report);
    if (!st.ok) {
        return st;
    }
    const auto t1 = std::chrono::steady_clock::now();
    PR_LOG("debug", "run done output=" << config.output << " ms="
                                       << std::chrono::duration_cast<std::chrono::milliseconds>(
                                              t1 - t0)
                                              .count());
    return st;
}

}  // namespace pngreel
