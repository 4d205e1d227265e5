//
//  assembly_config.cpp
//  PngReel
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "assembly_config.hpp"

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <filesystem>
#include <fstream>
#include <limits>
#include <nlohmann/json.hpp>
#include <string_view>
#include <system_error>

using json = nlohmann::json;

namespace pngreel {

namespace {

constexpr long long kMaxDelayMs = 10LL * std::numeric_limits<uint16_t>::max();

std::string_view trim(std::string_view s) {
    const auto is_space = [](char c) {
        return c == ' ' || c == '\t' || c == '\r' || c == '\n';
    };
    while (!s.empty() && is_space(s.front())) {
        s.remove_prefix(1);
    }
    while (!s.empty() && is_space(s.back())) {
        s.remove_suffix(1);
    }
    return s;
}

std::optional<long long> parse_integer(std::string_view s) {
    s = trim(s);
    if (!s.empty() && s.front() == '+') {
        s.remove_prefix(1);
    }
    if (s.empty()) {
        return std::nullopt;
    }
    long long value = 0;
    const auto res = std::from_chars(s.data(), s.data() + s.size(), value);
    if (res.ec != std::errc() || res.ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

uint16_t delay_ms_to_hundredths(long long delay_ms) {
    if (delay_ms < 0) {
        PR_LOG("warn", "negative delay " << delay_ms << " ms clamped to 0");
        return 0;
    }
    if (delay_ms > kMaxDelayMs) {
        PR_LOG("warn", "delay " << delay_ms << " ms clamped to " << kMaxDelayMs << " ms");
        return std::numeric_limits<uint16_t>::max();
    }
    return static_cast<uint16_t>(delay_ms / 10);
}

// -----------------------------------------------------------------------------
// Input discovery.
// -----------------------------------------------------------------------------
Status discover_frames(const std::string &dir, std::vector<std::string> &files) {
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        return Status::failure(ErrorKind::Io,
                               "could not read directory " + dir + " (" + ec.message() + ")");
    }
    std::vector<std::filesystem::path> found;
    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (ec) {
            return Status::failure(ErrorKind::Io,
                                   "could not list directory " + dir + " (" + ec.message() + ")");
        }
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec)) {
            continue;
        }
        const auto &p = it->path();
        if (p.extension() == ".png") {
            found.push_back(p);
        }
    }
    if (ec) {
        return Status::failure(ErrorKind::Io,
                               "could not list directory " + dir + " (" + ec.message() + ")");
    }
    std::sort(found.begin(), found.end(),
              [](const auto &a, const auto &b) { return a.filename() < b.filename(); });
    files.clear();
    files.reserve(found.size());
    for (const auto &p : found) {
        files.push_back(p.string());
    }
    PR_LOG("debug", "discovered " << files.size() << " frames in " << dir);
    return Status::success();
}

// -----------------------------------------------------------------------------
// Delay list.
// -----------------------------------------------------------------------------
std::vector<long long> parse_delay_lines(std::istream &in) {
    std::vector<long long> delays;
    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        auto v = parse_integer(line);
        if (!v) {
            PR_LOG("debug", "delay line " << line_no << " skipped: \"" << line << "\"");
            continue;
        }
        delays.push_back(*v);
    }
    return delays;
}

std::optional<std::vector<long long>> read_delay_file(const std::string &path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        PR_LOG("warn", "error opening delay file " << path << " ("
                                                   << std::generic_category().message(errno)
                                                   << "), using " << kDefaultDelayMs
                                                   << " ms per frame");
        return std::nullopt;
    }
    return parse_delay_lines(f);
}

std::vector<FrameSpec> build_frame_list(const std::vector<std::string> &files,
                                        const std::vector<long long> &delays_ms) {
    std::vector<FrameSpec> frames;
    frames.reserve(files.size());
    for (size_t i = 0; i < files.size(); ++i) {
        FrameSpec f;
        f.path = files[i];
        f.delay_num = delay_ms_to_hundredths(i < delays_ms.size() ? delays_ms[i]
                                                                  : kDefaultDelayMs);
        frames.push_back(std::move(f));
    }
    return frames;
}

// -----------------------------------------------------------------------------
// JSON manifest.
// -----------------------------------------------------------------------------
Status load_manifest(const std::string &path, std::vector<FrameSpec> &frames,
                     AssembleOptions &options) {
    std::ifstream f(path);
    if (!f.is_open()) {
        PR_LOG("debug", "open failed for " << path << " errno=" << errno << " ("
                                           << std::generic_category().message(errno) << ")");
        return Status::failure(ErrorKind::Io, "could not open manifest: " + path);
    }
    const auto base = std::filesystem::path(path).parent_path();
    auto resolve_path = [&](const std::string &p) {
        std::filesystem::path fp(p);
        return (fp.is_absolute() ? fp : base / fp).string();
    };

    std::vector<FrameSpec> parsed;
    AssembleOptions opts = options;
    try {
        json j;
        f >> j;
        if (!j.is_object() || !j.contains("frames") || !j["frames"].is_array()) {
            return Status::failure(ErrorKind::Format, path + ": manifest needs a \"frames\" array");
        }
        if (j.contains("loops")) {
            const auto &v = j["loops"];
            if (!v.is_number_unsigned() ||
                v.get<uint64_t>() > std::numeric_limits<uint32_t>::max()) {
                return Status::failure(ErrorKind::Format,
                                       path + ": \"loops\" must be an integer in [0, 2^32-1]");
            }
            opts.loop_count = v.get<uint32_t>();
        }
        if (j.contains("max_chunk_size")) {
            const auto &v = j["max_chunk_size"];
            constexpr uint64_t kLargest = kMaxChunkLength + kChunkOverhead;
            if (!v.is_number_unsigned() || v.get<uint64_t>() < kMinChunkSize ||
                v.get<uint64_t>() > kLargest) {
                return Status::failure(ErrorKind::Format,
                                       path + ": \"max_chunk_size\" must be an integer in [" +
                                           std::to_string(kMinChunkSize) + ", " +
                                           std::to_string(kLargest) + "]");
            }
            opts.max_chunk_size = static_cast<size_t>(v.get<uint64_t>());
        }
        opts.verify_crc = j.value("verify_crc", opts.verify_crc);
        parsed.reserve(j["frames"].size());
        for (const auto &entry : j["frames"]) {
            FrameSpec spec;
            const std::string file = entry.value("file", "");
            if (file.empty()) {
                return Status::failure(ErrorKind::Format,
                                       path + ": frame " + std::to_string(parsed.size()) +
                                           " has no \"file\"");
            }
            spec.path = resolve_path(file);
            spec.delay_num =
                delay_ms_to_hundredths(entry.value("delay_ms", static_cast<long long>(kDefaultDelayMs)));
            parsed.push_back(std::move(spec));
        }
    } catch (const json::exception &e) {
        return Status::failure(ErrorKind::Format, path + ": " + e.what());
    }

    PR_LOG("debug", "manifest " << path << " frames=" << parsed.size()
                                << " loops=" << opts.loop_count);
    frames = std::move(parsed);
    options = opts;
    return Status::success();
}

Status resolve_frames(const RunConfig &config, std::vector<FrameSpec> &frames,
                      AssembleOptions &options) {
    options = config.options;
    if (!config.manifest.empty()) {
        return load_manifest(config.manifest, frames, options);
    }
    std::vector<std::string> files;
    auto st = discover_frames(config.input_dir, files);
    if (!st.ok) {
        return st;
    }
    auto delays = read_delay_file(config.delay_file);
    frames = build_frame_list(files, delays.value_or(std::vector<long long>{}));
    return Status::success();
}

}  // namespace pngreel
