// Coverage for run configuration: frame discovery, delay parsing, manifests and run().
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

#include "assembly_config.hpp"
#include "logging.hpp"
#include "pngreel.hpp"
#include "test_utils.hpp"

using pngreel::AssembleOptions;
using pngreel::ErrorKind;
using pngreel::FrameSpec;
using test_utils::pattern;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::fprintf(stderr, "[config_unit] FAIL: %s\n", msg.c_str());
    }
    return cond;
}

std::filesystem::path g_dir;

void write_text(const std::filesystem::path &path, const std::string &text) {
    test_utils::write_file(path, test_utils::to_bytes(text));
}

bool test_delay_lines() {
    std::istringstream in("100\n 250 \r\nabc\n\n+40\n-20\n12ms\n7\n");
    auto delays = pngreel::parse_delay_lines(in);
    return check(delays == std::vector<long long>({100, 250, 40, -20, 7}),
                 "integers kept, junk lines skipped");
}

bool test_delay_conversion() {
    bool ok = check(pngreel::delay_ms_to_hundredths(100) == 10, "100 ms -> 10");
    ok &= check(pngreel::delay_ms_to_hundredths(155) == 15, "truncating division");
    ok &= check(pngreel::delay_ms_to_hundredths(9) == 0, "below 10 ms -> 0");
    ok &= check(pngreel::delay_ms_to_hundredths(-30) == 0, "negative clamps to 0");
    ok &= check(pngreel::delay_ms_to_hundredths(655350) == 65535, "largest representable");
    ok &= check(pngreel::delay_ms_to_hundredths(10000000) == 65535, "overflow clamps");
    return ok;
}

bool test_build_frame_list() {
    auto frames = pngreel::build_frame_list({"a.png", "b.png", "c.png"}, {150, 20});
    bool ok = check(frames.size() == 3, "one entry per file");
    if (!ok) {
        return false;
    }
    ok &= check(frames[0].path == "a.png" && frames[0].delay_num == 15, "first delay");
    ok &= check(frames[1].delay_num == 2, "second delay");
    ok &= check(frames[2].delay_num == 10, "missing delay defaults to 100 ms");

    auto extra = pngreel::build_frame_list({"a.png"}, {10, 20, 30});
    ok &= check(extra.size() == 1 && extra[0].delay_num == 1, "extra delays ignored");
    return ok;
}

bool test_discover_frames() {
    const auto dir = g_dir / "discover";
    std::filesystem::create_directories(dir / "nested.png");
    for (const char *name : {"frame10.png", "frame02.png", "frame01.png", "notes.txt",
                             "frame03.PNG"}) {
        write_text(dir / name, "x");
    }
    std::vector<std::string> files;
    auto st = pngreel::discover_frames(dir.string(), files);
    bool ok = check(st.ok, "directory listed: " + st.message);
    ok &= check(files.size() == 3, "only .png regular files");
    if (files.size() == 3) {
        ok &= check(std::filesystem::path(files[0]).filename() == "frame01.png" &&
                        std::filesystem::path(files[1]).filename() == "frame02.png" &&
                        std::filesystem::path(files[2]).filename() == "frame10.png",
                    "sorted by file name");
    }

    std::vector<std::string> none;
    st = pngreel::discover_frames((g_dir / "does_not_exist").string(), none);
    ok &= check(!st.ok && st.kind == ErrorKind::Io, "missing directory is an I/O error");
    return ok;
}

bool test_delay_file() {
    const auto path = g_dir / "delays.txt";
    write_text(path, "100\n200\n");
    auto delays = pngreel::read_delay_file(path.string());
    bool ok = check(delays && *delays == std::vector<long long>({100, 200}), "delay file read");
    ok &= check(!pngreel::read_delay_file((g_dir / "missing.txt").string()).has_value(),
                "missing delay file gives no list");
    return ok;
}

bool test_manifest() {
    const auto dir = g_dir / "manifest";
    std::filesystem::create_directories(dir);
    bool ok = true;
    {
        const auto path = dir / "reel.json";
        write_text(path, R"({
            "loops": 2,
            "max_chunk_size": 4096,
            "verify_crc": false,
            "frames": [
                { "file": "one.png", "delay_ms": 120 },
                { "file": "/abs/two.png" }
            ]
        })");
        std::vector<FrameSpec> frames;
        AssembleOptions options;
        auto st = pngreel::load_manifest(path.string(), frames, options);
        ok &= check(st.ok, "manifest parsed: " + st.message);
        ok &= check(frames.size() == 2, "two frames");
        if (frames.size() == 2) {
            ok &= check(frames[0].path == (dir / "one.png").string(),
                        "relative path resolves against manifest dir");
            ok &= check(frames[0].delay_num == 12, "delay_ms converted");
            ok &= check(frames[1].path == "/abs/two.png", "absolute path kept");
            ok &= check(frames[1].delay_num == 10, "default delay");
        }
        ok &= check(options.loop_count == 2 && options.max_chunk_size == 4096 &&
                        !options.verify_crc,
                    "options overridden");
    }
    {
        const auto path = dir / "broken.json";
        write_text(path, "{ \"frames\": [ ");
        std::vector<FrameSpec> frames;
        AssembleOptions options;
        auto st = pngreel::load_manifest(path.string(), frames, options);
        ok &= check(!st.ok && st.kind == ErrorKind::Format, "malformed JSON is a format error");
        ok &= check(options.loop_count == 0, "options untouched on failure");
    }
    {
        const auto path = dir / "noframes.json";
        write_text(path, R"({ "loops": 1 })");
        std::vector<FrameSpec> frames;
        AssembleOptions options;
        auto st = pngreel::load_manifest(path.string(), frames, options);
        ok &= check(!st.ok && st.kind == ErrorKind::Format, "frames array required");
    }
    {
        const auto path = dir / "nofile.json";
        write_text(path, R"({ "frames": [ { "delay_ms": 40 } ] })");
        std::vector<FrameSpec> frames;
        AssembleOptions options;
        auto st = pngreel::load_manifest(path.string(), frames, options);
        ok &= check(!st.ok && st.kind == ErrorKind::Format, "frame entry needs a file");
    }
    {
        const std::vector<std::string> out_of_range = {
            R"({ "max_chunk_size": -1, "frames": [ { "file": "a.png" } ] })",
            R"({ "max_chunk_size": 10, "frames": [ { "file": "a.png" } ] })",
            R"({ "max_chunk_size": 2147483660, "frames": [ { "file": "a.png" } ] })",
            R"({ "max_chunk_size": 4096.5, "frames": [ { "file": "a.png" } ] })",
            R"({ "loops": -1, "frames": [ { "file": "a.png" } ] })",
            R"({ "loops": 4294967296, "frames": [ { "file": "a.png" } ] })",
        };
        for (size_t i = 0; i < out_of_range.size(); ++i) {
            const auto path = dir / ("range_" + std::to_string(i) + ".json");
            write_text(path, out_of_range[i]);
            std::vector<FrameSpec> frames;
            AssembleOptions options;
            auto st = pngreel::load_manifest(path.string(), frames, options);
            ok &= check(!st.ok && st.kind == ErrorKind::Format,
                        "out-of-range option rejected: " + out_of_range[i]);
            ok &= check(options.max_chunk_size == pngreel::kDefaultMaxChunkSize &&
                            options.loop_count == 0,
                        "options untouched after range error");
        }
    }
    {
        const auto path = dir / "edges.json";
        write_text(path, R"({ "loops": 4294967295, "max_chunk_size": 2147483659,
                              "frames": [ { "file": "a.png" } ] })");
        std::vector<FrameSpec> frames;
        AssembleOptions options;
        auto st = pngreel::load_manifest(path.string(), frames, options);
        ok &= check(st.ok, "range edges accepted: " + st.message);
        ok &= check(options.loop_count == 4294967295u && options.max_chunk_size == 2147483659u,
                    "range edges stored");
    }
    {
        std::vector<FrameSpec> frames;
        AssembleOptions options;
        auto st = pngreel::load_manifest((dir / "absent.json").string(), frames, options);
        ok &= check(!st.ok && st.kind == ErrorKind::Io, "missing manifest is an I/O error");
    }
    return ok;
}

bool test_run_without_delay_file() {
    const auto dir = g_dir / "run_frames";
    std::filesystem::create_directories(dir);
    for (int i = 0; i < 3; ++i) {
        test_utils::write_file(dir / ("f" + std::to_string(i) + ".png"),
                               test_utils::make_png(20, 10, {pattern(64, static_cast<uint8_t>(i))}));
    }
    pngreel::RunConfig config;
    config.input_dir = dir.string();
    config.delay_file = (g_dir / "run_missing_delays.txt").string();
    config.output = (g_dir / "run_out.png").string();

    pngreel::AssembleReport report;
    auto st = pngreel::run(config, &report);
    bool ok = check(st.ok, "run succeeds: " + st.message);
    ok &= check(report.frames == 3 && report.width == 20 && report.height == 10,
                "report matches inputs");
    auto bytes = test_utils::read_file(config.output);
    auto chunks = bytes ? test_utils::parse_png(*bytes) : std::nullopt;
    ok &= check(chunks.has_value(), "output written");
    if (!chunks) {
        return false;
    }
    size_t fctl = 0;
    for (const auto &c : *chunks) {
        if (c.type == "fcTL") {
            ++fctl;
            ok &= check(test_utils::be16(&c.payload[20]) == 10, "default delay of 10 hundredths");
        }
    }
    ok &= check(fctl == 3, "one fcTL per frame");
    return ok;
}

bool test_run_errors() {
    const auto empty = g_dir / "run_empty";
    std::filesystem::create_directories(empty);
    pngreel::RunConfig config;
    config.input_dir = empty.string();
    config.delay_file = (g_dir / "none.txt").string();
    config.output = (g_dir / "never.png").string();
    auto st = pngreel::run(config);
    bool ok = check(!st.ok && st.kind == ErrorKind::InvalidArgument, "empty input dir rejected");
    ok &= check(!std::filesystem::exists(config.output), "no output for empty input");

    config.input_dir = (g_dir / "run_absent").string();
    st = pngreel::run(config);
    ok &= check(!st.ok && st.kind == ErrorKind::Io, "missing input dir is an I/O error");
    return ok;
}

}  // namespace

int main() {
    pngreel::set_log_verbosity(pngreel::LogVerbosity::Error);
    g_dir = test_utils::make_temp_dir("pngreel_config_unit");
    bool ok = true;
    ok &= test_delay_lines();
    ok &= test_delay_conversion();
    ok &= test_build_frame_list();
    ok &= test_discover_frames();
    ok &= test_delay_file();
    ok &= test_manifest();
    ok &= test_run_without_delay_file();
    ok &= test_run_errors();
    ok &= check(!pngreel::version_string().empty(), "version string");
    std::filesystem::remove_all(g_dir);
    return ok ? 0 : 1;
}
