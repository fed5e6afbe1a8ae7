#include "test_util.hpp"
#include "mock_endpoints.hpp"
#include "frame_tools.hpp"
#include "container_codec.hpp"
#include "header_codec.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static KfeConfig small_config() {
    KfeConfig cfg;
    cfg.geometry = {4, 2, 3};   // 24 byte frames
    return cfg;
}

class RecordingSink : public FrameSink {
public:
    std::vector<std::vector<uint8_t>> frames;
    int finish_calls = 0;
    int close_calls = 0;
    bool fail_finish = false;

    void render(const std::vector<uint8_t>& frame) override { frames.push_back(frame); }
    void finish() override {
        finish_calls++;
        if (fail_finish) throw KfeError(KfeErrc::IoError, "encoder drain failed");
    }
    void close() override { close_calls++; }
};

static fs::path scratch_dir(const char* name) {
    fs::path dir = fs::temp_directory_path() / name;
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

static void test_capture_full() {
    KfeConfig cfg = small_config();
    fs::path dir = scratch_dir("kfe_capture_full");
    const std::string out = (dir / "cap.kfe").string();

    MirrorChannel source;
    source.pending.push_back(std::vector<uint8_t>(cfg.frame_size(), 1));
    source.pending.push_back(std::vector<uint8_t>(cfg.frame_size(), 2));
    source.pending.push_back(std::vector<uint8_t>(cfg.frame_size(), 3));

    CaptureResult r = capture_to_container(out, cfg, source, 4, 3);
    CHECK_EQ(r.frames_declared, 3u);
    CHECK_EQ(r.frames_captured, 3u);
    CHECK_EQ(source.acquired_device, 4);
    CHECK_EQ(source.release_calls, 1);
    CHECK_EQ(fs::file_size(out), KFE_HEADER_SIZE + 3 * cfg.frame_size());

    std::ifstream f(out, std::ios::binary);
    ContainerHeader hdr = read_header(f, cfg);
    CHECK_EQ(hdr.frame_count, 3u);
    CHECK_EQ(hdr.payload_size, 3 * cfg.frame_size());
    std::vector<uint8_t> frame;
    CHECK(read_frame(f, frame, cfg));
    CHECK_EQ(frame[0], 1);
    CHECK(read_frame(f, frame, cfg));
    CHECK(read_frame(f, frame, cfg));
    CHECK_EQ(frame[cfg.frame_size() - 1], 3);

    fs::remove_all(dir);
}

static void test_capture_stops_early_pads_zero_frames() {
    KfeConfig cfg = small_config();
    fs::path dir = scratch_dir("kfe_capture_short");
    const std::string out = (dir / "cap.kfe").string();

    MirrorChannel source;
    source.pending.push_back(std::vector<uint8_t>(cfg.frame_size(), 9));

    CaptureResult r = capture_to_container(out, cfg, source, 0, 3);
    CHECK_EQ(r.frames_captured, 1u);
    CHECK_EQ(fs::file_size(out), KFE_HEADER_SIZE + 3 * cfg.frame_size());

    // still a valid container; decodes to one frame of 9s then zeros
    std::ifstream in(out, std::ios::binary);
    std::ostringstream decoded;
    decode_container(in, decoded, cfg);
    std::string bytes = decoded.str();
    CHECK_EQ(bytes.size(), 3 * cfg.frame_size());
    CHECK_EQ(static_cast<uint8_t>(bytes[0]), 9);
    CHECK_EQ(static_cast<uint8_t>(bytes[cfg.frame_size()]), 0);
    CHECK_EQ(static_cast<uint8_t>(bytes.back()), 0);

    fs::remove_all(dir);
}

static void test_capture_device_unavailable() {
    KfeConfig cfg = small_config();
    fs::path dir = scratch_dir("kfe_capture_fail");
    const std::string out = (dir / "cap.kfe").string();

    MirrorChannel source;
    source.fail_acquire = true;
    CHECK_KFE_ERROR(capture_to_container(out, cfg, source, 1, 2), KfeErrc::DeviceUnavailable);
    CHECK(!fs::exists(out));
    CHECK_EQ(source.release_calls, 0);

    fs::remove_all(dir);
}

static void test_display_renders_all_frames() {
    KfeConfig cfg = small_config();
    fs::path dir = scratch_dir("kfe_display");
    const std::string in = (dir / "in.kfe").string();
    {
        std::ofstream f(in, std::ios::binary);
        std::istringstream payload(std::string(60, 'z'));
        encode_container(payload, f, cfg);
    }

    RecordingSink sink;
    uint32_t shown = display_container(in, cfg, sink);
    CHECK_EQ(shown, 3u);
    CHECK_EQ(sink.frames.size(), 3u);
    CHECK_EQ(sink.frames[0].size(), cfg.frame_size());
    CHECK_EQ(sink.frames[2][11], 'z');
    CHECK_EQ(sink.frames[2][12], 0);
    CHECK_EQ(sink.finish_calls, 1);
    CHECK_EQ(sink.close_calls, 1);

    fs::remove_all(dir);
}

static void test_display_truncated_container() {
    KfeConfig cfg = small_config();
    fs::path dir = scratch_dir("kfe_display_short");
    const std::string in = (dir / "in.kfe").string();
    {
        std::ofstream f(in, std::ios::binary);
        write_header(f, cfg, 2 * cfg.frame_size(), 2);
        write_frame(f, std::vector<uint8_t>(cfg.frame_size(), 5), cfg);
        f.write("abc", 3);
    }

    RecordingSink sink;
    CHECK_KFE_ERROR(display_container(in, cfg, sink), KfeErrc::IncompleteFrame);
    CHECK_EQ(sink.frames.size(), 1u);
    CHECK_EQ(sink.finish_calls, 0);
    CHECK_EQ(sink.close_calls, 1);

    fs::remove_all(dir);
}

static void test_display_rejects_foreign_geometry() {
    KfeConfig cfg = small_config();
    KfeConfig other = cfg;
    other.geometry.width = 8;
    fs::path dir = scratch_dir("kfe_display_geom");
    const std::string in = (dir / "in.kfe").string();
    {
        std::ofstream f(in, std::ios::binary);
        write_header(f, other, 0, 0);
    }

    RecordingSink sink;
    CHECK_KFE_ERROR(display_container(in, cfg, sink), KfeErrc::InvalidContainer);
    CHECK_EQ(sink.close_calls, 1);

    fs::remove_all(dir);
}

static void test_display_sink_finish_failure() {
    KfeConfig cfg = small_config();
    fs::path dir = scratch_dir("kfe_display_finish");
    const std::string in = (dir / "in.kfe").string();
    {
        std::ofstream f(in, std::ios::binary);
        std::istringstream payload(std::string(30, 'q'));
        encode_container(payload, f, cfg);
    }

    RecordingSink sink;
    sink.fail_finish = true;
    CHECK_KFE_ERROR(display_container(in, cfg, sink), KfeErrc::IoError);
    CHECK_EQ(sink.frames.size(), 2u);
    CHECK_EQ(sink.finish_calls, 1);
    CHECK_EQ(sink.close_calls, 1);

    fs::remove_all(dir);
}

int main() {
    std::printf("test_frame_tools:\n");
    test_capture_full();
    test_capture_stops_early_pads_zero_frames();
    test_capture_device_unavailable();
    test_display_renders_all_frames();
    test_display_truncated_container();
    test_display_rejects_foreign_geometry();
    test_display_sink_finish_failure();
    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
