#include "frame_tools.hpp"
#include "container_codec.hpp"
#include "header_codec.hpp"
#include "kfe_error.hpp"

#include <fstream>
#include <iostream>
#include <vector>

namespace {

class SourceGuard {
public:
    SourceGuard(FrameSource& src, int device) : src_(src) { src_.acquire(device); }
    ~SourceGuard() { src_.release(); }
    SourceGuard(const SourceGuard&) = delete;
    SourceGuard& operator=(const SourceGuard&) = delete;
private:
    FrameSource& src_;
};

class SinkGuard {
public:
    explicit SinkGuard(FrameSink& sink) : sink_(sink) {}
    ~SinkGuard() { sink_.close(); }
    SinkGuard(const SinkGuard&) = delete;
    SinkGuard& operator=(const SinkGuard&) = delete;
private:
    FrameSink& sink_;
};

} // namespace

CaptureResult capture_to_container(const std::string& output_path, const KfeConfig& cfg,
                                   FrameSource& source, int device, uint32_t frames) {
    std::cout << "[capture] Capturing " << frames << " frame(s) from device " << device
              << " to " << output_path << std::endl;

    CaptureResult result;
    result.frames_declared = frames;

    SourceGuard guard(source, device);

    std::ofstream fout(output_path, std::ios::binary | std::ios::trunc);
    if (!fout.good()) throw KfeError(KfeErrc::IoError, "Cannot write file: " + output_path);

    write_header(fout, cfg, static_cast<uint64_t>(cfg.frame_size()) * frames, frames);

    std::vector<uint8_t> frame;
    while (result.frames_captured < frames) {
        if (!source.read(frame)) {
            std::cerr << "[capture] Capture failed at frame " << result.frames_captured << std::endl;
            break;
        }
        write_frame(fout, frame, cfg);
        result.frames_captured++;
        if (cfg.verbose) std::cout << "[capture] Frame " << result.frames_captured << "/" << frames << std::endl;
    }

    const std::vector<uint8_t> empty;
    for (uint32_t i = result.frames_captured; i < frames; ++i) {
        write_frame(fout, empty, cfg);
    }

    fout.flush();
    if (!fout) throw KfeError(KfeErrc::IoError, "Failed to flush " + output_path);

    std::cout << "[capture] Capture complete (" << result.frames_captured << "/" << frames << " frames)" << std::endl;
    return result;
}

uint32_t display_container(const std::string& input_path, const KfeConfig& cfg, FrameSink& sink) {
    std::cout << "[display] Displaying " << input_path << std::endl;

    SinkGuard guard(sink);

    std::ifstream fin(input_path, std::ios::binary);
    if (!fin.good()) throw KfeError(KfeErrc::IoError, "Cannot read file: " + input_path);

    ContainerHeader hdr = read_header(fin, cfg);
    if (cfg.verbose) {
        std::cout << "[display] " << hdr.frame_count << " frames, " << hdr.payload_size << " payload bytes" << std::endl;
    }

    std::vector<uint8_t> frame;
    uint32_t shown = 0;
    for (uint32_t i = 0; i < hdr.frame_count; ++i) {
        if (!read_frame(fin, frame, cfg)) {
            throw KfeError(KfeErrc::IncompleteFrame, "Incomplete frame data at frame " + std::to_string(i));
        }
        sink.render(frame);
        shown++;
    }
    sink.finish();

    std::cout << "[display] Display complete" << std::endl;
    return shown;
}
