#include "cli_args.hpp"
#include "container_codec.hpp"
#include "cv_endpoints.hpp"
#include "ffmpeg_encoder.h"
#include "frame_geometry.hpp"
#include "frame_tools.hpp"
#include "kfe_error.hpp"
#include "loopback.hpp"
#include "tun_transport.hpp"

#include <climits>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

static void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [-v] <command> ...\n"
              << "  encode <input> <output>                 binary file -> KFE container\n"
              << "  decode <input> <output>                 KFE container -> binary file\n"
              << "  capture <output> [--device N] [--frames N]\n"
              << "  display <input> [--output path.h264] [--fps N] [--window name]\n"
              << "  loopback [--tun name] [--device N] [--packets N] [--report final|every]\n"
              << "           [--capture-timeout ms]\n"
              << "Example: " << prog << " encode archive.tar archive.kfe" << std::endl;
}

static int run_command(const std::string& command, const CliArgs& args, const KfeConfig& cfg) {
    const std::vector<std::string>& pos = args.positional();

    if (command == "encode" || command == "decode") {
        if (pos.size() != 3) return -1;
        if (command == "encode") encode_file(pos[1], pos[2], cfg);
        else decode_file(pos[1], pos[2], cfg);
        return 0;
    }

    if (command == "capture") {
        if (pos.size() != 2) return -1;
        int device = static_cast<int>(args.get_int("device", 0, 0, INT_MAX));
        uint32_t frames = static_cast<uint32_t>(args.get_int("frames", 30, 0, UINT32_MAX));

        CvCaptureSource source(cfg);
        capture_to_container(pos[1], cfg, source, device, frames);
        return 0;
    }

    if (command == "display") {
        if (pos.size() != 2) return -1;
        int fps = static_cast<int>(args.get_int("fps", 30, 1, 240));

        std::unique_ptr<FrameSink> sink;
        if (args.has("output")) {
            sink = std::make_unique<VideoFileSink>(cfg, args.get("output"), fps);
        } else {
            sink = std::make_unique<CvDisplaySink>(cfg, args.get("window", "KFE Display"), 1000 / fps);
        }
        display_container(pos[1], cfg, *sink);
        return 0;
    }

    if (command == "loopback") {
        if (pos.size() != 1) return -1;
        LoopbackOptions options;
        options.interface_name = args.get("tun", "tun0");
        options.device_index = static_cast<int>(args.get_int("device", 0, 0, INT_MAX));
        options.packet_limit = static_cast<uint64_t>(args.get_int("packets", 100, 0, LONG_MAX));

        const std::string report = args.get("report", "final");
        if (report == "final") options.report = ReportMode::Final;
        else if (report == "every") options.report = ReportMode::EveryPacket;
        else throw std::invalid_argument("--report must be 'final' or 'every'");

        int timeout_ms = static_cast<int>(args.get_int("capture-timeout", 0, 0, INT_MAX));

        TunTransport transport;
        CvCaptureSource source(cfg, timeout_ms);
        CvDisplaySink sink(cfg, "kfe-loopback", 1);
        run_loopback(cfg, options, transport, source, sink);
        return 0;
    }

    return -1;
}

int main(int argc, char** argv) {
    CliArgs args({"v", "verbose"});
    try {
        args.parse(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "[ERROR] " << e.what() << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    if (args.positional().empty()) {
        print_usage(argv[0]);
        return 1;
    }

    KfeConfig cfg;
    cfg.verbose = args.has("v") || args.has("verbose");

    const std::string command = args.positional()[0];
    try {
        if (run_command(command, args, cfg) != 0) {
            print_usage(argv[0]);
            return 1;
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << "[ERROR] " << e.what() << std::endl;
        print_usage(argv[0]);
        return 1;
    } catch (const KfeError& e) {
        std::cerr << "[ERROR] " << kfe_errc_name(e.code()) << ": " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << std::endl;
        return 2;
    }
    return 0;
}
