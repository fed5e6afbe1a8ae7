#include "container_codec.hpp"
#include "kfe_error.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>

void write_frame(std::ostream& out, const std::vector<uint8_t>& frame, const KfeConfig& cfg) {
    const size_t fs = cfg.frame_size();
    const size_t len = std::min(frame.size(), fs);

    out.write(reinterpret_cast<const char*>(frame.data()), static_cast<std::streamsize>(len));
    if (len < fs) {
        std::vector<uint8_t> padding(fs - len, 0);
        out.write(reinterpret_cast<const char*>(padding.data()), static_cast<std::streamsize>(padding.size()));
    }
    if (!out) throw KfeError(KfeErrc::IoError, "Failed to write frame");
}

bool read_frame(std::istream& in, std::vector<uint8_t>& frame, const KfeConfig& cfg) {
    frame.resize(cfg.frame_size());
    in.read(reinterpret_cast<char*>(frame.data()), static_cast<std::streamsize>(frame.size()));
    return static_cast<size_t>(in.gcount()) == frame.size();
}

ContainerHeader encode_container(std::istream& in, std::ostream& out, const KfeConfig& cfg) {
    in.seekg(0, std::ios::end);
    const std::streamoff end = in.tellg();
    in.seekg(0, std::ios::beg);
    if (end < 0 || !in) throw KfeError(KfeErrc::IoError, "Cannot determine input size");

    return encode_container(in, out, cfg, static_cast<uint64_t>(end));
}

ContainerHeader encode_container(std::istream& in, std::ostream& out, const KfeConfig& cfg,
                                 uint64_t payload_size) {
    const uint32_t frame_count = frames_for_payload(cfg, payload_size);
    if (cfg.verbose) {
        std::cout << "[codec] Input size: " << payload_size << " bytes, frames: " << frame_count << "\n";
    }

    write_header(out, cfg, payload_size, frame_count);

    std::vector<uint8_t> chunk(cfg.frame_size());
    uint64_t remaining = payload_size;
    uint32_t written = 0;
    while (remaining > 0) {
        size_t want = static_cast<size_t>(std::min<uint64_t>(remaining, chunk.size()));
        in.read(reinterpret_cast<char*>(chunk.data()), static_cast<std::streamsize>(want));
        size_t got = static_cast<size_t>(in.gcount());
        if (got == 0) break;

        std::fill(chunk.begin() + got, chunk.end(), 0);
        write_frame(out, chunk, cfg);
        remaining -= got;
        ++written;
    }

    if (remaining != 0 || written != frame_count) {
        throw KfeError(KfeErrc::IoError,
                       "Input ended early: " + std::to_string(remaining) + " bytes missing");
    }

    ContainerHeader hdr{};
    std::copy(cfg.magic.begin(), cfg.magic.begin() + std::min<size_t>(cfg.magic.size(), 4), hdr.magic);
    hdr.width = cfg.geometry.width;
    hdr.height = cfg.geometry.height;
    hdr.channel_depth = cfg.geometry.channel_depth;
    hdr.payload_size = payload_size;
    hdr.frame_count = frame_count;
    return hdr;
}

ContainerHeader decode_container(std::istream& in, std::ostream& out, const KfeConfig& cfg) {
    ContainerHeader hdr = read_header(in, cfg);
    if (cfg.verbose) {
        std::cout << "[codec] Output size: " << hdr.payload_size << " bytes, frames: " << hdr.frame_count << "\n";
    }

    const size_t fs = cfg.frame_size();
    uint64_t remaining = hdr.payload_size;
    std::vector<uint8_t> frame;

    for (uint32_t i = 0; i < hdr.frame_count; ++i) {
        if (!read_frame(in, frame, cfg)) {
            throw KfeError(KfeErrc::IncompleteFrame,
                           "Incomplete frame data at frame " + std::to_string(i)
                           + " of " + std::to_string(hdr.frame_count));
        }
        size_t to_write = remaining >= fs ? fs : static_cast<size_t>(remaining);
        out.write(reinterpret_cast<const char*>(frame.data()), static_cast<std::streamsize>(to_write));
        if (!out) throw KfeError(KfeErrc::IoError, "Failed to write decoded data");
        remaining -= to_write;
    }

    if (remaining != 0) {
        throw KfeError(KfeErrc::SizeMismatch,
                       "Data size mismatch: " + std::to_string(remaining) + " bytes not covered by frames");
    }
    return hdr;
}

void encode_file(const std::string& input_path, const std::string& output_path, const KfeConfig& cfg) {
    std::cout << "[codec] Encoding " << input_path << " to " << output_path << std::endl;

    std::ifstream fin(input_path, std::ios::binary);
    if (!fin.good()) throw KfeError(KfeErrc::IoError, "Cannot read file: " + input_path);
    std::ofstream fout(output_path, std::ios::binary | std::ios::trunc);
    if (!fout.good()) throw KfeError(KfeErrc::IoError, "Cannot write file: " + output_path);

    encode_container(fin, fout, cfg);
    fout.flush();
    if (!fout) throw KfeError(KfeErrc::IoError, "Failed to flush " + output_path);

    std::cout << "[codec] Encoding complete" << std::endl;
}

void decode_file(const std::string& input_path, const std::string& output_path, const KfeConfig& cfg) {
    std::cout << "[codec] Decoding " << input_path << " to " << output_path << std::endl;

    std::ifstream fin(input_path, std::ios::binary);
    if (!fin.good()) throw KfeError(KfeErrc::IoError, "Cannot read file: " + input_path);

    // Header is checked before the output file is created.
    ContainerHeader hdr = read_header(fin, cfg);
    fin.seekg(0, std::ios::beg);

    std::ofstream fout(output_path, std::ios::binary | std::ios::trunc);
    if (!fout.good()) throw KfeError(KfeErrc::IoError, "Cannot write file: " + output_path);

    decode_container(fin, fout, cfg);
    fout.flush();
    if (!fout) throw KfeError(KfeErrc::IoError, "Failed to flush " + output_path);

    std::cout << "[codec] Decoding complete (" << hdr.payload_size << " bytes)" << std::endl;
}
