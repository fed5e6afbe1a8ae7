#include "header_codec.hpp"
#include "kfe_error.hpp"
#include <cstring>
#include <string>

// Header formatı (little endian):
// [0-3]   magic          (4 byte)
// [4-7]   width          (4 byte)
// [8-11]  height         (4 byte)
// [12-15] channel_depth  (4 byte)
// [16-23] payload_size   (8 byte)
// [24-27] frame_count    (4 byte)

static void put_u32(std::vector<uint8_t>& buffer, uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        buffer.push_back((v >> (i * 8)) & 0xFF);
    }
}

static void put_u64(std::vector<uint8_t>& buffer, uint64_t v) {
    for (int i = 0; i < 8; ++i) {
        buffer.push_back((v >> (i * 8)) & 0xFF);
    }
}

static uint32_t get_u32(const uint8_t* data) {
    uint32_t v = 0;
    for (int i = 0; i < 4; ++i) {
        v |= static_cast<uint32_t>(data[i]) << (i * 8);
    }
    return v;
}

static uint64_t get_u64(const uint8_t* data) {
    uint64_t v = 0;
    for (int i = 0; i < 8; ++i) {
        v |= static_cast<uint64_t>(data[i]) << (i * 8);
    }
    return v;
}

uint32_t frames_for_payload(const KfeConfig& cfg, uint64_t payload_size) {
    const uint64_t fs = cfg.frame_size();
    return static_cast<uint32_t>((payload_size + fs - 1) / fs);
}

std::vector<uint8_t> encode_header(const KfeConfig& cfg, uint64_t payload_size, uint32_t frame_count) {
    std::vector<uint8_t> buffer;
    buffer.reserve(KFE_HEADER_SIZE);

    for (size_t i = 0; i < 4; ++i) {
        buffer.push_back(i < cfg.magic.size() ? static_cast<uint8_t>(cfg.magic[i]) : 0);
    }
    put_u32(buffer, cfg.geometry.width);
    put_u32(buffer, cfg.geometry.height);
    put_u32(buffer, cfg.geometry.channel_depth);
    put_u64(buffer, payload_size);
    put_u32(buffer, frame_count);

    return buffer;
}

ContainerHeader decode_header(const KfeConfig& cfg, const uint8_t* data, size_t len) {
    if (len < KFE_HEADER_SIZE) {
        throw KfeError(KfeErrc::IncompleteHeader,
                       "Incomplete KFE header (" + std::to_string(len) + " of "
                       + std::to_string(KFE_HEADER_SIZE) + " bytes)");
    }

    ContainerHeader hdr;
    std::memcpy(hdr.magic, data, 4);
    hdr.width = get_u32(data + 4);
    hdr.height = get_u32(data + 8);
    hdr.channel_depth = get_u32(data + 12);
    hdr.payload_size = get_u64(data + 16);
    hdr.frame_count = get_u32(data + 24);

    const bool magic_ok = cfg.magic.size() == 4 && std::memcmp(hdr.magic, cfg.magic.data(), 4) == 0;
    if (!magic_ok
        || hdr.width != cfg.geometry.width
        || hdr.height != cfg.geometry.height
        || hdr.channel_depth != cfg.geometry.channel_depth) {
        throw KfeError(KfeErrc::InvalidContainer,
                       "Invalid KFE file (got " + std::string(hdr.magic, 4) + " "
                       + std::to_string(hdr.width) + "x" + std::to_string(hdr.height)
                       + "x" + std::to_string(hdr.channel_depth) + ")");
    }
    return hdr;
}

void write_header(std::ostream& out, const KfeConfig& cfg, uint64_t payload_size, uint32_t frame_count) {
    std::vector<uint8_t> header = encode_header(cfg, payload_size, frame_count);
    out.write(reinterpret_cast<const char*>(header.data()), static_cast<std::streamsize>(header.size()));
    if (!out) throw KfeError(KfeErrc::IoError, "Failed to write KFE header");
}

ContainerHeader read_header(std::istream& in, const KfeConfig& cfg) {
    uint8_t buf[KFE_HEADER_SIZE];
    in.read(reinterpret_cast<char*>(buf), KFE_HEADER_SIZE);
    return decode_header(cfg, buf, static_cast<size_t>(in.gcount()));
}
