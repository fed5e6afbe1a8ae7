#include "packet_framer.hpp"
#include "kfe_error.hpp"
#include <string>

static void require_payload_room(const KfeConfig& cfg) {
    if (cfg.frame_size() <= PACKET_PREFIX_SIZE) {
        throw KfeError(KfeErrc::InvalidFrameLength,
                       "Frame size " + std::to_string(cfg.frame_size()) + " leaves no room for a packet");
    }
}

std::vector<uint8_t> pack_packet(const std::vector<uint8_t>& packet, const KfeConfig& cfg) {
    require_payload_room(cfg);
    if (packet.size() > max_packet_size(cfg)) {
        throw KfeError(KfeErrc::PacketTooLarge,
                       "Packet too large for a single frame (" + std::to_string(packet.size())
                       + " > " + std::to_string(max_packet_size(cfg)) + ")");
    }

    std::vector<uint8_t> frame;
    frame.reserve(cfg.frame_size());

    const uint32_t len = static_cast<uint32_t>(packet.size());
    for (int i = 0; i < 4; ++i) {
        frame.push_back((len >> (i * 8)) & 0xFF);
    }
    frame.insert(frame.end(), packet.begin(), packet.end());
    frame.resize(cfg.frame_size(), 0);

    return frame;
}

std::vector<uint8_t> unpack_packet(const std::vector<uint8_t>& frame, const KfeConfig& cfg) {
    require_payload_room(cfg);
    if (frame.size() != cfg.frame_size()) {
        throw KfeError(KfeErrc::InvalidFrameLength,
                       "Invalid frame length " + std::to_string(frame.size()));
    }

    uint32_t len = 0;
    for (int i = 0; i < 4; ++i) {
        len |= static_cast<uint32_t>(frame[i]) << (i * 8);
    }
    if (len > max_packet_size(cfg)) {
        throw KfeError(KfeErrc::CorruptedFrameHeader,
                       "Corrupted frame header: length " + std::to_string(len));
    }

    return std::vector<uint8_t>(frame.begin() + PACKET_PREFIX_SIZE,
                                frame.begin() + PACKET_PREFIX_SIZE + len);
}
