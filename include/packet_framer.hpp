#pragma once
#include <cstdint>
#include <vector>
#include <cstddef>

#include "frame_geometry.hpp"

// Framed packet layout:
// [0-3]    packet_length (4 byte, little endian)
// [4...]   packet payload
// [...fs]  zero padding

constexpr size_t PACKET_PREFIX_SIZE = 4;

// 0 when the frame cannot hold more than the prefix
inline size_t max_packet_size(const KfeConfig& cfg) {
    return cfg.frame_size() > PACKET_PREFIX_SIZE ? cfg.frame_size() - PACKET_PREFIX_SIZE : 0;
}

// Both calls throw InvalidFrameLength when frame_size <= PACKET_PREFIX_SIZE.

// Packet → frame_size bytes. Throws PacketTooLarge.
std::vector<uint8_t> pack_packet(const std::vector<uint8_t>& packet, const KfeConfig& cfg);

// Frame → packet. Throws InvalidFrameLength / CorruptedFrameHeader.
std::vector<uint8_t> unpack_packet(const std::vector<uint8_t>& frame, const KfeConfig& cfg);
