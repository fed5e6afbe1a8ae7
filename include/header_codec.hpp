#pragma once
#include <cstdint>
#include <vector>
#include <cstddef>
#include <istream>
#include <ostream>

#include "frame_geometry.hpp"

constexpr size_t KFE_HEADER_SIZE = 28;

struct ContainerHeader {
    char magic[4];
    uint32_t width;
    uint32_t height;
    uint32_t channel_depth;
    uint64_t payload_size;   // original byte length
    uint32_t frame_count;    // ceil(payload_size / frame_size)
};

// ceil(payload_size / frame_size)
uint32_t frames_for_payload(const KfeConfig& cfg, uint64_t payload_size);

// ContainerHeader → 28 byte record (geometry from cfg)
std::vector<uint8_t> encode_header(const KfeConfig& cfg, uint64_t payload_size, uint32_t frame_count);

// 28 byte record → ContainerHeader
// Throws IncompleteHeader / InvalidContainer.
ContainerHeader decode_header(const KfeConfig& cfg, const uint8_t* data, std::size_t len);

void write_header(std::ostream& out, const KfeConfig& cfg, uint64_t payload_size, uint32_t frame_count);
ContainerHeader read_header(std::istream& in, const KfeConfig& cfg);
