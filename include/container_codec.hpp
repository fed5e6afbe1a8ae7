#pragma once
#include <vector>
#include <cstdint>
#include <string>
#include <istream>
#include <ostream>

#include "frame_geometry.hpp"
#include "header_codec.hpp"

// Write exactly frame_size bytes; a short frame is zero padded.
void write_frame(std::ostream& out, const std::vector<uint8_t>& frame, const KfeConfig& cfg);

// Read one full frame. Returns false if the stream ran out first.
bool read_frame(std::istream& in, std::vector<uint8_t>& frame, const KfeConfig& cfg);

// Binary stream → KFE container. Payload size is taken by seeking to the end.
ContainerHeader encode_container(std::istream& in, std::ostream& out, const KfeConfig& cfg);

// Same, with the payload size supplied by the caller.
ContainerHeader encode_container(std::istream& in, std::ostream& out, const KfeConfig& cfg,
                                 uint64_t payload_size);

// KFE container → original bytes.
// Throws IncompleteHeader, InvalidContainer, IncompleteFrame, SizeMismatch.
ContainerHeader decode_container(std::istream& in, std::ostream& out, const KfeConfig& cfg);

void encode_file(const std::string& input_path, const std::string& output_path, const KfeConfig& cfg);
void decode_file(const std::string& input_path, const std::string& output_path, const KfeConfig& cfg);
