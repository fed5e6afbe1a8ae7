#pragma once

#include "endpoints.hpp"
#include "frame_geometry.hpp"
#include <cstdint>
#include <string>

struct CaptureResult {
    uint32_t frames_declared = 0;
    uint32_t frames_captured = 0;   // the rest were written as zero frames
};

// Grab `frames` frames from `device` into a KFE container at output_path.
// The header always declares `frames` frames; if the device stops early the
// remainder is filled with zero frames.
CaptureResult capture_to_container(const std::string& output_path, const KfeConfig& cfg,
                                   FrameSource& source, int device, uint32_t frames);

// Validate a container and push every frame to `sink`. Returns frames rendered.
uint32_t display_container(const std::string& input_path, const KfeConfig& cfg, FrameSink& sink);
