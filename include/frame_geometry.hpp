#ifndef KFE_FRAME_GEOMETRY_HPP
#define KFE_FRAME_GEOMETRY_HPP

#include <cstdint>
#include <cstddef>
#include <string>

// 3840x2160 RGB, three bytes per pixel
struct FrameGeometry {
    uint32_t width = 3840;
    uint32_t height = 2160;
    uint32_t channel_depth = 3;

    size_t frame_size() const {
        return static_cast<size_t>(width) * height * channel_depth;
    }
};

// Built once in main() and handed to every codec call.
struct KfeConfig {
    FrameGeometry geometry;
    std::string magic = "KFE0";   // exactly 4 bytes on disk
    bool verbose = false;

    size_t frame_size() const { return geometry.frame_size(); }
};

#endif // KFE_FRAME_GEOMETRY_HPP
