#pragma once

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavutil/imgutils.h>
#include <libavutil/opt.h>
#include <libswscale/swscale.h>
}

#include "endpoints.hpp"
#include "frame_geometry.hpp"

#include <opencv2/core.hpp>
#include <cstdio>
#include <string>
#include <vector>

class FFmpegEncoder {
public:
    FFmpegEncoder(int width, int height, int fps, int bitrate);
    ~FFmpegEncoder();

    // BGR Mat → H264 packets (Annex B). Returns false while the encoder buffers;
    // libav failures throw KfeError(IoError).
    bool encodeFrame(const cv::Mat& bgrFrame, std::vector<uint8_t>& outEncodedData);

    // Drain buffered packets at end of stream.
    bool flush(std::vector<uint8_t>& outEncodedData);

    int frameCount() const { return frameCounter; }

private:
    int m_width, m_height, m_fps, m_bitrate;
    int frameCounter = 0;

    const AVCodec* codec = nullptr;
    AVCodecContext* codecContext = nullptr;
    AVFrame* frame = nullptr;
    AVPacket* pkt = nullptr;
    SwsContext* swsCtx = nullptr;

    void initEncoder();
    void receivePackets(std::vector<uint8_t>& out);
    void cleanup();
};

// Writes rendered frames to a raw .h264 file instead of a window.
class VideoFileSink : public FrameSink {
public:
    VideoFileSink(const KfeConfig& cfg, const std::string& path, int fps, int bitrate = 20000000);
    ~VideoFileSink() override;

    void render(const std::vector<uint8_t>& frame) override;
    // Drains the encoder and closes the file. Throws KfeError(IoError).
    void finish() override;
    void close() override;

private:
    void write_bytes(const std::vector<uint8_t>& bytes);

    const KfeConfig& cfg_;
    std::string path_;
    FFmpegEncoder encoder_;
    FILE* file_ = nullptr;
};
