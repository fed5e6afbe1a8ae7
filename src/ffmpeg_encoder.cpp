#include "ffmpeg_encoder.h"
#include "cv_endpoints.hpp"
#include "kfe_error.hpp"
#include <stdexcept>
#include <iostream>
#include <thread>
#include <cerrno>
#include <cstring>
#include <string>

FFmpegEncoder::FFmpegEncoder(int width, int height, int fps, int bitrate)
    : m_width(width), m_height(height), m_fps(fps), m_bitrate(bitrate)
{
    initEncoder();
}

void FFmpegEncoder::initEncoder() {
    codec = avcodec_find_encoder(AV_CODEC_ID_H264);
    if (!codec)
        throw std::runtime_error("H264 codec not found");

    codecContext = avcodec_alloc_context3(codec);
    if (!codecContext)
        throw std::runtime_error("Failed to allocate codec context");

    codecContext->width = m_width;
    codecContext->height = m_height;
    codecContext->time_base = {1, m_fps};
    codecContext->framerate = {m_fps, 1};
    codecContext->bit_rate = m_bitrate;
    codecContext->gop_size = m_fps;
    codecContext->max_b_frames = 0;
    codecContext->pix_fmt = AV_PIX_FMT_YUV420P;

    codecContext->thread_count = std::thread::hardware_concurrency();
    codecContext->thread_type = FF_THREAD_FRAME;

    av_opt_set(codecContext->priv_data, "preset", "veryfast", 0);
    av_opt_set(codecContext->priv_data, "tune", "zerolatency", 0);

    if (avcodec_open2(codecContext, codec, nullptr) < 0) {
        cleanup();
        throw std::runtime_error("Failed to open codec");
    }

    frame = av_frame_alloc();
    pkt = av_packet_alloc();
    if (!frame || !pkt) {
        cleanup();
        throw std::runtime_error("Failed to allocate frame or packet");
    }

    frame->format = codecContext->pix_fmt;
    frame->width = codecContext->width;
    frame->height = codecContext->height;

    if (av_frame_get_buffer(frame, 32) < 0) {
        cleanup();
        throw std::runtime_error("Could not allocate frame buffer");
    }

    swsCtx = sws_getContext(
        m_width, m_height, AV_PIX_FMT_BGR24,
        m_width, m_height, AV_PIX_FMT_YUV420P,
        SWS_BICUBIC, nullptr, nullptr, nullptr
    );

    if (!swsCtx) {
        cleanup();
        throw std::runtime_error("Failed to initialize swscale context");
    }
}

void FFmpegEncoder::receivePackets(std::vector<uint8_t>& out) {
    int ret;
    while ((ret = avcodec_receive_packet(codecContext, pkt)) == 0) {
        out.insert(out.end(), pkt->data, pkt->data + pkt->size);
        av_packet_unref(pkt);
    }
    if (ret != AVERROR(EAGAIN) && ret != AVERROR_EOF)
        throw KfeError(KfeErrc::IoError, "avcodec_receive_packet failed (" + std::to_string(ret) + ")");
}

bool FFmpegEncoder::encodeFrame(const cv::Mat& bgrFrame, std::vector<uint8_t>& outEncodedData) {
    outEncodedData.clear();
    if (!codecContext || !frame || !pkt)
        throw KfeError(KfeErrc::IoError, "Encoder not initialized");
    if (bgrFrame.empty())
        throw KfeError(KfeErrc::IoError, "Empty frame passed to encoder");

    if (av_frame_make_writable(frame) < 0)
        throw KfeError(KfeErrc::IoError, "av_frame_make_writable failed at frame " + std::to_string(frameCounter));

    const uint8_t* inData[1] = { bgrFrame.data };
    int inLinesize[1] = { static_cast<int>(bgrFrame.step) };

    sws_scale(swsCtx, inData, inLinesize, 0, m_height, frame->data, frame->linesize);
    frame->pts = frameCounter++;

    int ret = avcodec_send_frame(codecContext, frame);
    if (ret < 0)
        throw KfeError(KfeErrc::IoError, "avcodec_send_frame failed (" + std::to_string(ret) + ")");

    // false: encoder is still buffering
    receivePackets(outEncodedData);
    return !outEncodedData.empty();
}

bool FFmpegEncoder::flush(std::vector<uint8_t>& outEncodedData) {
    outEncodedData.clear();
    if (!codecContext)
        throw KfeError(KfeErrc::IoError, "Encoder not initialized");

    int ret = avcodec_send_frame(codecContext, nullptr);
    if (ret < 0 && ret != AVERROR_EOF)
        throw KfeError(KfeErrc::IoError, "Encoder drain failed (" + std::to_string(ret) + ")");

    receivePackets(outEncodedData);
    return !outEncodedData.empty();
}

void FFmpegEncoder::cleanup() {
    if (codecContext) avcodec_free_context(&codecContext);
    if (frame) av_frame_free(&frame);
    if (pkt) av_packet_free(&pkt);
    if (swsCtx) {
        sws_freeContext(swsCtx);
        swsCtx = nullptr;
    }
}

FFmpegEncoder::~FFmpegEncoder() {
    cleanup();
}

// ---------------------- VideoFileSink ----------------------

VideoFileSink::VideoFileSink(const KfeConfig& cfg, const std::string& path, int fps, int bitrate)
    : cfg_(cfg), path_(path),
      encoder_(static_cast<int>(cfg.geometry.width), static_cast<int>(cfg.geometry.height), fps, bitrate)
{
    file_ = std::fopen(path_.c_str(), "wb");
    if (!file_) {
        throw KfeError(KfeErrc::IoError, "Cannot write file: " + path_ + " (" + std::strerror(errno) + ")");
    }
}

VideoFileSink::~VideoFileSink() {
    close();
}

void VideoFileSink::write_bytes(const std::vector<uint8_t>& bytes) {
    if (bytes.empty()) return;
    if (std::fwrite(bytes.data(), 1, bytes.size(), file_) != bytes.size()) {
        throw KfeError(KfeErrc::IoError, "Short write to " + path_);
    }
}

void VideoFileSink::render(const std::vector<uint8_t>& frame) {
    if (!file_) throw KfeError(KfeErrc::IoError, "Video output already closed: " + path_);

    std::vector<uint8_t> encoded;
    encoder_.encodeFrame(frame_to_bgr(frame, cfg_), encoded);
    write_bytes(encoded);
}

void VideoFileSink::finish() {
    if (!file_) return;

    std::vector<uint8_t> tail;
    encoder_.flush(tail);
    write_bytes(tail);

    FILE* f = file_;
    file_ = nullptr;
    if (std::fclose(f) != 0) {
        throw KfeError(KfeErrc::IoError, "Failed to close " + path_ + ": " + std::strerror(errno));
    }
    std::cout << "[display] Wrote " << encoder_.frameCount() << " frames to " << path_ << std::endl;
}

void VideoFileSink::close() {
    if (!file_) return;

    // Only reached when finish() was skipped, i.e. display is unwinding.
    std::cerr << "[display] " << path_ << " closed before the stream was finished" << std::endl;
    std::fclose(file_);
    file_ = nullptr;
}
