#pragma once

#include "endpoints.hpp"
#include "frame_geometry.hpp"

#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>
#include <string>
#include <vector>

// RGB frame bytes ↔ BGR Mat (OpenCV channel order)
cv::Mat frame_to_bgr(const std::vector<uint8_t>& frame, const KfeConfig& cfg);
// Any BGR Mat is resized to the frame geometry first.
std::vector<uint8_t> bgr_to_frame(const cv::Mat& bgr, const KfeConfig& cfg);

// HDMI grabber / webcam via cv::VideoCapture (V4L2 on Linux).
class CvCaptureSource : public FrameSource {
public:
    // read_timeout_ms <= 0 leaves the backend default (blocking)
    CvCaptureSource(const KfeConfig& cfg, int read_timeout_ms = 0);
    ~CvCaptureSource() override;

    void acquire(int device_id) override;
    bool read(std::vector<uint8_t>& frame) override;
    void release() override;

private:
    const KfeConfig& cfg_;
    int read_timeout_ms_;
    cv::VideoCapture cap_;
    cv::Mat raw_;
};

// Full screen-ish window through highgui.
class CvDisplaySink : public FrameSink {
public:
    CvDisplaySink(const KfeConfig& cfg, const std::string& window = "kfe-loopback", int wait_ms = 1);
    ~CvDisplaySink() override;

    void render(const std::vector<uint8_t>& frame) override;
    void close() override;

private:
    const KfeConfig& cfg_;
    std::string window_;
    int wait_ms_;
    bool opened_ = false;
};
