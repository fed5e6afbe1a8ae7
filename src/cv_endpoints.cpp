#include "cv_endpoints.hpp"
#include "kfe_error.hpp"

#include <opencv2/imgproc.hpp>
#include <opencv2/highgui.hpp>
#include <cstring>
#include <iostream>

using namespace cv;

static void require_rgb(const KfeConfig& cfg) {
    if (cfg.geometry.channel_depth != 3) {
        throw KfeError(KfeErrc::InvalidContainer,
                       "OpenCV frames need 3 channels, geometry has " + std::to_string(cfg.geometry.channel_depth));
    }
}

Mat frame_to_bgr(const std::vector<uint8_t>& frame, const KfeConfig& cfg) {
    require_rgb(cfg);
    if (frame.size() != cfg.frame_size()) {
        throw KfeError(KfeErrc::InvalidFrameLength, "Invalid frame length " + std::to_string(frame.size()));
    }

    Mat rgb(static_cast<int>(cfg.geometry.height), static_cast<int>(cfg.geometry.width), CV_8UC3,
            const_cast<uint8_t*>(frame.data()));
    Mat bgr;
    cvtColor(rgb, bgr, COLOR_RGB2BGR);
    return bgr;
}

std::vector<uint8_t> bgr_to_frame(const Mat& bgr, const KfeConfig& cfg) {
    require_rgb(cfg);

    const Size target(static_cast<int>(cfg.geometry.width), static_cast<int>(cfg.geometry.height));
    Mat resized;
    if (bgr.size() != target) {
        resize(bgr, resized, target);
    } else {
        resized = bgr;
    }

    Mat rgb;
    cvtColor(resized, rgb, COLOR_BGR2RGB);

    std::vector<uint8_t> frame(cfg.frame_size());
    if (rgb.isContinuous()) {
        std::memcpy(frame.data(), rgb.data, frame.size());
    } else {
        const size_t row_bytes = static_cast<size_t>(rgb.cols) * rgb.elemSize();
        for (int y = 0; y < rgb.rows; ++y) {
            std::memcpy(frame.data() + y * row_bytes, rgb.ptr(y), row_bytes);
        }
    }
    return frame;
}

// ---------------------- CvCaptureSource ----------------------

CvCaptureSource::CvCaptureSource(const KfeConfig& cfg, int read_timeout_ms)
    : cfg_(cfg), read_timeout_ms_(read_timeout_ms) {}

CvCaptureSource::~CvCaptureSource() {
    release();
}

void CvCaptureSource::acquire(int device_id) {
    require_rgb(cfg_);

    cap_.open(device_id, CAP_V4L2);
    if (!cap_.isOpened()) {
        throw KfeError(KfeErrc::DeviceUnavailable,
                       "Unable to open capture device " + std::to_string(device_id));
    }

    cap_.set(CAP_PROP_FRAME_WIDTH, cfg_.geometry.width);
    cap_.set(CAP_PROP_FRAME_HEIGHT, cfg_.geometry.height);
    if (read_timeout_ms_ > 0 && !cap_.set(CAP_PROP_READ_TIMEOUT_MSEC, read_timeout_ms_)) {
        std::cerr << "[capture] Read timeout not supported by backend, reads will block" << std::endl;
    }

    std::cout << "[capture] Device " << device_id << " opened ("
              << cap_.get(CAP_PROP_FRAME_WIDTH) << "x" << cap_.get(CAP_PROP_FRAME_HEIGHT) << ")" << std::endl;
}

bool CvCaptureSource::read(std::vector<uint8_t>& frame) {
    if (!cap_.isOpened()) return false;
    if (!cap_.read(raw_) || raw_.empty()) return false;

    frame = bgr_to_frame(raw_, cfg_);
    return true;
}

void CvCaptureSource::release() {
    if (cap_.isOpened()) {
        cap_.release();
        std::cout << "[capture] Device released." << std::endl;
    }
}

// ---------------------- CvDisplaySink ----------------------

CvDisplaySink::CvDisplaySink(const KfeConfig& cfg, const std::string& window, int wait_ms)
    : cfg_(cfg), window_(window), wait_ms_(wait_ms) {}

CvDisplaySink::~CvDisplaySink() {
    close();
}

void CvDisplaySink::render(const std::vector<uint8_t>& frame) {
    imshow(window_, frame_to_bgr(frame, cfg_));
    opened_ = true;
    waitKey(wait_ms_);
}

void CvDisplaySink::close() {
    if (!opened_) return;
    destroyAllWindows();
    opened_ = false;
}
