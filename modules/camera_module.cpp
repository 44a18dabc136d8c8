#include "camera_module.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <string>

CameraModule::CameraModule(const CaptureConfig& config)
        : device_id_(config.device_index) {
    // 1. open the device, any backend
    cap_.open(device_id_, cv::CAP_ANY);
    if (!cap_.isOpened()) {
        throw std::runtime_error("cannot open camera " + std::to_string(device_id_));
    }

    // 2. resolution is best effort, a camera at another size is still usable
    if (!cap_.set(cv::CAP_PROP_FRAME_WIDTH, config.width)) {
        spdlog::debug("Camera {} ignored width {}", device_id_, config.width);
    }
    if (!cap_.set(cv::CAP_PROP_FRAME_HEIGHT, config.height)) {
        spdlog::debug("Camera {} ignored height {}", device_id_, config.height);
    }

    spdlog::info("Camera {} opened ({}x{}, backend {})", device_id_,
                 static_cast<int>(cap_.get(cv::CAP_PROP_FRAME_WIDTH)),
                 static_cast<int>(cap_.get(cv::CAP_PROP_FRAME_HEIGHT)),
                 cap_.getBackendName());
}

CameraModule::~CameraModule() {
    if (cap_.isOpened()) cap_.release();
}

ReadStatus read_frame(cv::VideoCapture& cap, cv::Mat& frame) {
    if (!cap.isOpened()) {
        return ReadStatus::Failed;
    }
    try {
        if (!cap.read(frame) || frame.empty()) {
            return ReadStatus::Empty;
        }
    } catch (const cv::Exception& e) {
        spdlog::error("Camera read error: {}", e.what());
        return ReadStatus::Failed;
    }
    return ReadStatus::Frame;
}

ReadStatus CameraModule::read(cv::Mat& frame) {
    return read_frame(cap_, frame);
}

std::unique_ptr<FrameSource> open_camera(const CaptureConfig& config) {
    return std::make_unique<CameraModule>(config);
}
