#pragma once
#include "data_types.hpp"

#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>
#include <memory>

enum class ReadStatus {
    Frame,   // got a non-empty image
    Empty,   // no image this time (grab timeout, empty buffer), keep the handle
    Failed   // device is gone, the handle must be replaced
};

// One read from an OpenCV capture. read() == false is an empty frame, not a
// failure; only a closed device or a cv::Exception is Failed.
ReadStatus read_frame(cv::VideoCapture& cap, cv::Mat& frame);

// Exclusive handle on a capture device. Replaced wholesale, never repaired.
class FrameSource {
public:
    virtual ~FrameSource() = default;
    virtual ReadStatus read(cv::Mat& frame) = 0;
};

class CameraModule : public FrameSource {
public:
    // Opens the device; throws std::runtime_error if it cannot be opened.
    explicit CameraModule(const CaptureConfig& config);
    ~CameraModule() override;

    ReadStatus read(cv::Mat& frame) override;

private:
    cv::VideoCapture cap_;
    int device_id_;
};

std::unique_ptr<FrameSource> open_camera(const CaptureConfig& config);
