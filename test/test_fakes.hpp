#pragma once

#include "camera_module.hpp"
#include "data_types.hpp"
#include "errors.hpp"
#include "frame_channel.hpp"
#include "model_module.hpp"

#include <opencv2/core.hpp>

#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <stdexcept>
#include <vector>

// Shared between the test and the FakeCamera the agent owns
struct CameraScript {
    std::deque<ReadStatus> script;      // consumed one per read, then Frame forever
    int opens = 0;
    int reads = 0;
    int live = 0;                       // cameras currently open
    int max_live = 0;
    int fail_opens = 0;                 // number of open attempts that throw
    std::vector<int> open_before_read;  // opens count observed at each read

    cv::Mat next_image(int index) const {
        cv::Mat image(4, 4, CV_8UC1);
        for (int i = 0; i < image.rows * image.cols; ++i) {
            image.data[i] = static_cast<uint8_t>((index * 7 + i) & 0xFF);
        }
        return image;
    }
};

class FakeCamera : public FrameSource {
public:
    explicit FakeCamera(std::shared_ptr<CameraScript> s) : s_(std::move(s)) {
        ++s_->live;
        if (s_->live > s_->max_live) s_->max_live = s_->live;
    }
    ~FakeCamera() override { --s_->live; }

    ReadStatus read(cv::Mat& frame) override {
        s_->open_before_read.push_back(s_->opens);
        ReadStatus status = ReadStatus::Frame;
        if (!s_->script.empty()) {
            status = s_->script.front();
            s_->script.pop_front();
        }
        if (status == ReadStatus::Frame) {
            frame = s_->next_image(s_->reads);
        } else {
            frame.release();
        }
        ++s_->reads;
        return status;
    }

private:
    std::shared_ptr<CameraScript> s_;
};

inline std::function<std::unique_ptr<FrameSource>()> fake_camera_factory(std::shared_ptr<CameraScript> s) {
    return [s]() -> std::unique_ptr<FrameSource> {
        ++s->opens;
        if (s->fail_opens > 0) {
            --s->fail_opens;
            throw std::runtime_error("camera busy");
        }
        return std::make_unique<FakeCamera>(s);
    };
}

// Bounded in-memory channel; full means would-block, like a ZMQ high-water mark
struct ChannelState {
    size_t capacity = 4;
    bool broken = false;
    std::deque<Frame> queue;
    std::vector<Frame> delivered;
    int receive_failures = 0;           // receives that report a transport error
};

class FakeSender : public FrameSender {
public:
    explicit FakeSender(std::shared_ptr<ChannelState> s) : s_(std::move(s)) {}

    SendStatus try_send(const Frame& frame) override {
        if (s_->broken) return SendStatus::Failed;
        if (s_->queue.size() >= s_->capacity) return SendStatus::WouldBlock;
        s_->queue.push_back(frame);
        return SendStatus::Sent;
    }

private:
    std::shared_ptr<ChannelState> s_;
};

// Non-blocking stand-in: an empty queue reports a receive failure
class FakeReceiver : public FrameReceiver {
public:
    explicit FakeReceiver(std::shared_ptr<ChannelState> s) : s_(std::move(s)) {}

    bool receive(Frame& frame) override {
        if (s_->receive_failures > 0) {
            --s_->receive_failures;
            return false;
        }
        if (s_->queue.empty()) return false;
        frame = std::move(s_->queue.front());
        s_->queue.pop_front();
        s_->delivered.push_back(frame);
        return true;
    }

private:
    std::shared_ptr<ChannelState> s_;
};

struct EngineScript {
    int loads = 0;
    int runs = 0;
    int fail_runs = 0;
    std::vector<InputTensor> inputs;
};

// Echoes its input back as the only output tensor
class FakeEngine : public InferenceEngine {
public:
    explicit FakeEngine(std::shared_ptr<EngineScript> s) : s_(std::move(s)) { ++s_->loads; }

    InferenceResult run(const InputTensor& input) override {
        ++s_->runs;
        if (s_->fail_runs > 0) {
            --s_->fail_runs;
            throw InferenceError("inference failed: injected");
        }
        s_->inputs.push_back(input);
        InferenceResult result;
        result.outputs.push_back(OutputTensor{"echo", input.shape, input.data});
        return result;
    }

private:
    std::shared_ptr<EngineScript> s_;
};

// Records every requested sleep instead of sleeping
struct RecordingSleeper {
    std::vector<std::chrono::milliseconds> sleeps;
    std::function<void(size_t)> on_sleep;   // called with the 1-based sleep count

    std::function<void(std::chrono::milliseconds)> fn() {
        return [this](std::chrono::milliseconds d) {
            sleeps.push_back(d);
            if (on_sleep) on_sleep(sleeps.size());
        };
    }
};

// Copies the pixel bytes verbatim, so payloads can be compared byte for byte
inline bool raw_encode(const cv::Mat& frame, std::vector<uint8_t>& out) {
    if (frame.empty()) return false;
    out.assign(frame.datastart, frame.dataend);
    return true;
}
