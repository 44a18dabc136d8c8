#pragma once
#include "camera_module.hpp"
#include "data_types.hpp"
#include "frame_channel.hpp"
#include "retry.hpp"

#include <opencv2/core.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

/*
 * Producer side of the pipeline: owns the camera and the send endpoint.
 *
 * Every tick reads one frame, encodes it and offers it to the channel without
 * blocking. A frame the channel cannot take right now is dropped. A camera read
 * failure releases the camera and re-acquires it before the next tick.
 */
class CaptureAgent {
public:
    // Resource factories and codec, swappable for tests
    struct Hooks {
        std::function<std::unique_ptr<FrameSource>()> open_camera;
        std::function<std::unique_ptr<FrameSender>()> open_channel;
        std::function<bool(const cv::Mat&, std::vector<uint8_t>&)> encode;
        Sleeper sleep;                          // empty: sleep on the agent's own stop signal
        std::function<TimestampNS()> now;       // empty: wall_clock_ns
    };

    enum class TickOutcome {
        Sent,
        Dropped,            // channel would block
        SendFailed,
        EmptyFrame,
        EncodeFailed,
        CameraReacquired
    };

    struct Stats {
        uint64_t ticks = 0;
        uint64_t frames_sent = 0;
        uint64_t frames_dropped = 0;
        uint64_t send_errors = 0;
        uint64_t empty_frames = 0;
        uint64_t encode_failures = 0;
        uint64_t camera_reacquisitions = 0;
    };

    CaptureAgent(const CaptureConfig& config, Hooks hooks);
    ~CaptureAgent();

    // Starts the service loop thread
    bool start();
    // Wakes any sleep or retry, joins the loop thread
    void stop();
    bool running() const { return running_.load(); }

    // Service loop body, returns once stop() is called. Runs on the caller's thread.
    void run();

    // Both block with fixed backoff until the resource is usable
    std::unique_ptr<FrameSender> acquire_channel();
    std::unique_ptr<FrameSource> acquire_camera();

    // Channel first, then camera
    void open_resources();

    TickOutcome service_tick();

    Stats stats() const;
    // Set when the loop ended on an error other than stop()
    std::exception_ptr failure() const;

private:
    void pause(std::chrono::milliseconds duration);
    bool keep_going() const { return !stop_requested_.load(); }
    void log_stats_if_due();

    CaptureConfig config_;
    Hooks hooks_;

    std::unique_ptr<FrameSender> channel_;
    std::unique_ptr<FrameSource> camera_;

    uint64_t next_sequence_ = 0;
    bool in_empty_burst_ = false;

    mutable std::mutex stats_mtx_;
    Stats stats_;
    std::chrono::steady_clock::time_point last_stats_log_;

    std::thread worker_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::mutex wake_mtx_;
    std::condition_variable wake_cv_;
    mutable std::mutex failure_mtx_;
    std::exception_ptr failure_;
};

const char* to_string(CaptureAgent::TickOutcome outcome);
