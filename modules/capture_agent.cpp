#include "capture_agent.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <string>
#include <utility>

namespace {

void bump(std::mutex& mtx, uint64_t& counter) {
    std::lock_guard<std::mutex> lock(mtx);
    ++counter;
}

}  // namespace

const char* to_string(CaptureAgent::TickOutcome outcome) {
    switch (outcome) {
        case CaptureAgent::TickOutcome::Sent: return "sent";
        case CaptureAgent::TickOutcome::Dropped: return "dropped";
        case CaptureAgent::TickOutcome::SendFailed: return "send_failed";
        case CaptureAgent::TickOutcome::EmptyFrame: return "empty_frame";
        case CaptureAgent::TickOutcome::EncodeFailed: return "encode_failed";
        case CaptureAgent::TickOutcome::CameraReacquired: return "camera_reacquired";
    }
    return "unknown";
}

CaptureAgent::CaptureAgent(const CaptureConfig& config, Hooks hooks)
        : config_(config), hooks_(std::move(hooks)), last_stats_log_(std::chrono::steady_clock::now()) {
    if (!hooks_.open_camera || !hooks_.open_channel || !hooks_.encode) {
        throw std::invalid_argument("CaptureAgent needs open_camera, open_channel and encode hooks");
    }
}

CaptureAgent::~CaptureAgent() {
    stop();
}

bool CaptureAgent::start() {
    if (running_) {
        return false;
    }
    if (worker_.joinable()) worker_.join();  // previous loop already returned
    stop_requested_ = false;
    running_ = true;
    worker_ = std::thread(&CaptureAgent::run, this);
    return true;
}

void CaptureAgent::stop() {
    {
        std::lock_guard<std::mutex> lock(wake_mtx_);
        stop_requested_ = true;
    }
    wake_cv_.notify_all();
    if (worker_.joinable()) worker_.join();
}

void CaptureAgent::run() {
    try {
        open_resources();
        while (keep_going()) {
            const TickOutcome outcome = service_tick();
            spdlog::debug("Capture tick: {}", to_string(outcome));
            log_stats_if_due();
            // fixed cadence, no drift correction
            pause(config_.tick_interval);
        }
    } catch (const AcquisitionCancelled& e) {
        spdlog::info("Capture loop stopping: {}", e.what());
    } catch (const std::exception& e) {
        spdlog::critical("Capture loop failed: {}", e.what());
        std::lock_guard<std::mutex> lock(failure_mtx_);
        failure_ = std::current_exception();
    }

    camera_.reset();
    channel_.reset();
    running_ = false;
}

std::unique_ptr<FrameSender> CaptureAgent::acquire_channel() {
    return acquire_with_retry("frame channel " + config_.bind_address, config_.channel_retry,
            [this] { return hooks_.open_channel(); },
            [this](std::chrono::milliseconds d) { pause(d); },
            [this] { return keep_going(); });
}

std::unique_ptr<FrameSource> CaptureAgent::acquire_camera() {
    return acquire_with_retry("camera " + std::to_string(config_.device_index), config_.camera_retry,
            [this] { return hooks_.open_camera(); },
            [this](std::chrono::milliseconds d) { pause(d); },
            [this] { return keep_going(); });
}

void CaptureAgent::open_resources() {
    // a capture node without egress is useless, so the channel gates the camera
    channel_ = acquire_channel();
    camera_ = acquire_camera();
    spdlog::info("Capture agent ready, streaming to {}", config_.bind_address);
}

CaptureAgent::TickOutcome CaptureAgent::service_tick() {
    if (!channel_) {
        throw std::logic_error("service_tick() called before open_resources()");
    }
    bump(stats_mtx_, stats_.ticks);

    // 1. read; a failed read means the device is gone
    cv::Mat image;
    const ReadStatus status = camera_ ? camera_->read(image) : ReadStatus::Failed;
    if (status == ReadStatus::Failed) {
        spdlog::error("Camera error, attempting to reconnect...");
        camera_.reset();  // at most one open device
        camera_ = acquire_camera();
        bump(stats_mtx_, stats_.camera_reacquisitions);
        return TickOutcome::CameraReacquired;
    }
    if (status == ReadStatus::Empty) {
        bump(stats_mtx_, stats_.empty_frames);
        if (!in_empty_burst_) {
            spdlog::warn("Empty frame captured, skipping");
        } else {
            spdlog::debug("Empty frame captured, skipping");
        }
        in_empty_burst_ = true;
        return TickOutcome::EmptyFrame;
    }
    in_empty_burst_ = false;

    // 2. encode
    Frame frame;
    frame.sequence = next_sequence_++;
    frame.capture_ts_ns = hooks_.now ? hooks_.now() : wall_clock_ns();
    frame.has_header = config_.frame_header;
    if (!hooks_.encode(image, frame.payload)) {
        bump(stats_mtx_, stats_.encode_failures);
        spdlog::warn("Failed to encode frame {}, dropped", frame.sequence);
        return TickOutcome::EncodeFailed;
    }

    // 3. offer it once; never wait for the consumer
    switch (channel_->try_send(frame)) {
        case SendStatus::Sent:
            bump(stats_mtx_, stats_.frames_sent);
            return TickOutcome::Sent;
        case SendStatus::WouldBlock:
            bump(stats_mtx_, stats_.frames_dropped);
            spdlog::warn("Consumer is busy, frame {} dropped", frame.sequence);
            return TickOutcome::Dropped;
        case SendStatus::Failed:
            break;
    }
    bump(stats_mtx_, stats_.send_errors);
    spdlog::warn("Failed to send frame {}, dropped", frame.sequence);
    return TickOutcome::SendFailed;
}

CaptureAgent::Stats CaptureAgent::stats() const {
    std::lock_guard<std::mutex> lock(stats_mtx_);
    return stats_;
}

std::exception_ptr CaptureAgent::failure() const {
    std::lock_guard<std::mutex> lock(failure_mtx_);
    return failure_;
}

void CaptureAgent::pause(std::chrono::milliseconds duration) {
    if (hooks_.sleep) {
        hooks_.sleep(duration);
        return;
    }
    std::unique_lock<std::mutex> lock(wake_mtx_);
    wake_cv_.wait_for(lock, duration, [this] { return stop_requested_.load(); });
}

void CaptureAgent::log_stats_if_due() {
    const auto now = std::chrono::steady_clock::now();
    if (now - last_stats_log_ < config_.stats_interval) return;
    last_stats_log_ = now;

    const Stats s = stats();
    spdlog::info("ticks={} sent={} dropped={} send_errors={} empty={} encode_failures={} camera_reacquisitions={}",
                 s.ticks, s.frames_sent, s.frames_dropped, s.send_errors, s.empty_frames,
                 s.encode_failures, s.camera_reacquisitions);
}
