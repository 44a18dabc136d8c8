#include "inference_agent.hpp"
#include "app_config.hpp"
#include "errors.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <utility>

namespace {

void bump(std::mutex& mtx, uint64_t& counter, uint64_t by = 1) {
    std::lock_guard<std::mutex> lock(mtx);
    counter += by;
}

}  // namespace

const char* to_string(InferenceAgent::TickOutcome outcome) {
    switch (outcome) {
        case InferenceAgent::TickOutcome::Inferred: return "inferred";
        case InferenceAgent::TickOutcome::DecodeFailed: return "decode_failed";
        case InferenceAgent::TickOutcome::InferenceFailed: return "inference_failed";
        case InferenceAgent::TickOutcome::ReceiveFailed: return "receive_failed";
    }
    return "unknown";
}

InferenceAgent::InferenceAgent(const InferenceConfig& config, Hooks hooks)
        : config_(config), hooks_(std::move(hooks)),
          decoder_(config.input_shape, config.input_mode),
          last_stats_log_(std::chrono::steady_clock::now()) {
    if (!hooks_.open_channel || !hooks_.load_model || !hooks_.sink) {
        throw std::invalid_argument("InferenceAgent needs open_channel, load_model and sink hooks");
    }
}

InferenceAgent::~InferenceAgent() {
    stop();
}

bool InferenceAgent::start() {
    if (running_) {
        return false;
    }
    if (worker_.joinable()) worker_.join();
    stop_requested_ = false;
    running_ = true;
    worker_ = std::thread(&InferenceAgent::run, this);
    return true;
}

void InferenceAgent::stop() {
    {
        std::lock_guard<std::mutex> lock(wake_mtx_);
        stop_requested_ = true;
    }
    wake_cv_.notify_all();
    if (worker_.joinable()) {
        // the loop may be parked in a blocking receive
        if (hooks_.interrupt) hooks_.interrupt();
        worker_.join();
    }
}

void InferenceAgent::run() {
    try {
        open_resources();
        while (keep_going()) {
            const TickOutcome outcome = service_tick();
            spdlog::debug("Inference tick: {}", to_string(outcome));
            log_stats_if_due();
        }
    } catch (const AcquisitionCancelled& e) {
        spdlog::info("Inference loop stopping: {}", e.what());
    } catch (const std::exception& e) {
        spdlog::critical("Inference loop failed: {}", e.what());
        std::lock_guard<std::mutex> lock(failure_mtx_);
        failure_ = std::current_exception();
    }

    model_.reset();
    channel_.reset();
    running_ = false;
}

std::unique_ptr<FrameReceiver> InferenceAgent::acquire_channel() {
    return acquire_with_retry("frame channel " + config_.connect_address, config_.channel_retry,
            [this] { return hooks_.open_channel(); },
            [this](std::chrono::milliseconds d) { pause(d); },
            [this] { return keep_going(); });
}

std::unique_ptr<InferenceEngine> InferenceAgent::acquire_model() {
    return acquire_with_retry("model " + config_.model_path, config_.model_retry,
            [this] { return hooks_.load_model(); },
            [this](std::chrono::milliseconds d) { pause(d); },
            [this] { return keep_going(); });
}

void InferenceAgent::open_resources() {
    channel_ = acquire_channel();
    model_ = acquire_model();
    spdlog::info("Inference agent ready, input {} ({} elements, {} mode)",
                 shape_to_string(decoder_.shape()), decoder_.element_count(), input_mode_name(config_.input_mode));
}

InferenceAgent::TickOutcome InferenceAgent::service_tick() {
    if (!channel_ || !model_) {
        throw std::logic_error("service_tick() called before open_resources()");
    }
    bump(stats_mtx_, stats_.ticks);

    // 1. wait for the next frame; the endpoint itself is kept on failure
    Frame frame;
    bool received = false;
    try {
        received = channel_->receive(frame);
    } catch (const DecodeError& e) {
        bump(stats_mtx_, stats_.decode_errors);
        spdlog::warn("Malformed message skipped: {}", e.what());
        return TickOutcome::DecodeFailed;
    }
    if (!received) {
        if (!keep_going()) return TickOutcome::ReceiveFailed;
        bump(stats_mtx_, stats_.receive_errors);
        spdlog::error("Failed to receive frame, retrying in {} ms", config_.receive_error_backoff.count());
        pause(config_.receive_error_backoff);
        return TickOutcome::ReceiveFailed;
    }
    bump(stats_mtx_, stats_.frames_received);
    track_sequence(frame);

    // 2. bytes -> tensor
    InputTensor input;
    try {
        input = decoder_.decode(frame.payload);
    } catch (const DecodeError& e) {
        bump(stats_mtx_, stats_.decode_errors);
        spdlog::warn("Frame {} skipped: {}", frame.sequence, e.what());
        return TickOutcome::DecodeFailed;
    }

    // 3. inference; a failure never invalidates the session
    InferenceResult result;
    try {
        result = model_->run(input);
    } catch (const std::exception& e) {
        bump(stats_mtx_, stats_.inference_errors);
        spdlog::error("Error during inference on frame {}: {}", frame.sequence, e.what());
        return TickOutcome::InferenceFailed;
    }
    result.has_sequence = frame.has_header;
    result.sequence = frame.sequence;
    result.capture_ts_ns = frame.capture_ts_ns;

    hooks_.sink(result);
    bump(stats_mtx_, stats_.results);
    return TickOutcome::Inferred;
}

void InferenceAgent::track_sequence(const Frame& frame) {
    if (!frame.has_header) return;
    if (have_sequence_) {
        if (frame.sequence > last_sequence_ + 1) {
            bump(stats_mtx_, stats_.frames_lost, frame.sequence - last_sequence_ - 1);
        } else if (frame.sequence <= last_sequence_) {
            spdlog::info("Frame sequence restarted at {} (capture agent restarted?)", frame.sequence);
        }
    }
    have_sequence_ = true;
    last_sequence_ = frame.sequence;
}

InferenceAgent::Stats InferenceAgent::stats() const {
    std::lock_guard<std::mutex> lock(stats_mtx_);
    return stats_;
}

std::exception_ptr InferenceAgent::failure() const {
    std::lock_guard<std::mutex> lock(failure_mtx_);
    return failure_;
}

void InferenceAgent::pause(std::chrono::milliseconds duration) {
    if (hooks_.sleep) {
        hooks_.sleep(duration);
        return;
    }
    std::unique_lock<std::mutex> lock(wake_mtx_);
    wake_cv_.wait_for(lock, duration, [this] { return stop_requested_.load(); });
}

void InferenceAgent::log_stats_if_due() {
    const auto now = std::chrono::steady_clock::now();
    if (now - last_stats_log_ < config_.stats_interval) return;
    last_stats_log_ = now;

    const Stats s = stats();
    spdlog::info("ticks={} received={} results={} lost={} decode_errors={} inference_errors={} receive_errors={}",
                 s.ticks, s.frames_received, s.results, s.frames_lost, s.decode_errors,
                 s.inference_errors, s.receive_errors);
}
