#pragma once
#include "data_types.hpp"
#include "frame_channel.hpp"
#include "frame_codec.hpp"
#include "model_module.hpp"
#include "retry.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

/*
 * Consumer side of the pipeline: owns the receive endpoint and the model session.
 *
 * Blocks on receive, decodes each frame into the model input and runs the model.
 * Transport errors back off and retry the receive; decode and inference errors
 * drop the frame. Neither the endpoint nor the session is replaced after startup.
 */
class InferenceAgent {
public:
    struct Hooks {
        std::function<std::unique_ptr<FrameReceiver>()> open_channel;
        std::function<std::unique_ptr<InferenceEngine>()> load_model;
        std::function<void(const InferenceResult&)> sink;
        Sleeper sleep;                      // empty: sleep on the agent's own stop signal
        std::function<void()> interrupt;    // unblocks a pending receive on stop()
    };

    enum class TickOutcome {
        Inferred,
        DecodeFailed,
        InferenceFailed,
        ReceiveFailed
    };

    struct Stats {
        uint64_t ticks = 0;
        uint64_t frames_received = 0;
        uint64_t results = 0;
        uint64_t decode_errors = 0;
        uint64_t inference_errors = 0;
        uint64_t receive_errors = 0;
        uint64_t frames_lost = 0;       // sequence gaps seen on the wire
    };

    InferenceAgent(const InferenceConfig& config, Hooks hooks);
    ~InferenceAgent();

    bool start();
    void stop();
    bool running() const { return running_.load(); }

    void run();

    std::unique_ptr<FrameReceiver> acquire_channel();
    std::unique_ptr<InferenceEngine> acquire_model();

    // Channel first, then model
    void open_resources();

    TickOutcome service_tick();

    Stats stats() const;
    std::exception_ptr failure() const;

private:
    void pause(std::chrono::milliseconds duration);
    bool keep_going() const { return !stop_requested_.load(); }
    void track_sequence(const Frame& frame);
    void log_stats_if_due();

    InferenceConfig config_;
    Hooks hooks_;
    TensorDecoder decoder_;

    std::unique_ptr<FrameReceiver> channel_;
    std::unique_ptr<InferenceEngine> model_;

    bool have_sequence_ = false;
    uint64_t last_sequence_ = 0;

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

const char* to_string(InferenceAgent::TickOutcome outcome);
