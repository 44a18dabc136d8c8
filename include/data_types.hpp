#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

using TimestampNS = uint64_t;

// Wall clock in ns since the Unix epoch. Only used to stamp frames; the two
// agents do not share a clock, so latency derived from it is approximate.
inline TimestampNS wall_clock_ns() {
    return static_cast<TimestampNS>(std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());
}

// One compressed still image as it travels over the channel
struct Frame {
    uint64_t sequence = 0;          // monotonic per capture process, gaps mean drops
    TimestampNS capture_ts_ns = 0;  // wall clock at capture
    bool has_header = false;        // false for payload-only messages
    std::vector<uint8_t> payload;   // encoded image bytes, opaque to the transport
};

// Model input, NCHW
struct InputTensor {
    std::vector<int64_t> shape;
    std::vector<float> data;
};

struct OutputTensor {
    std::string name;
    std::vector<int64_t> shape;
    std::vector<float> values;
};

// Everything the model produced for one frame, in model output order
struct InferenceResult {
    bool has_sequence = false;
    uint64_t sequence = 0;
    TimestampNS capture_ts_ns = 0;
    std::vector<OutputTensor> outputs;
};

struct RetryPolicy {
    std::chrono::milliseconds interval{1000};
    uint32_t max_attempts = 0;                // 0: retry forever
    std::chrono::milliseconds jitter{0};      // uniform in [-jitter, +jitter]
};

enum class InputMode {
    Image,  // decode the compressed image, resize, normalize to [0, 1]
    Raw     // payload bytes are the tensor elements, one byte each
};

struct CaptureConfig {
    std::string bind_address = "tcp://*:5555";
    int device_index = 0;
    int width = 640;
    int height = 480;
    int jpeg_quality = 95;
    std::chrono::milliseconds tick_interval{33};    // ~30 FPS, no drift correction
    int send_queue_depth = 2;                       // ZMQ_SNDHWM, newest frame dropped when full
    bool frame_header = false;                      // opt-in sequence + timestamp part
    bool detach = false;
    std::chrono::milliseconds stats_interval{10000};
    RetryPolicy channel_retry{std::chrono::milliseconds(1000), 0, std::chrono::milliseconds(0)};
    RetryPolicy camera_retry{std::chrono::milliseconds(1000), 0, std::chrono::milliseconds(0)};
};

struct InferenceConfig {
    std::string connect_address = "tcp://localhost:5555";
    std::string model_path = "model.onnx";
    std::vector<int64_t> input_shape{1, 3, 224, 224};
    InputMode input_mode = InputMode::Image;
    int receive_queue_depth = 2;                    // ZMQ_RCVHWM
    std::chrono::milliseconds receive_error_backoff{1000};
    size_t result_preview = 8;                      // values printed per output tensor
    int intra_op_threads = 1;
    bool detach = false;
    std::chrono::milliseconds stats_interval{10000};
    RetryPolicy channel_retry{std::chrono::milliseconds(2000), 0, std::chrono::milliseconds(0)};
    RetryPolicy model_retry{std::chrono::milliseconds(5000), 0, std::chrono::milliseconds(0)};
};

struct AppConfig {
    std::string log_level = "info";
    CaptureConfig capture;
    InferenceConfig inference;
};
