#include "capture_agent.hpp"
#include "inference_agent.hpp"
#include "test_fakes.hpp"
#include "zmq_channel.hpp"

#include <gtest/gtest.h>
#include <zmq.hpp>

#include <atomic>
#include <memory>
#include <string>
#include <thread>

using namespace std::chrono_literals;

// Both agents on one bounded channel, stepped tick by tick
TEST(Pipeline, SlowConsumerCausesDropsNotStalls) {
    auto camera = std::make_shared<CameraScript>();
    auto channel = std::make_shared<ChannelState>();
    channel->capacity = 4;
    auto engine = std::make_shared<EngineScript>();
    RecordingSleeper capture_sleeper;
    RecordingSleeper inference_sleeper;
    std::vector<InferenceResult> results;

    CaptureConfig capture_config;
    capture_config.frame_header = true;  // sequence gaps need the header
    CaptureAgent::Hooks capture_hooks;
    capture_hooks.open_camera = fake_camera_factory(camera);
    capture_hooks.open_channel = [channel]() -> std::unique_ptr<FrameSender> {
        return std::make_unique<FakeSender>(channel);
    };
    capture_hooks.encode = raw_encode;
    capture_hooks.sleep = capture_sleeper.fn();
    CaptureAgent capture(capture_config, capture_hooks);

    InferenceConfig inference_config;
    inference_config.input_shape = {1, 1, 4, 4};
    inference_config.input_mode = InputMode::Raw;
    InferenceAgent::Hooks inference_hooks;
    inference_hooks.open_channel = [channel]() -> std::unique_ptr<FrameReceiver> {
        return std::make_unique<FakeReceiver>(channel);
    };
    inference_hooks.load_model = [engine]() -> std::unique_ptr<InferenceEngine> {
        return std::make_unique<FakeEngine>(engine);
    };
    inference_hooks.sink = [&results](const InferenceResult& r) { results.push_back(r); };
    inference_hooks.sleep = inference_sleeper.fn();
    InferenceAgent inference(inference_config, inference_hooks);

    capture.open_resources();
    inference.open_resources();

    // consumer idle for the first half, then one frame per tick
    for (int tick = 0; tick < 100; ++tick) {
        capture.service_tick();
        if (tick >= 50) inference.service_tick();
    }
    while (!channel->queue.empty()) inference.service_tick();

    const auto produced = capture.stats();
    EXPECT_EQ(produced.ticks, 100u);
    EXPECT_GT(produced.frames_dropped, 0u);
    EXPECT_EQ(produced.frames_sent + produced.frames_dropped, 100u);
    EXPECT_LT(results.size(), 100u);
    EXPECT_EQ(results.size(), produced.frames_sent);
    EXPECT_TRUE(capture_sleeper.sleeps.empty());

    // every delivered frame is byte-identical to what the camera produced for it
    ASSERT_EQ(engine->inputs.size(), results.size());
    for (size_t i = 0; i < channel->delivered.size(); ++i) {
        const Frame& frame = channel->delivered[i];
        const cv::Mat expected = camera->next_image(static_cast<int>(frame.sequence));
        ASSERT_EQ(frame.payload.size(), 16u);
        for (size_t b = 0; b < 16; ++b) {
            EXPECT_EQ(frame.payload[b], expected.data[b]);
            EXPECT_EQ(engine->inputs[i].data[b], static_cast<float>(expected.data[b]));
        }
        EXPECT_EQ(results[i].sequence, frame.sequence);
    }

    // losses show up as sequence gaps on the consumer side
    EXPECT_EQ(inference.stats().frames_lost, produced.frames_dropped);
}

// Same pipeline over a real ZeroMQ channel with both loops running
TEST(Pipeline, ZmqAgentsRunConcurrently) {
    zmq::context_t context(1);
    const std::string address = "inproc://pipeline";

    auto camera = std::make_shared<CameraScript>();
    auto engine = std::make_shared<EngineScript>();
    std::atomic<int> results{0};

    CaptureConfig capture_config;
    capture_config.bind_address = address;
    capture_config.send_queue_depth = 1;
    capture_config.tick_interval = 2ms;
    CaptureAgent::Hooks capture_hooks;
    capture_hooks.open_camera = fake_camera_factory(camera);
    capture_hooks.open_channel = [&context, &capture_config]() -> std::unique_ptr<FrameSender> {
        return std::make_unique<ZmqFrameSender>(context, capture_config.bind_address,
                                                capture_config.send_queue_depth, capture_config.frame_header);
    };
    capture_hooks.encode = raw_encode;
    CaptureAgent capture(capture_config, capture_hooks);

    InferenceConfig inference_config;
    inference_config.connect_address = address;
    inference_config.input_shape = {1, 1, 4, 4};
    inference_config.input_mode = InputMode::Raw;
    inference_config.receive_queue_depth = 1;
    inference_config.receive_error_backoff = 5ms;
    InferenceAgent::Hooks inference_hooks;
    inference_hooks.open_channel = [&context, &inference_config]() -> std::unique_ptr<FrameReceiver> {
        return std::make_unique<ZmqFrameReceiver>(context, inference_config.connect_address,
                                                  inference_config.receive_queue_depth, 20);
    };
    inference_hooks.load_model = [engine]() -> std::unique_ptr<InferenceEngine> {
        return std::make_unique<FakeEngine>(engine);
    };
    inference_hooks.sink = [&results](const InferenceResult&) {
        std::this_thread::sleep_for(10ms);  // consumer slower than the producer
        ++results;
    };
    InferenceAgent inference(inference_config, inference_hooks);

    ASSERT_TRUE(capture.start());
    std::this_thread::sleep_for(20ms);  // inproc endpoint must be bound before connect
    ASSERT_TRUE(inference.start());
    std::this_thread::sleep_for(500ms);

    const auto begin = std::chrono::steady_clock::now();
    inference.stop();
    capture.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 1s);

    EXPECT_FALSE(capture.failure());
    EXPECT_FALSE(inference.failure());
    EXPECT_GT(results.load(), 0);
    EXPECT_GT(capture.stats().frames_dropped, 0u);
    EXPECT_EQ(inference.stats().decode_errors, 0u);
}
