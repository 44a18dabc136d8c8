#include "app_config.hpp"
#include "capture_agent.hpp"
#include "camera_module.hpp"
#include "errors.hpp"
#include "frame_codec.hpp"
#include "logging.hpp"
#include "service_runtime.hpp"
#include "zmq_channel.hpp"

#include <spdlog/spdlog.h>
#include <zmq.hpp>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <system_error>
#include <vector>


int main(int argc, char** argv) {
    // 1. configuration, nothing is opened before it validates
    AppConfig config;
    try {
        const CommandLine cli = parse_command_line(argc, argv);
        if (cli.help) {
            print_usage(argv[0]);
            return EXIT_SUCCESS;
        }
        config = load_app_config(cli, process_environment(), AgentRole::Capture);
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 2;
    }
    const CaptureConfig& capture = config.capture;

    init_logging("capture_agent", config.log_level);
    try {
        if (capture.detach) detach_from_terminal();
    } catch (const std::system_error& e) {
        spdlog::critical("Cannot detach: {}", e.what());
        return EXIT_FAILURE;
    }
    install_signal_handlers();

    // 2. wiring: zmq context and the real camera / encoder
    zmq::context_t context(1);
    JpegEncoder encoder(capture.jpeg_quality);

    CaptureAgent::Hooks hooks;
    hooks.open_camera = [&capture] { return open_camera(capture); };
    hooks.open_channel = [&context, &capture]() -> std::unique_ptr<FrameSender> {
        return std::make_unique<ZmqFrameSender>(context, capture.bind_address, capture.send_queue_depth,
                                                capture.frame_header);
    };
    hooks.encode = [&encoder](const cv::Mat& frame, std::vector<uint8_t>& out) {
        return encoder.encode(frame, out);
    };

    auto agent = std::make_shared<CaptureAgent>(capture, hooks);
    agent->start();
    spdlog::info("capture_agent started (device {}, {}x{} @ {} ms)", capture.device_index,
                 capture.width, capture.height, capture.tick_interval.count());

    // 3. the loop runs until a signal arrives
    wait_for_shutdown([&agent] { return agent->running(); });
    agent->stop();

    if (auto failure = agent->failure()) {
        try {
            std::rethrow_exception(failure);
        } catch (const std::exception& e) {
            spdlog::critical("capture_agent exiting: {}", e.what());
        }
        return EXIT_FAILURE;
    }
    spdlog::info("capture_agent stopped");
    return EXIT_SUCCESS;
}
