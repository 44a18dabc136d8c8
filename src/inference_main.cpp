#include "app_config.hpp"
#include "errors.hpp"
#include "inference_agent.hpp"
#include "logging.hpp"
#include "model_module.hpp"
#include "result_sink.hpp"
#include "service_runtime.hpp"
#include "zmq_channel.hpp"

#include <spdlog/spdlog.h>
#include <zmq.hpp>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <system_error>


int main(int argc, char** argv) {
    // 1. configuration (ZMQ_ADDRESS / MODEL_PATH override the file)
    AppConfig config;
    try {
        const CommandLine cli = parse_command_line(argc, argv);
        if (cli.help) {
            print_usage(argv[0]);
            return EXIT_SUCCESS;
        }
        config = load_app_config(cli, process_environment(), AgentRole::Inference);
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 2;
    }
    const InferenceConfig& inference = config.inference;

    init_logging("inference_agent", config.log_level);
    try {
        if (inference.detach) detach_from_terminal();
    } catch (const std::system_error& e) {
        spdlog::critical("Cannot detach: {}", e.what());
        return EXIT_FAILURE;
    }
    install_signal_handlers();

    // 2. wiring: zmq receive side, ONNX model, stdout result sink
    zmq::context_t context(1);
    ResultSink sink(result_logger(), inference.result_preview);

    InferenceAgent::Hooks hooks;
    hooks.open_channel = [&context, &inference]() -> std::unique_ptr<FrameReceiver> {
        return std::make_unique<ZmqFrameReceiver>(context, inference.connect_address,
                                                  inference.receive_queue_depth);
    };
    hooks.load_model = [&inference] { return load_onnx_model(inference); };
    hooks.sink = [&sink](const InferenceResult& result) { sink.emit(result); };
    hooks.interrupt = [&context] { context.shutdown(); };

    std::shared_ptr<InferenceAgent> agent;
    try {
        agent = std::make_shared<InferenceAgent>(inference, hooks);
    } catch (const ConfigError& e) {
        spdlog::critical("Configuration error: {}", e.what());
        return 2;
    }
    agent->start();
    spdlog::info("inference_agent started (model {}, input {})", inference.model_path,
                 shape_to_string(inference.input_shape));

    // 3. the loop runs until a signal arrives
    wait_for_shutdown([&agent] { return agent->running(); });
    agent->stop();

    if (auto failure = agent->failure()) {
        try {
            std::rethrow_exception(failure);
        } catch (const std::exception& e) {
            spdlog::critical("inference_agent exiting: {}", e.what());
        }
        return EXIT_FAILURE;
    }
    spdlog::info("inference_agent stopped");
    return EXIT_SUCCESS;
}
