#include "app_config.hpp"
#include "errors.hpp"
#include "logging.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>

namespace {

template <typename T>
void read_key(const YAML::Node& parent, const std::string& section, const char* key, T& out) {
    const YAML::Node node = parent[key];
    if (!node) return;
    try {
        out = node.as<T>();
    } catch (const YAML::Exception& e) {
        throw ConfigError("invalid value for '" + section + "." + key + "': " + e.what());
    }
}

void read_ms(const YAML::Node& parent, const std::string& section, const char* key,
             std::chrono::milliseconds& out) {
    long long ms = out.count();
    read_key(parent, section, key, ms);
    out = std::chrono::milliseconds(ms);
}

void read_retry(const YAML::Node& parent, const std::string& section, const char* key, RetryPolicy& policy) {
    const YAML::Node node = parent[key];
    if (!node) return;
    if (!node.IsMap()) {
        throw ConfigError("'" + section + "." + key + "' must be a mapping");
    }
    const std::string path = section + "." + key;
    read_ms(node, path, "interval_ms", policy.interval);
    read_ms(node, path, "jitter_ms", policy.jitter);

    long long attempts = policy.max_attempts;
    read_key(node, path, "max_attempts", attempts);
    if (attempts < 0 || attempts > static_cast<long long>(UINT32_MAX)) {
        throw ConfigError("'" + path + ".max_attempts' must be between 0 and " + std::to_string(UINT32_MAX));
    }
    policy.max_attempts = static_cast<uint32_t>(attempts);
}

bool has_transport_scheme(const std::string& address) {
    for (const char* scheme : {"tcp://", "ipc://", "inproc://"}) {
        if (address.rfind(scheme, 0) == 0 && address.size() > std::strlen(scheme)) return true;
    }
    return false;
}

void require(bool ok, const std::string& message) {
    if (!ok) throw ConfigError(message);
}

void validate_retry(const RetryPolicy& policy, const std::string& key) {
    require(policy.interval.count() > 0, "'" + key + ".interval_ms' must be positive");
    require(policy.jitter.count() >= 0, "'" + key + ".jitter_ms' must not be negative");
    require(policy.jitter <= policy.interval, "'" + key + ".jitter_ms' must not exceed interval_ms");
}

}  // namespace

CommandLine parse_command_line(int argc, char** argv) {
    CommandLine cli;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) throw ConfigError("option " + arg + " needs a value");
            return argv[++i];
        };
        if (arg == "--config" || arg == "-c") {
            cli.config_path = value();
        } else if (arg == "--log-level") {
            cli.log_level = value();
        } else if (arg == "--detach") {
            cli.detach = true;
        } else if (arg == "--help" || arg == "-h") {
            cli.help = true;
        } else {
            throw ConfigError("unknown option '" + arg + "'");
        }
    }
    return cli;
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [--config <file.yaml>] [--log-level <level>] [--detach]\n"
              << "  --config     YAML configuration (default: $EDGE_INFER_CONFIG)\n"
              << "  --log-level  trace|debug|info|warn|error|critical|off\n"
              << "  --detach     run in the background, detached from the terminal\n";
}

EnvLookup process_environment() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) return std::nullopt;
        return std::string(value);
    };
}

InputMode parse_input_mode(const std::string& name) {
    if (name == "image") return InputMode::Image;
    if (name == "raw") return InputMode::Raw;
    throw ConfigError("'inference.input_mode' must be 'image' or 'raw', got '" + name + "'");
}

const char* input_mode_name(InputMode mode) {
    return mode == InputMode::Raw ? "raw" : "image";
}

void load_config_file(const std::string& path, AppConfig& config) {
    if (!std::filesystem::exists(path)) {
        throw ConfigError("config file not found: " + path);
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw ConfigError("cannot parse " + path + ": " + e.what());
    }
    if (root.IsNull()) return;  // empty file, keep defaults
    if (!root.IsMap()) {
        throw ConfigError(path + ": top level must be a mapping");
    }

    // 1. logging
    if (const YAML::Node logging = root["logging"]) {
        read_key(logging, "logging", "level", config.log_level);
    }

    // 2. capture agent
    if (const YAML::Node capture = root["capture"]) {
        CaptureConfig& c = config.capture;
        read_key(capture, "capture", "bind_address", c.bind_address);
        read_key(capture, "capture", "device_index", c.device_index);
        read_key(capture, "capture", "width", c.width);
        read_key(capture, "capture", "height", c.height);
        read_key(capture, "capture", "jpeg_quality", c.jpeg_quality);
        read_ms(capture, "capture", "tick_interval_ms", c.tick_interval);
        read_key(capture, "capture", "send_queue_depth", c.send_queue_depth);
        read_key(capture, "capture", "frame_header", c.frame_header);
        read_key(capture, "capture", "detach", c.detach);
        read_ms(capture, "capture", "stats_interval_ms", c.stats_interval);
        read_retry(capture, "capture", "channel_retry", c.channel_retry);
        read_retry(capture, "capture", "camera_retry", c.camera_retry);
    }

    // 3. inference agent
    if (const YAML::Node inference = root["inference"]) {
        InferenceConfig& c = config.inference;
        read_key(inference, "inference", "connect_address", c.connect_address);
        read_key(inference, "inference", "model_path", c.model_path);
        read_key(inference, "inference", "input_shape", c.input_shape);
        std::string mode = input_mode_name(c.input_mode);
        read_key(inference, "inference", "input_mode", mode);
        c.input_mode = parse_input_mode(mode);
        read_key(inference, "inference", "receive_queue_depth", c.receive_queue_depth);
        read_ms(inference, "inference", "receive_error_backoff_ms", c.receive_error_backoff);
        read_key(inference, "inference", "result_preview", c.result_preview);
        read_key(inference, "inference", "intra_op_threads", c.intra_op_threads);
        read_key(inference, "inference", "detach", c.detach);
        read_ms(inference, "inference", "stats_interval_ms", c.stats_interval);
        read_retry(inference, "inference", "channel_retry", c.channel_retry);
        read_retry(inference, "inference", "model_retry", c.model_retry);
    }
}

void apply_environment(const EnvLookup& env, AppConfig& config) {
    if (auto v = env("ZMQ_ADDRESS")) config.inference.connect_address = *v;
    if (auto v = env("MODEL_PATH")) config.inference.model_path = *v;
    if (auto v = env("CAPTURE_BIND_ADDRESS")) config.capture.bind_address = *v;
    if (auto v = env("LOG_LEVEL")) config.log_level = *v;
}

namespace {

void validate_capture(const CaptureConfig& cap) {
    require(has_transport_scheme(cap.bind_address),
            "'capture.bind_address' must start with tcp://, ipc:// or inproc://, got '" + cap.bind_address + "'");
    require(cap.device_index >= 0, "'capture.device_index' must not be negative");
    require(cap.width > 0 && cap.height > 0, "'capture.width' and 'capture.height' must be positive");
    require(cap.jpeg_quality >= 0 && cap.jpeg_quality <= 100, "'capture.jpeg_quality' must be in [0, 100]");
    require(cap.tick_interval.count() > 0, "'capture.tick_interval_ms' must be positive");
    require(cap.send_queue_depth >= 1, "'capture.send_queue_depth' must be at least 1");
    require(cap.stats_interval.count() > 0, "'capture.stats_interval_ms' must be positive");
    validate_retry(cap.channel_retry, "capture.channel_retry");
    validate_retry(cap.camera_retry, "capture.camera_retry");
}

void validate_inference(const InferenceConfig& inf) {
    require(has_transport_scheme(inf.connect_address),
            "'inference.connect_address' must start with tcp://, ipc:// or inproc://, got '" + inf.connect_address + "'");
    require(!inf.model_path.empty(), "'inference.model_path' must not be empty");
    require(inf.input_shape.size() == 4, "'inference.input_shape' must have 4 dimensions [N, C, H, W]");
    for (int64_t dim : inf.input_shape) {
        require(dim > 0, "'inference.input_shape' dimensions must be positive");
    }
    if (inf.input_mode == InputMode::Image) {
        require(inf.input_shape[0] == 1, "'inference.input_shape' batch must be 1 in image mode");
        require(inf.input_shape[1] == 1 || inf.input_shape[1] == 3,
                "'inference.input_shape' channels must be 1 or 3 in image mode");
    }
    require(inf.receive_queue_depth >= 1, "'inference.receive_queue_depth' must be at least 1");
    require(inf.receive_error_backoff.count() > 0, "'inference.receive_error_backoff_ms' must be positive");
    require(inf.intra_op_threads >= 1, "'inference.intra_op_threads' must be at least 1");
    require(inf.stats_interval.count() > 0, "'inference.stats_interval_ms' must be positive");
    validate_retry(inf.channel_retry, "inference.channel_retry");
    validate_retry(inf.model_retry, "inference.model_retry");
}

}  // namespace

void validate_config(const AppConfig& config, AgentRole role) {
    spdlog::level::level_enum level;
    require(parse_log_level(config.log_level, level), "'logging.level' is not a known level: '" + config.log_level + "'");

    if (role == AgentRole::Capture) {
        validate_capture(config.capture);
    } else {
        validate_inference(config.inference);
    }
}

AppConfig load_app_config(const CommandLine& cli, const EnvLookup& env, AgentRole role) {
    AppConfig config;

    std::string path = cli.config_path;
    if (path.empty()) {
        if (auto v = env("EDGE_INFER_CONFIG")) path = *v;
    }
    if (!path.empty()) {
        load_config_file(path, config);
    }

    apply_environment(env, config);

    if (!cli.log_level.empty()) config.log_level = cli.log_level;
    if (cli.detach) {
        config.capture.detach = true;
        config.inference.detach = true;
    }

    validate_config(config, role);
    return config;
}
