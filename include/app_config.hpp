#pragma once

#include "data_types.hpp"

#include <functional>
#include <optional>
#include <string>

// Reads one environment variable; std::nullopt when unset
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// Which executable is starting; only its section of the config is validated
enum class AgentRole { Capture, Inference };

// Options shared by both executables
struct CommandLine {
    std::string config_path;   // --config
    std::string log_level;     // --log-level
    bool detach = false;       // --detach
    bool help = false;         // --help
};

// Throws ConfigError on an unknown option or a missing option value.
CommandLine parse_command_line(int argc, char** argv);
void print_usage(const char* program);

// EnvLookup backed by std::getenv
EnvLookup process_environment();

InputMode parse_input_mode(const std::string& name);
const char* input_mode_name(InputMode mode);

// Overlays the YAML file at path onto config. Throws ConfigError.
void load_config_file(const std::string& path, AppConfig& config);

// Overlays ZMQ_ADDRESS, MODEL_PATH, CAPTURE_BIND_ADDRESS and LOG_LEVEL onto config.
void apply_environment(const EnvLookup& env, AppConfig& config);

// Rejects a log level or a role section the agent cannot run with.
// Throws ConfigError naming the key.
void validate_config(const AppConfig& config, AgentRole role);

/*
 * Builds the effective configuration:
 * defaults < YAML file (--config or EDGE_INFER_CONFIG) < environment < command line.
 * The result is validated for role before it is returned.
 */
AppConfig load_app_config(const CommandLine& cli, const EnvLookup& env, AgentRole role);
