#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

// Name of the logger that carries inference results to stdout
constexpr const char* kResultLoggerName = "result";

// Maps a config string ("info", "warn", ...) to a spdlog level. Returns false for unknown names.
bool parse_log_level(const std::string& name, spdlog::level::level_enum& level);

// Installs the process-wide diagnostic logger on stderr and the result logger on stdout.
void init_logging(const std::string& process_name, const std::string& level);

// Result logger, created on first use if init_logging() was not called.
std::shared_ptr<spdlog::logger> result_logger();
