#include "logging.hpp"
#include "errors.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>

#include <map>

bool parse_log_level(const std::string& name, spdlog::level::level_enum& level) {
    static const std::map<std::string, spdlog::level::level_enum> levels = {
        {"trace", spdlog::level::trace},
        {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},
        {"warn", spdlog::level::warn},
        {"warning", spdlog::level::warn},
        {"error", spdlog::level::err},
        {"critical", spdlog::level::critical},
        {"off", spdlog::level::off},
    };
    auto it = levels.find(name);
    if (it == levels.end()) return false;
    level = it->second;
    return true;
}

void init_logging(const std::string& process_name, const std::string& level) {
    spdlog::level::level_enum lvl = spdlog::level::info;
    if (!parse_log_level(level, lvl)) {
        throw ConfigError("unknown log level '" + level + "'");
    }

    // 1. diagnostics: colored, stderr, tagged with the process name
    auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(process_name, console);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    logger->set_level(lvl);
    spdlog::set_default_logger(logger);

    // 2. results: bare lines on stdout so they can be piped
    auto results = result_logger();
    results->set_pattern("%v");
    results->set_level(spdlog::level::info);
}

std::shared_ptr<spdlog::logger> result_logger() {
    auto logger = spdlog::get(kResultLoggerName);
    if (!logger) {
        logger = spdlog::stdout_logger_mt(kResultLoggerName);
        logger->set_pattern("%v");
    }
    return logger;
}
