#pragma once

#include <chrono>
#include <functional>

// SIGINT / SIGTERM request a clean stop instead of killing the process
void install_signal_handlers();
bool shutdown_requested();

// Blocks the calling thread until a stop is requested or still_running() turns false
void wait_for_shutdown(const std::function<bool()>& still_running,
                       std::chrono::milliseconds poll = std::chrono::milliseconds(100));

// Detaches from the controlling terminal with one daemon(3) call. The working
// directory and stdio are kept so relative paths and logs keep working.
// Throws std::system_error on failure. Call before any thread is started.
void detach_from_terminal();
