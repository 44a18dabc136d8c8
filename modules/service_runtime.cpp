#include "service_runtime.hpp"

#include <spdlog/spdlog.h>

#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <system_error>
#include <thread>

namespace {

volatile std::sig_atomic_t g_shutdown = 0;

void on_signal(int) {
    g_shutdown = 1;
}

}  // namespace

void install_signal_handlers() {
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
    std::signal(SIGPIPE, SIG_IGN);
}

bool shutdown_requested() {
    return g_shutdown != 0;
}

void wait_for_shutdown(const std::function<bool()>& still_running, std::chrono::milliseconds poll) {
    while (!shutdown_requested() && still_running()) {
        std::this_thread::sleep_for(poll);
    }
    if (shutdown_requested()) {
        spdlog::info("Shutdown requested");
    }
}

void detach_from_terminal() {
    // nochdir=1: a relative model path must still resolve; noclose=1: keep logging to stdio
    if (::daemon(1, 1) != 0) {
        throw std::system_error(errno, std::generic_category(), "daemon");
    }
    spdlog::info("Detached from terminal, pid {}", static_cast<long>(::getpid()));
}
