#include "signal_handler.hpp"

#include <csignal>

namespace proxyvisor {
namespace runtime {

std::atomic<int> SignalHandler::last_signal_{0};

void SignalHandler::install() {
    last_signal_.store(0);
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
    // A dying proxy must not take us down through a broken pipe
    std::signal(SIGPIPE, SIG_IGN);
}

bool SignalHandler::is_shutdown_requested() { return last_signal_.load() != 0; }

int SignalHandler::last_signal() { return last_signal_.load(); }

void SignalHandler::handle_signal(int signal) {
    // Async-signal-safe: lock-free atomic store only
    last_signal_.store(signal);
}

}  // namespace runtime
}  // namespace proxyvisor
