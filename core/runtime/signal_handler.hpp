#pragma once

#include <atomic>

namespace proxyvisor {
namespace runtime {

// Converts SIGINT/SIGTERM into a flag polled by the `run` foreground loop
class SignalHandler {
public:
    static void install();
    static bool is_shutdown_requested();

    // Signal number that requested shutdown, 0 if none
    static int last_signal();

private:
    static void handle_signal(int signal);
    static std::atomic<int> last_signal_;
};

}  // namespace runtime
}  // namespace proxyvisor
