#pragma once

#include <sys/types.h>

#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "common/status.hpp"
#include "proxy/port_inspector.hpp"
#include "proxy/proxy_process.hpp"

namespace proxyvisor {
namespace proxy {

struct SupervisorOptions {
    int poll_interval_ms = 500;      // Readiness poll step
    int startup_timeout_ms = 3000;   // Readiness deadline
    int stop_timeout_ms = 5000;      // SIGTERM grace on stop()
    int cancel_timeout_ms = 2000;    // SIGTERM grace on cancel_startup()
    int port_release_wait_ms = 500;  // Wait after killing a foreign port owner
    size_t output_tail_lines = 10;   // Child output kept for error messages
};

// ProcessSupervisor launches the proxy binary and owns its process handle.
// Handles:
// - adoption of an already-running instance of our proxy on the port
// - eviction of a foreign process holding the port
// - bounded readiness polling with cancellation from another thread
// - graceful stop with SIGKILL escalation
class ProcessSupervisor {
public:
    // Answers "is the listener on the port our proxy?" (authenticated management probe)
    using IdentityProbe = std::function<bool()>;

    // Immutable view for cross-thread reads
    struct Snapshot {
        bool running = false;
        bool starting = false;
        bool adopted = false;  // Running instance was not spawned by us
        int port = 0;
        std::optional<pid_t> child_pid;
        int spawn_count = 0;
    };

    ProcessSupervisor(IPortInspector &ports, IdentityProbe probe, SupervisorOptions options = {});
    ~ProcessSupervisor();

    ProcessSupervisor(const ProcessSupervisor &) = delete;
    ProcessSupervisor &operator=(const ProcessSupervisor &) = delete;

    // Blocks for up to startup_timeout_ms. Must not run on the event loop thread.
    common::Status start(const std::string &binary_path, const std::string &config_path, int port);

    // Terminate our child (or the adopted listener). Always leaves the supervisor stopped.
    void stop();

    // Safe from any thread; no-op when no start() is in flight
    void cancel_startup();

    // Adopt a listener on port if the identity probe says it is ours. Never spawns.
    bool adopt_existing(int port);

    // If our child died since the last call, returns a description and marks the supervisor stopped
    std::optional<std::string> check_child_exit();

    Snapshot snapshot() const;
    bool is_running() const;

private:
    common::Status start_impl(const std::string &binary_path, const std::string &config_path, int port);
    common::Status evict_foreign_listener(int port);
    bool adopt_if_ours(int port);
    std::string describe_failure(ProxyProcess &process) const;
    void stop_adopted_listener(int port);

    // Sleep up to ms; returns false if cancelled meanwhile
    bool wait_cancellable(int ms);
    bool cancel_requested() const;

    IPortInspector &ports_;
    IdentityProbe probe_;
    SupervisorOptions options_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::shared_ptr<ProxyProcess> process_;
    bool running_ = false;
    bool starting_ = false;
    bool adopted_ = false;
    bool cancel_requested_ = false;
    int port_ = 0;
    int spawn_count_ = 0;
};

}  // namespace proxy
}  // namespace proxyvisor
