#pragma once

#include <sys/types.h>

#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace proxyvisor {
namespace proxy {

// ProxyProcess owns one child process and its two output pipes.
// Responsibilities:
// - Spawn with stdout/stderr redirected to non-blocking pipes, stdin from /dev/null
// - Drain output into bounded line tails so the child never blocks on a full pipe
// - Reap without blocking, terminate with SIGTERM then SIGKILL
//
// All methods are safe to call from multiple threads.
class ProxyProcess {
public:
    ProxyProcess(const std::string &tag, const std::string &executable_path, const std::vector<std::string> &args = {},
                 const std::string &working_dir = "", size_t max_tail_lines = 10);
    ~ProxyProcess();

    // Delete copy/move
    ProxyProcess(const ProxyProcess &) = delete;
    ProxyProcess &operator=(const ProxyProcess &) = delete;

    // Spawn the process
    // Returns true on success, false on failure (sets last_error)
    bool spawn();

    // Reaps the child if it exited; true while it is alive
    bool is_running();

    // Exit code once reaped. Death by signal N is reported as 128 + N.
    std::optional<int> exit_code() const;

    // Pull whatever is readable from both pipes into the line tails
    void drain_output();

    // Poll until the child exits or timeout_ms elapses
    bool wait_for_exit(int timeout_ms);

    // SIGTERM, wait grace_ms, escalate to SIGKILL. Returns true once reaped.
    bool terminate(int grace_ms);

    // Last lines of output (joined with '\n'); partial trailing line included
    std::string stdout_tail() const;
    std::string stderr_tail() const;

    pid_t pid() const;
    const std::string &tag() const { return tag_; }
    std::string last_error() const;

private:
    struct OutputTail {
        int fd = -1;
        std::deque<std::string> lines;
        std::string partial;
    };

    bool reap_locked(bool block);
    void drain_locked(OutputTail &tail);
    void push_line_locked(OutputTail &tail, std::string line);
    std::string join_locked(const OutputTail &tail) const;
    void close_pipes_locked();

    std::string tag_;
    std::string executable_path_;
    std::vector<std::string> args_;
    std::string working_dir_;
    size_t max_tail_lines_;

    mutable std::mutex mutex_;
    pid_t pid_ = -1;
    std::optional<int> exit_code_;
    OutputTail stdout_;
    OutputTail stderr_;
    std::string error_;
};

}  // namespace proxy
}  // namespace proxyvisor
