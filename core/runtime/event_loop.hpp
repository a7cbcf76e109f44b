#pragma once

/**
 * @file event_loop.hpp
 * @brief Single-threaded task and timer scheduler
 *
 * All shared-state mutation (quota map, warmup scheduling) happens on this
 * thread. Blocking work runs on a WorkerPool and posts its result back here.
 *
 * Thread safety:
 * - post(), post_after(), cancel() may be called from any thread
 * - tasks run one at a time, in FIFO order, on the loop thread
 * - a timer whose deadline passed runs before newer posted tasks
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace proxyvisor {
namespace runtime {

class EventLoop {
public:
    using Task = std::function<void()>;
    using TimerId = uint64_t;
    using Clock = std::chrono::steady_clock;

    explicit EventLoop(const std::string &name = "loop");
    ~EventLoop();

    EventLoop(const EventLoop &) = delete;
    EventLoop &operator=(const EventLoop &) = delete;

    // Spawn the loop thread. No-op if already running.
    void start();

    // Stop the loop thread and join. Pending tasks and timers are dropped.
    void stop();

    bool running() const { return running_.load(); }

    // Queue a task for execution on the loop thread
    void post(Task task);

    // Queue a task to run after delay. Returns an id usable with cancel().
    TimerId post_after(std::chrono::milliseconds delay, Task task);

    // Cancel a pending timer. Returns false if it already fired or was unknown.
    bool cancel(TimerId id);

    bool is_loop_thread() const;

    size_t pending_timers() const;

private:
    struct Timer {
        Clock::time_point deadline;
        Task task;
    };

    void run();

    std::string name_;
    std::atomic<bool> running_{false};
    std::thread thread_;
    std::thread::id loop_thread_id_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_requested_ = false;
    std::deque<Task> tasks_;
    std::map<TimerId, Timer> timers_;
    TimerId next_timer_id_ = 1;
};

}  // namespace runtime
}  // namespace proxyvisor
