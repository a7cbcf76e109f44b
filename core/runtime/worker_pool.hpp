#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace proxyvisor {
namespace runtime {

// Bounded pool for blocking work: HTTP calls, archive extraction, hashing,
// subprocess readiness waits. Results must be posted back to the EventLoop
// before they touch shared state.
class WorkerPool {
public:
    using Task = std::function<void()>;

    explicit WorkerPool(size_t thread_count, const std::string &name = "workers");
    ~WorkerPool();

    WorkerPool(const WorkerPool &) = delete;
    WorkerPool &operator=(const WorkerPool &) = delete;

    void start();

    // Runs every queued task, then joins the threads
    void stop();

    // Returns false if the pool is not running
    bool submit(Task task);

    size_t thread_count() const { return thread_count_; }
    size_t queued() const;

private:
    void worker_main(size_t index);

    size_t thread_count_;
    std::string name_;
    std::vector<std::thread> threads_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> queue_;
    bool accepting_ = false;
    bool stopping_ = false;
};

}  // namespace runtime
}  // namespace proxyvisor
