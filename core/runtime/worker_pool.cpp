#include "worker_pool.hpp"

#include <exception>

#include "logging/logger.hpp"

namespace proxyvisor {
namespace runtime {

WorkerPool::WorkerPool(size_t thread_count, const std::string &name)
    : thread_count_(thread_count == 0 ? 1 : thread_count), name_(name) {}

WorkerPool::~WorkerPool() { stop(); }

void WorkerPool::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (accepting_) {
        return;
    }
    accepting_ = true;
    stopping_ = false;
    for (size_t i = 0; i < thread_count_; ++i) {
        threads_.emplace_back(&WorkerPool::worker_main, this, i);
    }
    LOG_DEBUG("[WorkerPool] '" << name_ << "' started with " << thread_count_ << " thread(s)");
}

void WorkerPool::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!accepting_ && threads_.empty()) {
            return;
        }
        accepting_ = false;
        stopping_ = true;
    }
    cv_.notify_all();

    for (auto &thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();
}

bool WorkerPool::submit(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!accepting_) {
            return false;
        }
        queue_.push_back(std::move(task));
    }
    cv_.notify_one();
    return true;
}

size_t WorkerPool::queued() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void WorkerPool::worker_main(size_t index) {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                return;  // stopping and drained
            }
            task = std::move(queue_.front());
            queue_.pop_front();
        }

        try {
            task();
        } catch (const std::exception &e) {
            LOG_ERROR("[WorkerPool] '" << name_ << "' worker " << index << " task threw: " << e.what());
        } catch (...) {
            LOG_ERROR("[WorkerPool] '" << name_ << "' worker " << index << " task threw unknown exception");
        }
    }
}

}  // namespace runtime
}  // namespace proxyvisor
