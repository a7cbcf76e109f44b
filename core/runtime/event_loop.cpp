#include "event_loop.hpp"

#include <exception>

#include "logging/logger.hpp"

namespace proxyvisor {
namespace runtime {

EventLoop::EventLoop(const std::string &name) : name_(name) {}

EventLoop::~EventLoop() { stop(); }

void EventLoop::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_.load()) {
        return;
    }
    stop_requested_ = false;
    running_ = true;
    thread_ = std::thread(&EventLoop::run, this);
    loop_thread_id_ = thread_.get_id();
    LOG_DEBUG("[EventLoop] '" << name_ << "' started");
}

void EventLoop::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.load()) {
            return;
        }
        stop_requested_ = true;
    }
    cv_.notify_all();

    if (thread_.joinable()) {
        if (std::this_thread::get_id() == thread_.get_id()) {
            // stop() from a loop task: let the thread unwind on its own
            thread_.detach();
        } else {
            thread_.join();
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!tasks_.empty() || !timers_.empty()) {
        LOG_DEBUG("[EventLoop] '" << name_ << "' dropped " << tasks_.size() << " task(s) and " << timers_.size()
                                  << " timer(s) on stop");
    }
    tasks_.clear();
    timers_.clear();
    running_ = false;
    loop_thread_id_ = std::thread::id();
}

void EventLoop::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
}

EventLoop::TimerId EventLoop::post_after(std::chrono::milliseconds delay, Task task) {
    TimerId id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = next_timer_id_++;
        timers_[id] = Timer{Clock::now() + delay, std::move(task)};
    }
    cv_.notify_one();
    return id;
}

bool EventLoop::cancel(TimerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.erase(id) > 0;
}

bool EventLoop::is_loop_thread() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_.load() && std::this_thread::get_id() == loop_thread_id_;
}

size_t EventLoop::pending_timers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.size();
}

void EventLoop::run() {
    std::unique_lock<std::mutex> lock(mutex_);

    while (!stop_requested_) {
        Task next;

        // Earliest expired timer first
        auto now = Clock::now();
        auto due = timers_.end();
        for (auto it = timers_.begin(); it != timers_.end(); ++it) {
            if (it->second.deadline <= now && (due == timers_.end() || it->second.deadline < due->second.deadline)) {
                due = it;
            }
        }

        if (due != timers_.end()) {
            next = std::move(due->second.task);
            timers_.erase(due);
        } else if (!tasks_.empty()) {
            next = std::move(tasks_.front());
            tasks_.pop_front();
        } else {
            if (timers_.empty()) {
                cv_.wait(lock);
            } else {
                auto earliest = timers_.begin()->second.deadline;
                for (const auto &entry : timers_) {
                    if (entry.second.deadline < earliest) {
                        earliest = entry.second.deadline;
                    }
                }
                cv_.wait_until(lock, earliest);
            }
            continue;
        }

        lock.unlock();
        try {
            next();
        } catch (const std::exception &e) {
            LOG_ERROR("[EventLoop] '" << name_ << "' task threw: " << e.what());
        }
        lock.lock();
    }
}

}  // namespace runtime
}  // namespace proxyvisor
