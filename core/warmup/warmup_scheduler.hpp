#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "proxy/management_api.hpp"
#include "runtime/event_loop.hpp"
#include "warmup/warmup_schedule.hpp"
#include "warmup/warmup_settings.hpp"
#include "warmup/warmup_types.hpp"

namespace proxyvisor {
namespace runtime {
class WorkerPool;
}  // namespace runtime

namespace warmup {

struct WarmupSchedulerOptions {
    std::chrono::seconds model_cache_ttl = std::chrono::hours(8);
    std::chrono::milliseconds min_delay{1000};  // Floor for the wake-up timer
};

/**
 * @brief Per-account keep-alive requests on interval or daily schedules
 *
 * Scheduling state (next runs, the wake-up timer) is owned by the EventLoop.
 * A cycle processes due accounts one after another on a single WorkerPool
 * task, then posts back to the loop to reschedule them. restart() bumps a
 * generation counter so a timer or cycle from before it never re-arms.
 *
 * statuses() may be called from any thread. The loop and pool must be
 * stopped before the scheduler is destroyed.
 */
class WarmupScheduler {
public:
    using Clock = std::chrono::system_clock;
    using NowFn = std::function<Clock::time_point()>;
    using ApiProvider = std::function<std::shared_ptr<proxy::IManagementApi>()>;
    using ProxyRunningFn = std::function<bool()>;
    using CycleCallback = std::function<void()>;

    WarmupScheduler(runtime::EventLoop &loop, runtime::WorkerPool &pool, WarmupSettings &settings,
                    ProxyRunningFn proxy_running, ApiProvider api_provider, NowFn now = nullptr,
                    WarmupSchedulerOptions options = WarmupSchedulerOptions());
    ~WarmupScheduler();

    WarmupScheduler(const WarmupScheduler &) = delete;
    WarmupScheduler &operator=(const WarmupScheduler &) = delete;

    // Cancel the pending wake-up, recompute every enabled account's next run, re-arm
    void restart();

    // Cancel the pending wake-up. A cycle already running finishes without re-arming.
    void stop();

    // Process due accounts. No-op while another cycle is running.
    void run_cycle();

    std::map<std::string, WarmupStatus> statuses() const;
    std::optional<WarmupStatus> status(const std::string &account_id) const;
    std::optional<Clock::time_point> next_run(const std::string &account_id) const;

    bool is_cycle_running() const;

    // Invoked on the loop thread whenever a cycle (or a skipped cycle) ends
    void set_cycle_callback(CycleCallback callback);

    void invalidate_model_cache();

private:
    Clock::time_point now() const { return now_(); }

    // Next slot for one account after `from`
    Clock::time_point next_slot(const WarmupAccountKey &key, Clock::time_point from) const;

    void arm_locked(uint64_t generation);
    void finish_cycle(uint64_t generation, const std::vector<WarmupAccountKey> &processed);
    void notify_cycle_done();

    // Worker thread
    void warm_account(const WarmupAccountKey &key, proxy::IManagementApi &api);
    bool available_models(const WarmupAccountKey &key, const std::string &auth_name, proxy::IManagementApi &api,
                          std::vector<std::string> &models);
    void update_status(const std::string &id, const std::function<void(WarmupStatus &)> &mutate);

    runtime::EventLoop &loop_;
    runtime::WorkerPool &pool_;
    WarmupSettings &settings_;
    ProxyRunningFn proxy_running_;
    ApiProvider api_provider_;
    NowFn now_;
    WarmupSchedulerOptions options_;

    mutable std::mutex mutex_;
    uint64_t generation_ = 0;
    std::optional<runtime::EventLoop::TimerId> timer_;
    bool cycle_running_ = false;
    bool stopped_ = false;
    std::map<std::string, Clock::time_point> next_runs_;
    std::map<std::string, WarmupStatus> statuses_;
    std::set<std::string> running_accounts_;
    std::map<std::string, std::pair<std::vector<std::string>, Clock::time_point>> model_cache_;
    CycleCallback cycle_callback_;
};

}  // namespace warmup
}  // namespace proxyvisor
