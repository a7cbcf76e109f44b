#include "warmup_scheduler.hpp"

#include <algorithm>

#include "logging/logger.hpp"
#include "runtime/worker_pool.hpp"
#include "warmup/warmup_request.hpp"

namespace proxyvisor {
namespace warmup {

WarmupScheduler::WarmupScheduler(runtime::EventLoop &loop, runtime::WorkerPool &pool, WarmupSettings &settings,
                                 ProxyRunningFn proxy_running, ApiProvider api_provider, NowFn now,
                                 WarmupSchedulerOptions options)
    : loop_(loop),
      pool_(pool),
      settings_(settings),
      proxy_running_(std::move(proxy_running)),
      api_provider_(std::move(api_provider)),
      now_(std::move(now)),
      options_(options) {
    if (!now_) {
        now_ = [] { return Clock::now(); };
    }
}

WarmupScheduler::~WarmupScheduler() { stop(); }

WarmupScheduler::Clock::time_point WarmupScheduler::next_slot(const WarmupAccountKey &key,
                                                              Clock::time_point from) const {
    if (settings_.schedule_mode(key) == ScheduleMode::DAILY) {
        return next_daily_run(settings_.daily_minutes(key), from);
    }
    return next_interval_run(settings_.cadence(key), from);
}

void WarmupScheduler::restart() {
    const auto targets = settings_.targets();
    const auto current = now();

    std::lock_guard<std::mutex> lock(mutex_);
    ++generation_;
    stopped_ = false;
    if (timer_) {
        loop_.cancel(*timer_);
        timer_.reset();
    }

    next_runs_.clear();
    for (const auto &key : targets) {
        const std::string id = key.to_id();
        // Interval accounts warm right away, daily ones wait for their slot
        next_runs_[id] = settings_.schedule_mode(key) == ScheduleMode::DAILY
                             ? next_daily_run(settings_.daily_minutes(key), current)
                             : current;
        statuses_[id].next_run = next_runs_[id];
    }

    LOG_INFO("[Warmup] Scheduler restarted with " << targets.size() << " account(s)");
    arm_locked(generation_);
}

void WarmupScheduler::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++generation_;
    stopped_ = true;
    if (timer_) {
        loop_.cancel(*timer_);
        timer_.reset();
    }
}

void WarmupScheduler::arm_locked(uint64_t generation) {
    if (next_runs_.empty()) {
        return;
    }
    Clock::time_point earliest = Clock::time_point::max();
    for (const auto &entry : next_runs_) {
        earliest = std::min(earliest, entry.second);
    }

    auto delay = std::chrono::duration_cast<std::chrono::milliseconds>(earliest - now());
    delay = std::max(delay, options_.min_delay);

    timer_ = loop_.post_after(delay, [this, generation] {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (generation != generation_) {
                return;
            }
            timer_.reset();
        }
        run_cycle();
    });
    LOG_DEBUG("[Warmup] Next wake-up in " << delay.count() << " ms");
}

void WarmupScheduler::run_cycle() {
    const auto targets = settings_.targets();
    uint64_t generation = 0;
    bool skipped = false;
    std::vector<WarmupAccountKey> due;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cycle_running_) {
            LOG_DEBUG("[Warmup] Cycle already running, skipping");
            return;
        }
        if (targets.empty()) {
            return;
        }
        generation = generation_;
        const auto current = now();

        if (!proxy_running_ || !proxy_running_()) {
            for (const auto &key : targets) {
                const std::string id = key.to_id();
                next_runs_[id] = next_slot(key, current);
                statuses_[id].next_run = next_runs_[id];
            }
            LOG_INFO("[Warmup] Proxy not running, rescheduled " << targets.size() << " account(s)");
            arm_locked(generation);
            skipped = true;
        } else {
            for (const auto &key : targets) {
                auto it = next_runs_.find(key.to_id());
                if (it != next_runs_.end() && it->second <= current) {
                    due.push_back(key);
                }
            }
            cycle_running_ = true;
        }
    }

    if (skipped) {
        notify_cycle_done();
        return;
    }

    LOG_INFO("[Warmup] Cycle started, " << due.size() << " account(s) due");
    auto api = api_provider_ ? api_provider_() : nullptr;
    bool submitted = pool_.submit([this, due, api, generation] {
        if (api) {
            for (const auto &key : due) {
                warm_account(key, *api);
            }
        } else {
            LOG_WARN("[Warmup] No management API, skipping " << due.size() << " account(s)");
        }
        loop_.post([this, generation, due] { finish_cycle(generation, due); });
    });
    if (!submitted) {
        LOG_ERROR("[Warmup] Worker pool not running, cycle abandoned");
        loop_.post([this, generation, due] { finish_cycle(generation, due); });
    }
}

void WarmupScheduler::finish_cycle(uint64_t generation, const std::vector<WarmupAccountKey> &processed) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cycle_running_ = false;
        const auto current = now();
        if (generation == generation_) {
            for (const auto &key : processed) {
                const std::string id = key.to_id();
                next_runs_[id] = next_slot(key, current);
                statuses_[id].next_run = next_runs_[id];
            }
            arm_locked(generation);
        } else if (!stopped_ && !timer_) {
            // A restart during the cycle had its wake-up refused by run_cycle
            arm_locked(generation_);
        }
    }
    LOG_INFO("[Warmup] Cycle finished");
    notify_cycle_done();
}

void WarmupScheduler::notify_cycle_done() {
    CycleCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = cycle_callback_;
    }
    if (callback) callback();
}

void WarmupScheduler::warm_account(const WarmupAccountKey &key, proxy::IManagementApi &api) {
    const std::string id = key.to_id();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_accounts_.insert(id).second) {
            return;
        }
    }

    auto release = [this, &id] {
        std::lock_guard<std::mutex> lock(mutex_);
        running_accounts_.erase(id);
    };

    std::vector<proxy::AuthFile> files;
    auto status = api.list_auth_files(files);
    if (!status) {
        update_status(id, [&status](WarmupStatus &s) { s.last_error = status.message(); });
        release();
        return;
    }

    auto match = match_auth_file(files, key.account_key);
    if (!match) {
        LOG_WARN("[Warmup] No auth file matches " << key.account_key);
        update_status(id, [](WarmupStatus &s) { s.last_error = "No matching auth file"; });
        release();
        return;
    }

    std::vector<std::string> available;
    if (!available_models(key, match->file_name, api, available)) {
        release();
        return;
    }

    std::vector<std::string> to_warm;
    for (const auto &model : settings_.selected_models(key)) {
        if (std::find(available.begin(), available.end(), model) != available.end()) {
            to_warm.push_back(model);
        }
    }
    if (to_warm.empty()) {
        LOG_DEBUG("[Warmup] No selected models available for " << key.account_key);
        release();
        return;
    }

    update_status(id, [&to_warm](WarmupStatus &s) {
        s.is_running = true;
        s.last_error.clear();
        s.progress_total = static_cast<int>(to_warm.size());
        s.progress_completed = 0;
        s.current_model.clear();
        for (const auto &model : to_warm) {
            s.model_states[model] = ModelState::PENDING;
        }
    });

    for (const auto &model : to_warm) {
        update_status(id, [&model](WarmupStatus &s) {
            s.current_model = model;
            s.model_states[model] = ModelState::RUNNING;
        });

        auto result = send_warmup(api, match->auth_index, model);

        update_status(id, [&model, &result](WarmupStatus &s) {
            ++s.progress_completed;
            if (result) {
                s.model_states[model] = ModelState::SUCCEEDED;
            } else {
                s.model_states[model] = ModelState::FAILED;
                s.last_error = result.message();
            }
        });
        if (!result) {
            LOG_WARN("[Warmup] " << key.account_key << " / " << model << ": " << result.message());
        }
    }

    const auto finished = now();
    update_status(id, [finished](WarmupStatus &s) {
        s.is_running = false;
        s.current_model.clear();
        s.last_run = finished;
    });
    release();
    LOG_INFO("[Warmup] Warmed " << to_warm.size() << " model(s) for " << key.account_key);
}

bool WarmupScheduler::available_models(const WarmupAccountKey &key, const std::string &auth_name,
                                       proxy::IManagementApi &api, std::vector<std::string> &models) {
    const std::string id = key.to_id();
    const auto current = now();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = model_cache_.find(id);
        if (it != model_cache_.end() && current - it->second.second <= options_.model_cache_ttl) {
            models = it->second.first;
            return true;
        }
    }

    auto status = api.list_auth_file_models(auth_name, models);
    if (!status) {
        LOG_WARN("[Warmup] Cannot list models for " << auth_name << ": " << status.message());
        update_status(id, [&status](WarmupStatus &s) { s.last_error = status.message(); });
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    model_cache_[id] = std::make_pair(models, current);
    return true;
}

void WarmupScheduler::update_status(const std::string &id, const std::function<void(WarmupStatus &)> &mutate) {
    std::lock_guard<std::mutex> lock(mutex_);
    mutate(statuses_[id]);
}

std::map<std::string, WarmupStatus> WarmupScheduler::statuses() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return statuses_;
}

std::optional<WarmupStatus> WarmupScheduler::status(const std::string &account_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = statuses_.find(account_id);
    if (it == statuses_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<WarmupScheduler::Clock::time_point> WarmupScheduler::next_run(const std::string &account_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = next_runs_.find(account_id);
    if (it == next_runs_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool WarmupScheduler::is_cycle_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cycle_running_;
}

void WarmupScheduler::set_cycle_callback(CycleCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    cycle_callback_ = std::move(callback);
}

void WarmupScheduler::invalidate_model_cache() {
    std::lock_guard<std::mutex> lock(mutex_);
    model_cache_.clear();
}

}  // namespace warmup
}  // namespace proxyvisor
