#include "quota_pipeline.hpp"

#include <algorithm>

#include "logging/logger.hpp"
#include "runtime/event_loop.hpp"
#include "runtime/worker_pool.hpp"

namespace proxyvisor {
namespace quota {

QuotaFetchPipeline::QuotaFetchPipeline(runtime::EventLoop &loop, runtime::WorkerPool &pool, QuotaStore &store,
                                       AlertMonitor *alerts)
    : loop_(loop), pool_(pool), store_(store), alerts_(alerts) {}

void QuotaFetchPipeline::register_fetcher(std::shared_ptr<IQuotaFetcher> fetcher) {
    if (!fetcher) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    const Provider provider = fetcher->provider();
    fetchers_.erase(std::remove_if(fetchers_.begin(), fetchers_.end(),
                                   [provider](const std::shared_ptr<IQuotaFetcher> &existing) {
                                       return existing->provider() == provider;
                                   }),
                    fetchers_.end());
    fetchers_.push_back(std::move(fetcher));
}

void QuotaFetchPipeline::set_api_provider(ApiProvider api_provider) {
    std::lock_guard<std::mutex> lock(mutex_);
    api_provider_ = std::move(api_provider);
}

void QuotaFetchPipeline::set_update_callback(UpdateCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    update_callback_ = std::move(callback);
}

std::vector<Provider> QuotaFetchPipeline::registered_providers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Provider> providers;
    for (const auto &fetcher : fetchers_) {
        providers.push_back(fetcher->provider());
    }
    return providers;
}

bool QuotaFetchPipeline::refresh_all(Completion on_complete) {
    bool expected = false;
    if (!refreshing_.compare_exchange_strong(expected, true)) {
        LOG_DEBUG("[Pipeline] Refresh already in flight, ignoring");
        return false;
    }

    std::vector<std::shared_ptr<IQuotaFetcher>> selected;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto &fetcher : fetchers_) {
            if (!is_privacy_gated(fetcher->provider())) {
                selected.push_back(fetcher);
            }
        }
    }

    LOG_INFO("[Pipeline] Refreshing " << selected.size() << " provider(s)");
    auto batch = std::make_shared<Batch>();
    batch->on_complete = std::move(on_complete);
    batch->owns_refresh_flag = true;
    run_batch(selected, batch);
    return true;
}

bool QuotaFetchPipeline::refresh_provider(Provider provider, Completion on_complete) {
    std::vector<std::shared_ptr<IQuotaFetcher>> selected;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto &fetcher : fetchers_) {
            if (fetcher->provider() == provider) {
                selected.push_back(fetcher);
            }
        }
    }
    if (selected.empty()) {
        LOG_WARN("[Pipeline] No fetcher registered for " << provider_to_string(provider));
        return false;
    }

    auto batch = std::make_shared<Batch>();
    batch->on_complete = std::move(on_complete);
    run_batch(selected, batch);
    return true;
}

bool QuotaFetchPipeline::scan_ide_providers(Completion on_complete) {
    std::vector<std::shared_ptr<IQuotaFetcher>> selected;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto &fetcher : fetchers_) {
            if (is_privacy_gated(fetcher->provider())) {
                selected.push_back(fetcher);
            }
        }
    }
    if (selected.empty()) {
        return false;
    }

    LOG_INFO("[Pipeline] Scanning " << selected.size() << " IDE provider(s)");
    auto batch = std::make_shared<Batch>();
    batch->on_complete = std::move(on_complete);
    run_batch(selected, batch);
    return true;
}

void QuotaFetchPipeline::run_batch(const std::vector<std::shared_ptr<IQuotaFetcher>> &fetchers,
                                   std::shared_ptr<Batch> batch) {
    batch->remaining = fetchers.size();
    if (fetchers.empty()) {
        loop_.post([this, batch] {
            if (batch->owns_refresh_flag) {
                refreshing_.store(false);
            }
            if (batch->on_complete) batch->on_complete();
        });
        return;
    }

    std::shared_ptr<proxy::IManagementApi> api;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (api_provider_) {
            api = api_provider_();
        }
    }

    for (const auto &fetcher : fetchers) {
        const Provider provider = fetcher->provider();
        bool submitted = pool_.submit([this, fetcher, api, batch, provider] {
            AccountQuotaMap accounts;
            try {
                accounts = fetcher->fetch_all_quotas(api.get());
            } catch (const std::exception &e) {
                LOG_WARN("[Pipeline] " << provider_to_string(provider) << " fetch failed: " << e.what());
            } catch (...) {
                LOG_WARN("[Pipeline] " << provider_to_string(provider) << " fetch failed: unknown exception");
            }
            loop_.post([this, provider, accounts, batch] {
                apply_result(provider, accounts);
                finish_one(batch);
            });
        });
        if (!submitted) {
            LOG_ERROR("[Pipeline] Worker pool not running, skipping " << provider_to_string(provider));
            loop_.post([this, batch] { finish_one(batch); });
        }
    }
}

void QuotaFetchPipeline::apply_result(Provider provider, AccountQuotaMap accounts) {
    UpdateCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = update_callback_;
    }

    if (accounts.empty()) {
        if (store_.remove(provider)) {
            LOG_INFO("[Pipeline] " << provider_to_string(provider) << " returned no accounts, removed");
        }
        if (callback) callback(provider, nullptr);
        return;
    }

    LOG_DEBUG("[Pipeline] " << provider_to_string(provider) << ": " << accounts.size() << " account(s)");
    store_.replace(provider, std::move(accounts));
    auto snapshot = store_.snapshot(provider);
    if (alerts_ != nullptr) {
        alerts_->check(provider, *snapshot);
    }
    if (callback) callback(provider, snapshot);
}

void QuotaFetchPipeline::finish_one(const std::shared_ptr<Batch> &batch) {
    if (batch->remaining > 0) {
        --batch->remaining;
    }
    if (batch->remaining > 0) {
        return;
    }
    if (batch->owns_refresh_flag) {
        refreshing_.store(false);
        LOG_INFO("[Pipeline] Refresh complete");
    }
    if (batch->on_complete) batch->on_complete();
}

}  // namespace quota
}  // namespace proxyvisor
