#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

#include "proxy/management_api.hpp"
#include "quota/quota_alerts.hpp"
#include "quota/quota_fetcher.hpp"
#include "quota/quota_store.hpp"

namespace proxyvisor {
namespace runtime {
class EventLoop;
class WorkerPool;
}  // namespace runtime

namespace quota {

/**
 * @brief Fan-out/fan-in quota refresh across registered fetchers
 *
 * Fetchers run concurrently on the WorkerPool. Each result is posted back to
 * the EventLoop, where it replaces (or removes) that provider's entry in the
 * QuotaStore, runs the low-quota check and fires the update callback. One
 * provider's failure never affects another.
 *
 * Cursor and Trae are skipped by refresh_all(); they only run through
 * scan_ide_providers() or refresh_provider().
 *
 * The loop and pool must be stopped before the pipeline is destroyed.
 */
class QuotaFetchPipeline {
public:
    // Null snapshot: provider removed (no connected accounts)
    using UpdateCallback = std::function<void(Provider, QuotaStore::Snapshot)>;
    using Completion = std::function<void()>;
    using ApiProvider = std::function<std::shared_ptr<proxy::IManagementApi>()>;

    QuotaFetchPipeline(runtime::EventLoop &loop, runtime::WorkerPool &pool, QuotaStore &store,
                       AlertMonitor *alerts = nullptr);

    QuotaFetchPipeline(const QuotaFetchPipeline &) = delete;
    QuotaFetchPipeline &operator=(const QuotaFetchPipeline &) = delete;

    // Replaces any fetcher already registered for the same provider
    void register_fetcher(std::shared_ptr<IQuotaFetcher> fetcher);

    void set_api_provider(ApiProvider api_provider);
    void set_update_callback(UpdateCallback callback);

    // Returns false without doing anything if a refresh_all() is in flight.
    // on_complete runs on the loop thread after every provider has been applied.
    bool refresh_all(Completion on_complete = nullptr);

    // Returns false if no fetcher is registered for the provider
    bool refresh_provider(Provider provider, Completion on_complete = nullptr);

    // Explicit user scan of the privacy-gated providers. Returns false if none is registered.
    bool scan_ide_providers(Completion on_complete = nullptr);

    bool is_refreshing() const { return refreshing_.load(); }

    std::vector<Provider> registered_providers() const;

private:
    struct Batch {
        size_t remaining = 0;
        Completion on_complete;
        bool owns_refresh_flag = false;
    };

    void run_batch(const std::vector<std::shared_ptr<IQuotaFetcher>> &fetchers, std::shared_ptr<Batch> batch);
    void apply_result(Provider provider, AccountQuotaMap accounts);
    void finish_one(const std::shared_ptr<Batch> &batch);

    runtime::EventLoop &loop_;
    runtime::WorkerPool &pool_;
    QuotaStore &store_;
    AlertMonitor *alerts_;

    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<IQuotaFetcher>> fetchers_;
    ApiProvider api_provider_;
    UpdateCallback update_callback_;

    std::atomic<bool> refreshing_{false};
};

}  // namespace quota
}  // namespace proxyvisor
