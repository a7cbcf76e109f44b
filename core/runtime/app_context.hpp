#pragma once

#include <memory>
#include <string>

#include "notify/notifier.hpp"
#include "proxy/port_inspector.hpp"
#include "proxy/proxy_manager.hpp"
#include "proxy/release_source.hpp"
#include "quota/quota_alerts.hpp"
#include "quota/quota_pipeline.hpp"
#include "quota/quota_store.hpp"
#include "runtime/config.hpp"
#include "runtime/event_loop.hpp"
#include "runtime/worker_pool.hpp"
#include "settings/settings_store.hpp"
#include "warmup/warmup_scheduler.hpp"
#include "warmup/warmup_settings.hpp"

namespace proxyvisor {
namespace runtime {

/**
 * @brief Composition root: owns the threads and every long-lived component
 *
 * Construction does no I/O. init() resolves paths, creates directories,
 * loads settings, starts the EventLoop and WorkerPool and wires the proxy
 * manager, quota pipeline and warmup scheduler. shutdown() tears down in
 * reverse order and is safe to call more than once.
 */
class AppContext {
public:
    explicit AppContext(const AppConfig &config);
    ~AppContext();

    AppContext(const AppContext &) = delete;
    AppContext &operator=(const AppContext &) = delete;

    bool init(std::string &error);
    void shutdown();

    const AppConfig &config() const { return config_; }
    const std::string &data_dir() const { return data_dir_; }
    const std::string &auth_dir() const { return auth_dir_; }
    const std::string &settings_path() const { return settings_path_; }

    EventLoop &loop() { return *loop_; }
    WorkerPool &workers() { return *workers_; }
    settings::SettingsStore &settings() { return *settings_; }

    proxy::ProxyManager &proxy() { return *proxy_manager_; }
    quota::QuotaStore &quota_store() { return quota_store_; }
    quota::QuotaFetchPipeline &quota_pipeline() { return *quota_pipeline_; }
    warmup::WarmupSettings &warmup_settings() { return *warmup_settings_; }
    warmup::WarmupScheduler &warmup() { return *warmup_scheduler_; }

private:
    // Staged initialization helpers
    bool init_paths(std::string &error);
    bool init_threads(std::string &error);
    bool init_proxy(std::string &error);
    bool init_quota(std::string &error);
    bool init_warmup(std::string &error);

    AppConfig config_;
    std::string data_dir_;
    std::string auth_dir_;
    std::string settings_path_;
    bool initialized_ = false;

    std::unique_ptr<EventLoop> loop_;
    std::unique_ptr<WorkerPool> workers_;
    std::unique_ptr<settings::SettingsStore> settings_;

    std::unique_ptr<notify::INotifier> notifier_;
    std::unique_ptr<proxy::IReleaseSource> release_source_;
    std::unique_ptr<proxy::IPortInspector> port_inspector_;
    std::unique_ptr<proxy::ProxyManager> proxy_manager_;

    quota::QuotaStore quota_store_;
    std::unique_ptr<quota::AlertMonitor> alerts_;
    std::unique_ptr<quota::QuotaFetchPipeline> quota_pipeline_;

    std::unique_ptr<warmup::WarmupSettings> warmup_settings_;
    std::unique_ptr<warmup::WarmupScheduler> warmup_scheduler_;
};

}  // namespace runtime
}  // namespace proxyvisor
