#include "app_context.hpp"

#include <filesystem>

#include "common/file_util.hpp"
#include "logging/logger.hpp"
#include "notify/notify_send_notifier.hpp"
#include "quota/codex_fetcher.hpp"

namespace proxyvisor {
namespace runtime {

AppContext::AppContext(const AppConfig &config) : config_(config) {}

AppContext::~AppContext() { shutdown(); }

bool AppContext::init(std::string &error) {
    if (initialized_) {
        return true;
    }
    if (!init_paths(error)) return false;
    if (!init_threads(error)) return false;
    if (!init_proxy(error)) return false;
    if (!init_quota(error)) return false;
    if (!init_warmup(error)) return false;

    initialized_ = true;
    LOG_INFO("[Runtime] Initialized (data dir " << data_dir_ << ")");
    return true;
}

bool AppContext::init_paths(std::string &error) {
    data_dir_ = expand_home(config_.paths.data_dir);
    auth_dir_ = expand_home(config_.paths.auth_dir);
    settings_path_ = config_.paths.settings_file.empty()
                         ? (std::filesystem::path(data_dir_) / "settings.json").string()
                         : expand_home(config_.paths.settings_file);

    auto status = common::ensure_directory(data_dir_, 0700);
    if (!status) {
        error = status.message();
        return false;
    }

    settings_ = std::make_unique<settings::SettingsStore>(settings_path_);
    status = settings_->load();
    if (!status) {
        // A corrupt settings file is replaced on the next write
        LOG_WARN("[Runtime] " << status.message());
    }
    return true;
}

bool AppContext::init_threads(std::string & /*error*/) {
    loop_ = std::make_unique<EventLoop>("main-loop");
    workers_ = std::make_unique<WorkerPool>(static_cast<size_t>(config_.workers.threads), "workers");
    loop_->start();
    workers_->start();
    return true;
}

bool AppContext::init_proxy(std::string &error) {
    if (config_.quota.notifications_enabled) {
        notifier_ = std::make_unique<notify::NotifySendNotifier>();
    }
    release_source_ = std::make_unique<proxy::GithubReleaseSource>(config_.release.api_url, config_.release.repo,
                                                                   config_.release.timeout_ms);
    port_inspector_ = std::make_unique<proxy::SystemPortInspector>();

    proxy::ProxyManagerOptions options;
    options.data_dir = data_dir_;
    options.auth_dir = auth_dir_;
    options.binary_name = config_.release.binary_name;
    options.port = config_.proxy.port;
    options.asset_keyword = config_.release.asset_keyword;
    options.min_binary_size = config_.release.min_binary_size;
    options.supervisor.poll_interval_ms = config_.proxy.poll_interval_ms;
    options.supervisor.startup_timeout_ms = config_.proxy.startup_timeout_ms;
    options.supervisor.stop_timeout_ms = config_.proxy.stop_timeout_ms;
    options.supervisor.cancel_timeout_ms = config_.proxy.cancel_timeout_ms;
    options.supervisor.port_release_wait_ms = config_.proxy.port_release_wait_ms;
    options.supervisor.output_tail_lines = static_cast<size_t>(config_.proxy.output_tail_lines);

    proxy_manager_ =
        std::make_unique<proxy::ProxyManager>(options, *release_source_, *port_inspector_, notifier_.get());

    auto status = proxy_manager_->prepare();
    if (!status) {
        error = status.message();
        return false;
    }
    // An explicit port in the app config wins over the one in the proxy config
    if (proxy_manager_->status().port != config_.proxy.port) {
        status = proxy_manager_->set_port(config_.proxy.port);
        if (!status) {
            error = status.message();
            return false;
        }
    }
    return true;
}

bool AppContext::init_quota(std::string & /*error*/) {
    quota::AlertSettings alert_settings;
    alert_settings.threshold = config_.quota.alert_threshold;
    alert_settings.notify_on_low = config_.quota.notify_on_low;
    alert_settings.notifications_enabled = config_.quota.notifications_enabled;
    alerts_ = std::make_unique<quota::AlertMonitor>(notifier_.get(), alert_settings);

    quota_pipeline_ = std::make_unique<quota::QuotaFetchPipeline>(*loop_, *workers_, quota_store_, alerts_.get());
    quota_pipeline_->set_api_provider([this]() -> std::shared_ptr<proxy::IManagementApi> {
        if (!proxy_manager_->status().running) {
            return nullptr;
        }
        return proxy_manager_->management_api();
    });
    quota_pipeline_->register_fetcher(std::make_shared<quota::CodexQuotaFetcher>(auth_dir_));
    return true;
}

bool AppContext::init_warmup(std::string & /*error*/) {
    warmup_settings_ = std::make_unique<warmup::WarmupSettings>(*settings_);
    warmup_scheduler_ = std::make_unique<warmup::WarmupScheduler>(
        *loop_, *workers_, *warmup_settings_, [this] { return proxy_manager_->status().running; },
        [this] { return proxy_manager_->management_api(); });
    return true;
}

void AppContext::shutdown() {
    if (warmup_scheduler_) {
        warmup_scheduler_->stop();
    }
    if (workers_) {
        workers_->stop();
    }
    if (loop_) {
        loop_->stop();
    }
    if (initialized_) {
        LOG_DEBUG("[Runtime] Shutdown complete");
    }
    initialized_ = false;
}

}  // namespace runtime
}  // namespace proxyvisor
