#include "quota_alerts.hpp"

#include <iomanip>
#include <sstream>

#include "logging/logger.hpp"

namespace proxyvisor {
namespace quota {

AlertMonitor::AlertMonitor(notify::INotifier *notifier, AlertSettings settings)
    : notifier_(notifier), settings_(settings) {}

std::string AlertMonitor::alert_id(Provider provider, const std::string &account) {
    return std::string("quota_low_") + provider_to_string(provider) + "_" + account;
}

int AlertMonitor::check(Provider provider, const AccountQuotaMap &accounts) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (notifier_ == nullptr || !settings_.notifications_enabled || !settings_.notify_on_low) {
        return 0;
    }

    int delivered = 0;
    for (const auto &entry : accounts) {
        const std::string account = entry.second.account_label(entry.first);
        const std::string id = alert_id(provider, account);
        if (sent_.count(id) > 0) {
            continue;
        }

        for (const auto &model : entry.second.models) {
            if (!model.is_known() || model.percentage > settings_.threshold) {
                continue;
            }

            std::ostringstream body;
            body << account << " has " << std::fixed << std::setprecision(1) << model.percentage
                 << "% quota remaining";
            notify::Notification notification{id, std::string("Low Quota: ") + provider_display_name(provider),
                                              body.str()};
            if (notifier_->notify(notification)) {
                sent_.insert(id);
                ++delivered;
                LOG_INFO("[Alerts] Low quota for " << account << " (" << provider_to_string(provider) << ", "
                                                   << model.name << ")");
            }
            break;
        }
    }
    return delivered;
}

void AlertMonitor::clear_alert(Provider provider, const std::string &account) {
    std::lock_guard<std::mutex> lock(mutex_);
    sent_.erase(alert_id(provider, account));
}

void AlertMonitor::clear_all_alerts() {
    std::lock_guard<std::mutex> lock(mutex_);
    sent_.clear();
}

void AlertMonitor::set_settings(const AlertSettings &settings) {
    std::lock_guard<std::mutex> lock(mutex_);
    settings_ = settings;
}

AlertSettings AlertMonitor::settings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return settings_;
}

}  // namespace quota
}  // namespace proxyvisor
