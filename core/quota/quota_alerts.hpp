#pragma once

#include <mutex>
#include <set>
#include <string>

#include "notify/notifier.hpp"
#include "quota/quota_types.hpp"

namespace proxyvisor {
namespace quota {

struct AlertSettings {
    double threshold = 20.0;  // Alert when remaining percentage <= threshold
    bool notify_on_low = true;
    bool notifications_enabled = true;
};

/**
 * @brief Low-quota alerts with per-(provider, account) deduplication
 *
 * An alert id is remembered only once the notifier accepted it, so a failed
 * delivery is retried on the next refresh. Unknown percentages never alert.
 */
class AlertMonitor {
public:
    AlertMonitor(notify::INotifier *notifier, AlertSettings settings);

    // Returns the number of notifications delivered
    int check(Provider provider, const AccountQuotaMap &accounts);

    void clear_alert(Provider provider, const std::string &account);
    void clear_all_alerts();

    void set_settings(const AlertSettings &settings);
    AlertSettings settings() const;

    static std::string alert_id(Provider provider, const std::string &account);

private:
    notify::INotifier *notifier_;

    mutable std::mutex mutex_;
    AlertSettings settings_;
    std::set<std::string> sent_;
};

}  // namespace quota
}  // namespace proxyvisor
