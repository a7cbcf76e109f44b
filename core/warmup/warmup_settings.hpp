#pragma once

#include <set>
#include <string>
#include <vector>

#include "common/status.hpp"
#include "settings/settings_store.hpp"
#include "warmup/warmup_types.hpp"

namespace proxyvisor {
namespace warmup {

constexpr int kDefaultDailyMinutes = 540;  // 09:00

/**
 * @brief Typed view of the warmup preferences in the settings file
 *
 * Per-account values fall back to the global default, then to the built-in
 * default (1h, interval, 09:00). Only Antigravity accounts can be enabled.
 */
class WarmupSettings {
public:
    explicit WarmupSettings(settings::SettingsStore &store);

    std::set<std::string> enabled_account_ids() const;
    bool is_enabled(const WarmupAccountKey &key) const;
    common::Status set_enabled(const WarmupAccountKey &key, bool enabled);

    // Enabled Antigravity accounts, sorted by (provider display name, account key)
    std::vector<WarmupAccountKey> targets() const;

    WarmupCadence cadence(const WarmupAccountKey &key) const;
    common::Status set_cadence(const WarmupAccountKey &key, WarmupCadence cadence);
    common::Status set_default_cadence(WarmupCadence cadence);

    ScheduleMode schedule_mode(const WarmupAccountKey &key) const;
    common::Status set_schedule_mode(const WarmupAccountKey &key, ScheduleMode mode);

    // Minutes after local midnight, 0-1439
    int daily_minutes(const WarmupAccountKey &key) const;
    common::Status set_daily_minutes(const WarmupAccountKey &key, int minutes);

    std::vector<std::string> selected_models(const WarmupAccountKey &key) const;
    common::Status set_selected_models(const WarmupAccountKey &key, const std::vector<std::string> &models);

private:
    // Value of by_account_key[id] as a string, or empty
    std::string per_account_string(const char *by_account_key, const std::string &id) const;
    common::Status set_per_account(const char *by_account_key, const std::string &id, nlohmann::json value);

    settings::SettingsStore &store_;
};

}  // namespace warmup
}  // namespace proxyvisor
