#include "warmup_settings.hpp"

#include <algorithm>
#include <tuple>

namespace proxyvisor {
namespace warmup {

namespace {

constexpr const char *kEnabledAccounts = "warmupEnabledAccounts";
constexpr const char *kCadence = "warmupCadence";
constexpr const char *kCadenceByAccount = "warmupCadenceByAccount";
constexpr const char *kScheduleMode = "warmupScheduleMode";
constexpr const char *kScheduleModeByAccount = "warmupScheduleModeByAccount";
constexpr const char *kDailyMinutes = "warmupDailyMinutes";
constexpr const char *kDailyMinutesByAccount = "warmupDailyMinutesByAccount";
constexpr const char *kSelectedModels = "warmupSelectedModels";

int clamp_minutes(int minutes) { return std::min(std::max(minutes, 0), 1439); }

}  // namespace

WarmupSettings::WarmupSettings(settings::SettingsStore &store) : store_(store) {}

std::set<std::string> WarmupSettings::enabled_account_ids() const {
    auto ids = store_.get_as<std::vector<std::string>>(kEnabledAccounts, {});
    return std::set<std::string>(ids.begin(), ids.end());
}

bool WarmupSettings::is_enabled(const WarmupAccountKey &key) const {
    if (key.provider != quota::Provider::ANTIGRAVITY) {
        return false;
    }
    return enabled_account_ids().count(key.to_id()) > 0;
}

common::Status WarmupSettings::set_enabled(const WarmupAccountKey &key, bool enabled) {
    if (key.provider != quota::Provider::ANTIGRAVITY) {
        return common::Status::error(common::ErrorCode::INVALID_ARGUMENT,
                                     std::string("Warmup is not supported for ") +
                                         quota::provider_display_name(key.provider));
    }
    auto ids = enabled_account_ids();
    if (enabled) {
        ids.insert(key.to_id());
    } else {
        ids.erase(key.to_id());
    }
    // std::set keeps the stored list sorted
    return store_.set(kEnabledAccounts, std::vector<std::string>(ids.begin(), ids.end()));
}

std::vector<WarmupAccountKey> WarmupSettings::targets() const {
    std::vector<WarmupAccountKey> keys;
    for (const auto &id : enabled_account_ids()) {
        auto key = WarmupAccountKey::from_id(id);
        if (key && key->provider == quota::Provider::ANTIGRAVITY) {
            keys.push_back(*key);
        }
    }
    std::sort(keys.begin(), keys.end(), [](const WarmupAccountKey &a, const WarmupAccountKey &b) {
        return std::make_tuple(std::string(quota::provider_display_name(a.provider)), a.account_key) <
               std::make_tuple(std::string(quota::provider_display_name(b.provider)), b.account_key);
    });
    return keys;
}

WarmupCadence WarmupSettings::cadence(const WarmupAccountKey &key) const {
    if (auto cadence = cadence_from_string(per_account_string(kCadenceByAccount, key.to_id()))) {
        return *cadence;
    }
    return cadence_from_string(store_.get_as<std::string>(kCadence, "")).value_or(WarmupCadence::ONE_HOUR);
}

common::Status WarmupSettings::set_cadence(const WarmupAccountKey &key, WarmupCadence cadence) {
    return set_per_account(kCadenceByAccount, key.to_id(), cadence_to_string(cadence));
}

common::Status WarmupSettings::set_default_cadence(WarmupCadence cadence) {
    return store_.set(kCadence, cadence_to_string(cadence));
}

ScheduleMode WarmupSettings::schedule_mode(const WarmupAccountKey &key) const {
    if (auto mode = schedule_mode_from_string(per_account_string(kScheduleModeByAccount, key.to_id()))) {
        return *mode;
    }
    return schedule_mode_from_string(store_.get_as<std::string>(kScheduleMode, "")).value_or(ScheduleMode::INTERVAL);
}

common::Status WarmupSettings::set_schedule_mode(const WarmupAccountKey &key, ScheduleMode mode) {
    return set_per_account(kScheduleModeByAccount, key.to_id(), schedule_mode_to_string(mode));
}

int WarmupSettings::daily_minutes(const WarmupAccountKey &key) const {
    auto by_account = store_.get(kDailyMinutesByAccount, nlohmann::json::object());
    if (by_account.is_object()) {
        auto it = by_account.find(key.to_id());
        if (it != by_account.end() && it->is_number_integer()) {
            return clamp_minutes(it->get<int>());
        }
    }
    return clamp_minutes(store_.get_as<int>(kDailyMinutes, kDefaultDailyMinutes));
}

common::Status WarmupSettings::set_daily_minutes(const WarmupAccountKey &key, int minutes) {
    return set_per_account(kDailyMinutesByAccount, key.to_id(), clamp_minutes(minutes));
}

std::vector<std::string> WarmupSettings::selected_models(const WarmupAccountKey &key) const {
    if (key.provider != quota::Provider::ANTIGRAVITY) {
        return {};
    }
    auto by_account = store_.get(kSelectedModels, nlohmann::json::object());
    if (!by_account.is_object()) {
        return {};
    }
    auto it = by_account.find(key.to_id());
    if (it == by_account.end() || !it->is_array()) {
        return {};
    }
    std::vector<std::string> models;
    for (const auto &model : *it) {
        if (model.is_string()) {
            models.push_back(model.get<std::string>());
        }
    }
    return models;
}

common::Status WarmupSettings::set_selected_models(const WarmupAccountKey &key,
                                                   const std::vector<std::string> &models) {
    if (key.provider != quota::Provider::ANTIGRAVITY) {
        return common::Status::error(common::ErrorCode::INVALID_ARGUMENT, "Model selection requires Antigravity");
    }
    return set_per_account(kSelectedModels, key.to_id(), models);
}

std::string WarmupSettings::per_account_string(const char *by_account_key, const std::string &id) const {
    auto by_account = store_.get(by_account_key, nlohmann::json::object());
    if (!by_account.is_object()) {
        return "";
    }
    auto it = by_account.find(id);
    if (it == by_account.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

common::Status WarmupSettings::set_per_account(const char *by_account_key, const std::string &id,
                                               nlohmann::json value) {
    auto by_account = store_.get(by_account_key, nlohmann::json::object());
    if (!by_account.is_object()) {
        by_account = nlohmann::json::object();
    }
    by_account[id] = std::move(value);
    return store_.set(by_account_key, std::move(by_account));
}

}  // namespace warmup
}  // namespace proxyvisor
