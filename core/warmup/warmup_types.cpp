#include "warmup_types.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

namespace proxyvisor {
namespace warmup {

namespace {

constexpr const char *kIdDelimiter = "::";

}  // namespace

std::string WarmupAccountKey::to_id() const {
    return std::string(quota::provider_to_string(provider)) + kIdDelimiter + account_key;
}

std::optional<WarmupAccountKey> WarmupAccountKey::from_id(const std::string &id) {
    const size_t pos = id.find(kIdDelimiter);
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    auto provider = quota::provider_from_string(id.substr(0, pos));
    if (!provider) {
        return std::nullopt;
    }
    return WarmupAccountKey{*provider, id.substr(pos + 2)};
}

const char *cadence_to_string(WarmupCadence cadence) {
    switch (cadence) {
        case WarmupCadence::FIFTEEN_MINUTES:
            return "15min";
        case WarmupCadence::THIRTY_MINUTES:
            return "30min";
        case WarmupCadence::ONE_HOUR:
            return "1h";
        case WarmupCadence::TWO_HOURS:
            return "2h";
        case WarmupCadence::THREE_HOURS:
            return "3h";
        case WarmupCadence::FOUR_HOURS:
            return "4h";
    }
    return "1h";
}

std::optional<WarmupCadence> cadence_from_string(const std::string &value) {
    for (auto cadence : {WarmupCadence::FIFTEEN_MINUTES, WarmupCadence::THIRTY_MINUTES, WarmupCadence::ONE_HOUR,
                         WarmupCadence::TWO_HOURS, WarmupCadence::THREE_HOURS, WarmupCadence::FOUR_HOURS}) {
        if (value == cadence_to_string(cadence)) {
            return cadence;
        }
    }
    return std::nullopt;
}

std::chrono::seconds cadence_interval(WarmupCadence cadence) {
    switch (cadence) {
        case WarmupCadence::FIFTEEN_MINUTES:
            return std::chrono::minutes(15);
        case WarmupCadence::THIRTY_MINUTES:
            return std::chrono::minutes(30);
        case WarmupCadence::ONE_HOUR:
            return std::chrono::hours(1);
        case WarmupCadence::TWO_HOURS:
            return std::chrono::hours(2);
        case WarmupCadence::THREE_HOURS:
            return std::chrono::hours(3);
        case WarmupCadence::FOUR_HOURS:
            return std::chrono::hours(4);
    }
    return std::chrono::hours(1);
}

const char *schedule_mode_to_string(ScheduleMode mode) { return mode == ScheduleMode::DAILY ? "daily" : "interval"; }

std::optional<ScheduleMode> schedule_mode_from_string(const std::string &value) {
    if (value == "interval") return ScheduleMode::INTERVAL;
    if (value == "daily") return ScheduleMode::DAILY;
    return std::nullopt;
}

const char *model_state_to_string(ModelState state) {
    switch (state) {
        case ModelState::PENDING:
            return "pending";
        case ModelState::RUNNING:
            return "running";
        case ModelState::SUCCEEDED:
            return "succeeded";
        case ModelState::FAILED:
            return "failed";
    }
    return "pending";
}

std::string normalize_account_key(const std::string &key) {
    std::string lowered = key;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered.empty() || lowered.find('@') != std::string::npos) {
        return lowered;
    }

    std::vector<size_t> dots;
    for (size_t i = 0; i < lowered.size(); ++i) {
        if (lowered[i] == '.') dots.push_back(i);
    }
    if (dots.size() < 2) {
        return lowered;
    }
    // Last two segments are taken as the domain
    const size_t at = dots[dots.size() - 2];
    lowered[at] = '@';
    return lowered;
}

}  // namespace warmup
}  // namespace proxyvisor
