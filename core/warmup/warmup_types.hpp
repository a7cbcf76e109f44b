#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>

#include "quota/quota_types.hpp"

namespace proxyvisor {
namespace warmup {

/**
 * @brief (provider, account) identity used as the settings key
 *
 * Encoded as "<provider>::<account>". Decoding splits on the first "::", so
 * an account key containing "::" does not round-trip.
 */
struct WarmupAccountKey {
    quota::Provider provider = quota::Provider::ANTIGRAVITY;
    std::string account_key;

    std::string to_id() const;
    static std::optional<WarmupAccountKey> from_id(const std::string &id);

    bool operator==(const WarmupAccountKey &other) const {
        return provider == other.provider && account_key == other.account_key;
    }
    bool operator!=(const WarmupAccountKey &other) const { return !(*this == other); }
};

enum class WarmupCadence { FIFTEEN_MINUTES, THIRTY_MINUTES, ONE_HOUR, TWO_HOURS, THREE_HOURS, FOUR_HOURS };

const char *cadence_to_string(WarmupCadence cadence);
std::optional<WarmupCadence> cadence_from_string(const std::string &value);
std::chrono::seconds cadence_interval(WarmupCadence cadence);

enum class ScheduleMode { INTERVAL, DAILY };

const char *schedule_mode_to_string(ScheduleMode mode);
std::optional<ScheduleMode> schedule_mode_from_string(const std::string &value);

// pending -> running -> succeeded | failed
enum class ModelState { PENDING, RUNNING, SUCCEEDED, FAILED };

const char *model_state_to_string(ModelState state);

struct WarmupStatus {
    bool is_running = false;
    std::optional<std::chrono::system_clock::time_point> last_run;
    std::optional<std::chrono::system_clock::time_point> next_run;
    int progress_total = 0;
    int progress_completed = 0;
    std::string current_model;
    std::map<std::string, ModelState> model_states;
    std::string last_error;
};

// Lowercased; "user.domain.tld" (3+ segments, no '@') becomes "user@domain.tld".
// Best effort: cannot tell multi-level domains or dotted user names apart.
std::string normalize_account_key(const std::string &key);

}  // namespace warmup
}  // namespace proxyvisor
