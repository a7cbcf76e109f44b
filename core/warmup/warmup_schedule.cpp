#include "warmup_schedule.hpp"

#include <ctime>

namespace proxyvisor {
namespace warmup {

TimePoint next_daily_run(int minutes_of_day, TimePoint now) {
    const std::time_t now_t = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&now_t, &local);

    local.tm_hour = minutes_of_day / 60;
    local.tm_min = minutes_of_day % 60;
    local.tm_sec = 0;
    local.tm_isdst = -1;

    TimePoint candidate = std::chrono::system_clock::from_time_t(std::mktime(&local));
    if (candidate > now) {
        return candidate;
    }

    // mktime normalises day 32 etc. and re-resolves DST for tomorrow
    local.tm_mday += 1;
    local.tm_hour = minutes_of_day / 60;
    local.tm_min = minutes_of_day % 60;
    local.tm_sec = 0;
    local.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&local));
}

TimePoint next_interval_run(WarmupCadence cadence, TimePoint now) { return now + cadence_interval(cadence); }

}  // namespace warmup
}  // namespace proxyvisor
