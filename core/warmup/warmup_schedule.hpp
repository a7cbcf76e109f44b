#pragma once

#include <chrono>

#include "warmup/warmup_types.hpp"

namespace proxyvisor {
namespace warmup {

using TimePoint = std::chrono::system_clock::time_point;

// Today at minutes_of_day (local time) if that is still ahead of now, else tomorrow
TimePoint next_daily_run(int minutes_of_day, TimePoint now);

TimePoint next_interval_run(WarmupCadence cadence, TimePoint now);

}  // namespace warmup
}  // namespace proxyvisor
