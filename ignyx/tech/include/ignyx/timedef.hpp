#pragma once

#include <chrono>

namespace ignyx {

using SysClock = std::chrono::system_clock;
using SysTimePoint = SysClock::time_point;
using SysDuration = SysClock::duration;

// Deadlines and timeouts are always expressed on the monotonic clock.
using SteadyClock = std::chrono::steady_clock;
using SteadyTimePoint = SteadyClock::time_point;
using SteadyDuration = SteadyClock::duration;

}  // namespace ignyx
