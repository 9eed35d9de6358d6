#pragma once

#include <chrono>

namespace tern {

// Wall clock, for the Date header.
using SysClock = std::chrono::system_clock;
using SysTimePoint = SysClock::time_point;
using SysDuration = SysClock::duration;

// Monotonic clock, for all connection timeouts.
using SteadyClock = std::chrono::steady_clock;
using SteadyTimePoint = SteadyClock::time_point;

}  // namespace tern
