#pragma once

#include <chrono>
#include <functional>

namespace trellis {

/// system_clock is the only clock with a defined relation to the Unix epoch, it is used for every wall clock value
/// (dates, expiration, session access). Elapsed time measurements use steady_clock.
using SysClock = std::chrono::system_clock;
using SysTimePoint = SysClock::time_point;
using SysDuration = SysClock::duration;

using SteadyClock = std::chrono::steady_clock;

/// Injectable source of the current wall clock time.
using PresentFunction = std::function<SysTimePoint()>;

}  // namespace trellis
