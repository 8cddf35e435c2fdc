#pragma once

#include <chrono>

namespace decoy {

using SteadyClock = std::chrono::steady_clock;
using SteadyTimePoint = SteadyClock::time_point;
using Duration = std::chrono::milliseconds;

}  // namespace decoy
