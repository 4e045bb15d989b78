#pragma once

#include <chrono>

namespace coop
{
/// Every deadline and timer backend measures time on the monotonic clock.
using clock      = std::chrono::steady_clock;
using time_point = clock::time_point;
using duration   = clock::duration;
} // namespace coop
