#pragma once

#include <cstdint>
#include <functional>

namespace ss {

// Millisecond clock used for TTLs, cooldowns and lock ages.
// Components accept a ClockFn so tests can drive time explicitly.
using ClockFn = std::function<int64_t()>;

// Wall-clock milliseconds since the Unix epoch. Persisted timestamps use
// this clock so they stay meaningful across restarts.
int64_t systemClockMs();

// Returns the given clock, or systemClockMs when it is empty.
ClockFn clockOrDefault(ClockFn clock);

} // namespace ss
