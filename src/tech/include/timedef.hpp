#pragma once

#include <chrono>
#include <cstdint>

namespace sysx {

/// Alias some types to make it easier to use
/// The main clock is system_clock as it is the only one guaranteed to provide conversions to Unix epoch time.
/// It is not monotonic - thus for measurements of elapsed time we will prefer usage of steady_clock
using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Duration = Clock::duration;

using nanoseconds = std::chrono::nanoseconds;
using seconds = std::chrono::seconds;
using milliseconds = std::chrono::milliseconds;
using microseconds = std::chrono::microseconds;

constexpr int64_t TimestampToMillisecondsSinceEpoch(TimePoint tp) {
  return std::chrono::duration_cast<milliseconds>(tp.time_since_epoch()).count();
}

}  // namespace sysx
