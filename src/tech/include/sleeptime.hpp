#pragma once

#include <chrono>
#include <cstdint>
#include <string_view>
#include <utility>

#include "sysx_exception.hpp"
#include "timedef.hpp"

namespace sysx {

enum class SleepErrc : int8_t { kInvalidFormat, kNegativeTime };

class sleep_error : public exception {
 public:
  template <typename... Args>
  sleep_error(SleepErrc errc, format_string<Args...> fmt, Args &&...args)
      : exception(fmt, std::forward<Args>(args)...), _errc(errc) {}

  SleepErrc errc() const noexcept { return _errc; }

 private:
  SleepErrc _errc;
};

/// Amount of time to sleep, stored in seconds.
class SleepTime {
 public:
  constexpr SleepTime() noexcept = default;

  /// Amount of time given in milliseconds.
  constexpr explicit SleepTime(uint64_t ms) noexcept : _seconds(static_cast<double>(ms) / 1000.0) {}

  /// Amount of time given in seconds.
  constexpr explicit SleepTime(double seconds) noexcept : _seconds(seconds) {}

  template <class Rep, class Period>
  constexpr SleepTime(std::chrono::duration<Rep, Period> dur) noexcept
      : _seconds(std::chrono::duration_cast<std::chrono::duration<double>>(dur).count()) {}

  constexpr double seconds() const noexcept { return _seconds; }

  constexpr bool isNegative() const noexcept { return _seconds < 0; }

  /// Converts to a duration, rounding the sub-second part to the nearest nanosecond.
  /// The sign is ignored, as a sleep time cannot be negative.
  nanoseconds toDuration() const;

  constexpr auto operator<=>(const SleepTime &) const noexcept = default;

 private:
  double _seconds{};
};

/// Parse given string representation of a sleep time.
/// It is made of an amount, possibly decimal, optionally followed by a unit among 'ns', 'ms', 's', 'm' and 'h'.
/// Seconds is the default unit. Surrounding spaces are ignored, and units are case insensitive.
/// Examples: "100ms", "2s", "1.5m", "3"
/// Throws sleep_error in case of invalid input.
SleepTime ParseSleepTime(std::string_view str);

/// Suspends the current thread for the given time.
void Sleep(SleepTime sleepTime);

/// Same as Sleep, but throws a sleep_error instead of sleeping if the given time is negative.
void SafeSleep(SleepTime sleepTime);

}  // namespace sysx
