#include "sleeptime.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>

#include "stringhelpers.hpp"
#include "sysx_cctype.hpp"
#include "sysx_log.hpp"
#include "sysx_string.hpp"
#include "timedef.hpp"
#include "toupperlower-string.hpp"

namespace sysx {

namespace {
using UnitMultiplier = std::pair<std::string_view, double>;

constexpr UnitMultiplier kSleepUnits[] = {
    {"ns", 1e-9}, {"ms", 1e-3}, {"s", 1.0}, {"", 1.0}, {"m", 60.0}, {"h", 3600.0},
};

constexpr int64_t kNanosecondsPerSecond = 1000000000;
}  // namespace

nanoseconds SleepTime::toDuration() const {
  const double secondsAbs = std::abs(_seconds);
  double intPart;
  const double fracPart = std::modf(secondsAbs, &intPart);

  auto secs = static_cast<int64_t>(intPart);
  auto nanos = static_cast<int64_t>(std::round(fracPart * static_cast<double>(kNanosecondsPerSecond)));

  // floating point inaccuracies near the second boundary
  if (nanos >= kNanosecondsPerSecond) {
    ++secs;
    nanos = 0;
  }

  return std::chrono::seconds(secs) + nanoseconds(nanos);
}

SleepTime ParseSleepTime(std::string_view str) {
  const string lowerStr = ToLower(TrimSpaces(str));
  const std::string_view sleepTimeStr(lowerStr);

  const auto unitPos = std::ranges::find_if(sleepTimeStr, [](char ch) { return !isdigit(ch) && ch != '.'; });

  const std::string_view amountStr(sleepTimeStr.begin(), unitPos);
  const std::string_view unitStr(unitPos, sleepTimeStr.end());

  // A minus sign cannot be part of the amount as it is not a digit, so it is seen as the start of the unit
  if (unitStr.starts_with('-')) {
    throw sleep_error(SleepErrc::kNegativeTime, "Negative sleep time '{}'", str);
  }

  double amount{};
  const auto [ptr, errc] = std::from_chars(amountStr.data(), amountStr.data() + amountStr.size(), amount);
  if (amountStr.empty() || errc != std::errc() || ptr != amountStr.data() + amountStr.size()) {
    throw sleep_error(SleepErrc::kInvalidFormat, "Invalid time format '{}'", str);
  }

  const auto it = std::ranges::find_if(kSleepUnits, [unitStr](const auto &unit) { return unit.first == unitStr; });
  if (it == std::end(kSleepUnits)) {
    throw sleep_error(SleepErrc::kInvalidFormat, "Invalid time unit '{}', expected ns, ms, s, m or h", unitStr);
  }

  return SleepTime(amount * it->second);
}

void Sleep(SleepTime sleepTime) {
  const auto dur = sleepTime.toDuration();
  log::trace("Sleeping for {} ns", dur.count());
  std::this_thread::sleep_for(dur);
}

void SafeSleep(SleepTime sleepTime) {
  if (sleepTime.isNegative()) {
    throw sleep_error(SleepErrc::kNegativeTime, "Negative sleep time {} s", sleepTime.seconds());
  }
  Sleep(sleepTime);
}

}  // namespace sysx
