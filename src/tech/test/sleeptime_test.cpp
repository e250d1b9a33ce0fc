#include "sleeptime.hpp"

#include <gtest/gtest.h>

#include <chrono>

#include "timedef.hpp"

namespace sysx {

namespace {
SleepErrc ParseErrc(std::string_view str) {
  try {
    ParseSleepTime(str);
  } catch (const sleep_error &e) {
    return e.errc();
  }
  ADD_FAILURE() << "Expected a sleep_error for '" << str << "'";
  return SleepErrc::kInvalidFormat;
}
}  // namespace

TEST(SleepTime, FromMilliseconds) { EXPECT_DOUBLE_EQ(SleepTime(uint64_t{1500}).seconds(), 1.5); }

TEST(SleepTime, FromSeconds) { EXPECT_DOUBLE_EQ(SleepTime(2.25).seconds(), 2.25); }

TEST(SleepTime, FromDuration) {
  EXPECT_DOUBLE_EQ(SleepTime(std::chrono::milliseconds(250)).seconds(), 0.25);
  EXPECT_DOUBLE_EQ(SleepTime(std::chrono::minutes(2)).seconds(), 120.0);
}

TEST(SleepTime, ToDuration) {
  EXPECT_EQ(SleepTime(1.5).toDuration(), std::chrono::milliseconds(1500));
  EXPECT_EQ(SleepTime(uint64_t{0}).toDuration(), nanoseconds(0));
  EXPECT_EQ(SleepTime(1e-9).toDuration(), nanoseconds(1));
  EXPECT_EQ(SleepTime(0.9999999999).toDuration(), std::chrono::seconds(1));
  EXPECT_EQ(SleepTime(-2.0).toDuration(), std::chrono::seconds(2));
}

TEST(ParseSleepTime, DefaultUnitIsSeconds) {
  EXPECT_DOUBLE_EQ(ParseSleepTime("3").seconds(), 3.0);
  EXPECT_DOUBLE_EQ(ParseSleepTime("0.5").seconds(), 0.5);
}

TEST(ParseSleepTime, Units) {
  EXPECT_EQ(ParseSleepTime("100ms").toDuration(), std::chrono::milliseconds(100));
  EXPECT_EQ(ParseSleepTime("2s").toDuration(), std::chrono::seconds(2));
  EXPECT_EQ(ParseSleepTime("1.5m").toDuration(), std::chrono::seconds(90));
  EXPECT_EQ(ParseSleepTime("2h").toDuration(), std::chrono::hours(2));
  EXPECT_EQ(ParseSleepTime("750ns").toDuration(), nanoseconds(750));
}

TEST(ParseSleepTime, CaseAndSpacesAreIgnored) {
  EXPECT_EQ(ParseSleepTime("  250MS ").toDuration(), std::chrono::milliseconds(250));
  EXPECT_EQ(ParseSleepTime("\t1H\n").toDuration(), std::chrono::hours(1));
}

TEST(ParseSleepTime, InvalidFormat) {
  EXPECT_EQ(ParseErrc(""), SleepErrc::kInvalidFormat);
  EXPECT_EQ(ParseErrc("ms"), SleepErrc::kInvalidFormat);
  EXPECT_EQ(ParseErrc("10 ms"), SleepErrc::kInvalidFormat);
  EXPECT_EQ(ParseErrc("10min"), SleepErrc::kInvalidFormat);
  EXPECT_EQ(ParseErrc("1.2.3s"), SleepErrc::kInvalidFormat);
  EXPECT_EQ(ParseErrc("abc"), SleepErrc::kInvalidFormat);
}

TEST(ParseSleepTime, NegativeTime) {
  EXPECT_EQ(ParseErrc("-5s"), SleepErrc::kNegativeTime);
  EXPECT_EQ(ParseErrc("-0.1"), SleepErrc::kNegativeTime);
}

TEST(Sleep, SleepsAtLeastGivenTime) {
  const auto start = std::chrono::steady_clock::now();
  Sleep(ParseSleepTime("20ms"));
  EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(20));
}

TEST(SafeSleep, NegativeTimeThrows) { EXPECT_THROW(SafeSleep(SleepTime(-1.0)), sleep_error); }

TEST(SafeSleep, ZeroTime) { EXPECT_NO_THROW(SafeSleep(SleepTime(0.0))); }

}  // namespace sysx
