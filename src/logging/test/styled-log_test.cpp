#include "styled-log.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <regex>
#include <string_view>

#include "sysx_log.hpp"
#include "sysx_string.hpp"

namespace sysx {

TEST(StyledLog, LevelNames) {
  EXPECT_EQ(StyledLevelName(StyledLevel::info), "INFO");
  EXPECT_EQ(StyledLevelName(StyledLevel::success), "SUCCESS");
  EXPECT_EQ(StyledLevelName(StyledLevel::bug), "BUG");
  EXPECT_EQ(StyledLevelName(StyledLevel::trace), "TRACE");
}

TEST(StyledLog, LevelColors) {
  EXPECT_EQ(StyledLevelColor(StyledLevel::info), fmt::terminal_color::blue);
  EXPECT_EQ(StyledLevelColor(StyledLevel::success), fmt::terminal_color::green);
  EXPECT_EQ(StyledLevelColor(StyledLevel::warning), fmt::terminal_color::yellow);
  EXPECT_EQ(StyledLevelColor(StyledLevel::error), fmt::terminal_color::red);
  EXPECT_EQ(StyledLevelColor(StyledLevel::fatal), fmt::terminal_color::bright_red);
  EXPECT_EQ(StyledLevelColor(StyledLevel::debug), fmt::terminal_color::magenta);
}

TEST(StyledLog, LogLevels) {
  EXPECT_EQ(StyledLevelLogLevel(StyledLevel::success), LogLevel::info);
  EXPECT_EQ(StyledLevelLogLevel(StyledLevel::warning), LogLevel::warn);
  EXPECT_EQ(StyledLevelLogLevel(StyledLevel::bug), LogLevel::err);
  EXPECT_EQ(StyledLevelLogLevel(StyledLevel::fatal), LogLevel::critical);
  EXPECT_EQ(StyledLevelLogLevel(StyledLevel::trace), LogLevel::trace);
}

TEST(StyledLog, StyleText) {
  const string styled = StyleText("Important", fmt::terminal_color::red, fmt::emphasis::bold);
  EXPECT_NE(styled.find("\x1b[31m"), string::npos);
  EXPECT_NE(styled.find("Important"), string::npos);
  EXPECT_NE(styled.find("\x1b[0m"), string::npos);
}

TEST(StyledLog, FormatMessage) {
  const string msg = FormatStyledMessage(StyledLevel::warning, "Deprecation notice");
  EXPECT_NE(msg.find("[WARNING] Deprecation notice"), string::npos);
  EXPECT_EQ(msg.find("↳"), string::npos);

  const string msgWithCtx = FormatStyledMessage(StyledLevel::error, "Failure", "while loading");
  EXPECT_NE(msgWithCtx.find("[ERROR] Failure"), string::npos);
  EXPECT_NE(msgWithCtx.find("\n  ↳ "), string::npos);
  EXPECT_NE(msgWithCtx.find("while loading"), string::npos);
}

TEST(StyledLog, FormatTimestamp) {
  static const std::regex kTimestampRegex(R"(\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2}\.\d{3})");
  EXPECT_TRUE(std::regex_match(FormatTimestamp(), kTimestampRegex));

  const TimePoint timePoint(std::chrono::milliseconds(1234567890042));
  const string timestamp = FormatTimestamp(timePoint);
  EXPECT_EQ(timestamp.size(), 23U);
  EXPECT_TRUE(timestamp.ends_with(".042"));
}

TEST(StyledLog, Macros) {
  SYSX_LOG(info, "Test message");
  SYSX_LOG(success, "Done in {} ms", 42);
  SYSX_LOG_CTX(warning, "Will be removed in v2.0", "Deprecation notice for {}", "feature");
}

}  // namespace sysx
