#include "styled-log.hpp"

#include <spdlog/fmt/chrono.h>

#include <chrono>
#include <ctime>
#include <optional>
#include <string_view>

#include "sysx_format.hpp"
#include "sysx_log.hpp"
#include "sysx_string.hpp"
#include "timedef.hpp"
#include "unreachable.hpp"

namespace sysx {

std::string_view StyledLevelName(StyledLevel level) {
  switch (level) {
    case StyledLevel::info:
      return "INFO";
    case StyledLevel::success:
      return "SUCCESS";
    case StyledLevel::warning:
      return "WARNING";
    case StyledLevel::error:
      return "ERROR";
    case StyledLevel::bug:
      return "BUG";
    case StyledLevel::fatal:
      return "FATAL";
    case StyledLevel::debug:
      return "DEBUG";
    case StyledLevel::trace:
      return "TRACE";
    default:
      unreachable();
  }
}

fmt::terminal_color StyledLevelColor(StyledLevel level) {
  switch (level) {
    case StyledLevel::info:
      return fmt::terminal_color::blue;
    case StyledLevel::success:
      return fmt::terminal_color::green;
    case StyledLevel::warning:
      return fmt::terminal_color::yellow;
    case StyledLevel::error:
      return fmt::terminal_color::red;
    case StyledLevel::bug:
      [[fallthrough]];
    case StyledLevel::fatal:
      return fmt::terminal_color::bright_red;
    case StyledLevel::debug:
      return fmt::terminal_color::magenta;
    case StyledLevel::trace:
      return fmt::terminal_color::cyan;
    default:
      unreachable();
  }
}

LogLevel StyledLevelLogLevel(StyledLevel level) {
  switch (level) {
    case StyledLevel::info:
      [[fallthrough]];
    case StyledLevel::success:
      return LogLevel::info;
    case StyledLevel::warning:
      return LogLevel::warn;
    case StyledLevel::error:
      [[fallthrough]];
    case StyledLevel::bug:
      return LogLevel::err;
    case StyledLevel::fatal:
      return LogLevel::critical;
    case StyledLevel::debug:
      return LogLevel::debug;
    case StyledLevel::trace:
      return LogLevel::trace;
    default:
      unreachable();
  }
}

string StyleText(std::string_view text, fmt::terminal_color color, fmt::emphasis emphasis) {
  return fmt::format(fmt::fg(color) | emphasis, "{}", text);
}

string FormatTimestamp(TimePoint timePoint) {
  const std::time_t time = Clock::to_time_t(timePoint);
  const auto millis = TimestampToMillisecondsSinceEpoch(timePoint) % 1000;
  return sysx::format("{:%Y-%m-%d %H:%M:%S}.{:03}", fmt::localtime(time), millis);
}

string FormatStyledMessage(StyledLevel level, std::string_view msg, std::optional<std::string_view> ctx) {
  string ret = fmt::format(fmt::fg(StyledLevelColor(level)) | fmt::emphasis::bold, "[{}] {}", StyledLevelName(level),
                           msg);
  if (ctx) {
    ret.append("\n  ↳ ");
    ret.append(fmt::format(fmt::emphasis::faint, "{}", *ctx));
  }
  return ret;
}

void StyledLog(StyledLevel level, std::string_view msg, std::optional<std::string_view> ctx) {
  log::log(static_cast<log::level::level_enum>(StyledLevelLogLevel(level)), "{}",
           FormatStyledMessage(level, msg, ctx));
}

}  // namespace sysx
