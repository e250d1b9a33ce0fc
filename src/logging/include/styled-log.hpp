#pragma once

#if !defined(SPDLOG_FMT_EXTERNAL)
#include <spdlog/fmt/bundled/color.h>
#else
#include <fmt/color.h>
#endif

#include <cstdint>
#include <optional>
#include <string_view>

#include "sysx_format.hpp"
#include "sysx_log.hpp"
#include "sysx_string.hpp"
#include "timedef.hpp"

namespace sysx {

/// Levels of user facing, colored log lines.
enum class StyledLevel : int8_t { info, success, warning, error, bug, fatal, debug, trace };

/// Upper case name of the level, for instance "WARNING".
std::string_view StyledLevelName(StyledLevel level);

fmt::terminal_color StyledLevelColor(StyledLevel level);

/// spdlog level used to emit a line of given styled level.
LogLevel StyledLevelLogLevel(StyledLevel level);

/// Apply foreground color and emphasis to 'text' with ANSI escape sequences.
string StyleText(std::string_view text, fmt::terminal_color color, fmt::emphasis emphasis = fmt::emphasis{});

/// Local time formatted as "%Y-%m-%d %H:%M:%S.mmm".
string FormatTimestamp(TimePoint timePoint = Clock::now());

/// "[LEVEL] msg" in bold level color, followed by "\n  ↳ ctx" dimmed if a context is given.
string FormatStyledMessage(StyledLevel level, std::string_view msg, std::optional<std::string_view> ctx = std::nullopt);

/// Emit a styled line on the default logger at the spdlog level matching 'level'.
void StyledLog(StyledLevel level, std::string_view msg, std::optional<std::string_view> ctx = std::nullopt);

}  // namespace sysx

/// SYSX_LOG(warning, "Disk {} almost full", diskName)
#define SYSX_LOG(level, ...) ::sysx::StyledLog(::sysx::StyledLevel::level, ::sysx::format(__VA_ARGS__))

/// SYSX_LOG_CTX(error, "while loading config", "Unable to open {}", path)
#define SYSX_LOG_CTX(level, ctx, ...) \
  ::sysx::StyledLog(::sysx::StyledLevel::level, ::sysx::format(__VA_ARGS__), std::string_view(ctx))
