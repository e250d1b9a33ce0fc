#pragma once

#include <cstdint>
#include <string_view>

#include "log-config.hpp"
#include "sysx_log.hpp"
#include "sysx_string.hpp"

namespace sysx {

class EnvCache;

/// @brief Encapsulates loggers lifetime and set-up.
class LoggingInfo {
 public:
  static constexpr int64_t kDefaultFileSizeInBytes = 5L * 1024 * 1024;
  static constexpr int32_t kDefaultNbMaxFiles = 10;
  static constexpr char const *const kOutputLoggerName = "output";
  static constexpr std::string_view kDefaultLogDir = "log";
  static constexpr std::string_view kLogLevelEnvVarName = "SYSX_LOG_LEVEL";

  enum class WithLoggersCreation : int8_t { kNo, kYes };

  /// Creates a default logging info, with level 'info' on standard error.
  explicit LoggingInfo(WithLoggersCreation withLoggersCreation = WithLoggersCreation::kNo,
                       std::string_view logDir = kDefaultLogDir);

  /// Creates a logging info from the log part of the general configuration.
  /// If 'envCache' is given and contains SYSX_LOG_LEVEL, it overrides the console level.
  LoggingInfo(WithLoggersCreation withLoggersCreation, std::string_view logDir, const schema::LogConfig &logConfig,
              const EnvCache *envCache = nullptr);

  LoggingInfo(const LoggingInfo &) = delete;
  LoggingInfo(LoggingInfo &&rhs) noexcept;
  LoggingInfo &operator=(const LoggingInfo &) = delete;
  LoggingInfo &operator=(LoggingInfo &&rhs) noexcept;

  ~LoggingInfo();

  int64_t maxFileSizeLogFileInBytes() const { return _maxFileSizeLogFileInBytes; }

  int32_t maxNbLogFiles() const { return _maxNbLogFiles; }

  LogLevel logConsole() const { return LevelFromPos(_logLevelConsolePos); }
  LogLevel logFile() const { return LevelFromPos(_logLevelFilePos); }

  std::string_view logDir() const { return _logDir; }

  void swap(LoggingInfo &rhs) noexcept;

 private:
  void createLoggers();

  void createOutputLogger();

  string _logDir;
  int64_t _maxFileSizeLogFileInBytes = kDefaultFileSizeInBytes;
  int32_t _maxNbLogFiles = kDefaultNbMaxFiles;
  int8_t _logLevelConsolePos = PosFromLevel(LogLevel::info);
  int8_t _logLevelFilePos = PosFromLevel(LogLevel::off);
  bool _destroyOutputLogger = false;
};

}  // namespace sysx
