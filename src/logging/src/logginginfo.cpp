#include "logginginfo.hpp"

#include <spdlog/async.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <memory>
#include <string_view>
#include <utility>
#include <vector>

#include "env-cache.hpp"
#include "log-config.hpp"
#include "parseloglevel.hpp"
#include "sysx_exception.hpp"
#include "sysx_log.hpp"
#include "sysx_string.hpp"
#include "unitsparser.hpp"

namespace sysx {

namespace {
log::level::level_enum SpdlogLevelFromPos(int8_t levelPos) {
  return static_cast<log::level::level_enum>(LevelFromPos(levelPos));
}
}  // namespace

LoggingInfo::LoggingInfo(WithLoggersCreation withLoggersCreation, std::string_view logDir) : _logDir(logDir) {
  if (withLoggersCreation == WithLoggersCreation::kYes) {
    createLoggers();
  }
}

LoggingInfo::LoggingInfo(WithLoggersCreation withLoggersCreation, std::string_view logDir,
                         const schema::LogConfig &logConfig, const EnvCache *envCache)
    : _logDir(logDir),
      _maxFileSizeLogFileInBytes(ParseNumberOfBytes(logConfig.maxFileSize)),
      _maxNbLogFiles(logConfig.maxNbFiles),
      _logLevelConsolePos(LogPosFromLogStr(logConfig.consoleLevel)),
      _logLevelFilePos(LogPosFromLogStr(logConfig.fileLevel)) {
  if (_maxFileSizeLogFileInBytes <= 0) {
    throw exception("Invalid maximum log file size {}", logConfig.maxFileSize);
  }
  if (_maxNbLogFiles <= 0) {
    throw exception("Invalid maximum number of log files {}", _maxNbLogFiles);
  }
  if (envCache != nullptr) {
    auto optLogLevel = envCache->find(kLogLevelEnvVarName);
    if (optLogLevel) {
      _logLevelConsolePos = LogPosFromLogStr(*optLogLevel);
    }
  }
  if (withLoggersCreation == WithLoggersCreation::kYes) {
    createLoggers();
  }
}

LoggingInfo::LoggingInfo(LoggingInfo &&rhs) noexcept
    : _logDir(std::move(rhs._logDir)),
      _maxFileSizeLogFileInBytes(rhs._maxFileSizeLogFileInBytes),
      _maxNbLogFiles(rhs._maxNbLogFiles),
      _logLevelConsolePos(rhs._logLevelConsolePos),
      _logLevelFilePos(rhs._logLevelFilePos),
      _destroyOutputLogger(std::exchange(rhs._destroyOutputLogger, false)) {}

LoggingInfo &LoggingInfo::operator=(LoggingInfo &&rhs) noexcept {
  if (&rhs != this) {
    swap(rhs);
  }
  return *this;
}

LoggingInfo::~LoggingInfo() {
  if (_destroyOutputLogger) {
    log::drop(kOutputLoggerName);
  }
}

void LoggingInfo::createLoggers() {
  std::vector<log::sink_ptr> sinks;

  if (_logLevelConsolePos != 0) {
    auto &consoleSink = sinks.emplace_back(std::make_shared<log::sinks::stderr_color_sink_mt>());
    consoleSink->set_level(SpdlogLevelFromPos(_logLevelConsolePos));
  }

  if (_logLevelFilePos != 0) {
    log::filename_t logFileName = log::filename_t(_logDir) + log::filename_t("/log.txt");
    auto &rotatingSink = sinks.emplace_back(std::make_shared<log::sinks::rotating_file_sink_mt>(
        std::move(logFileName), static_cast<std::size_t>(_maxFileSizeLogFileInBytes),
        static_cast<std::size_t>(_maxNbLogFiles)));

    rotatingSink->set_level(SpdlogLevelFromPos(_logLevelFilePos));
  }

  constexpr int nbThreads = 1;  // only one logger thread is important to keep order between output logger and others
  log::init_thread_pool(8192, nbThreads);

  if (!sinks.empty()) {
    auto logger = std::make_shared<log::async_logger>("", sinks.begin(), sinks.end(), log::thread_pool(),
                                                      log::async_overflow_policy::block);

    // the logger level filters before the sinks, it needs to let through the most verbose of both
    logger->set_level(SpdlogLevelFromPos(std::max(_logLevelConsolePos, _logLevelFilePos)));

    log::set_default_logger(logger);
  }

  createOutputLogger();
}

void LoggingInfo::swap(LoggingInfo &rhs) noexcept {
  using std::swap;

  _logDir.swap(rhs._logDir);
  swap(_maxFileSizeLogFileInBytes, rhs._maxFileSizeLogFileInBytes);
  swap(_maxNbLogFiles, rhs._maxNbLogFiles);
  swap(_logLevelConsolePos, rhs._logLevelConsolePos);
  swap(_logLevelFilePos, rhs._logLevelFilePos);
  swap(_destroyOutputLogger, rhs._destroyOutputLogger);
}

void LoggingInfo::createOutputLogger() {
  // A previous instance may still own it
  log::drop(kOutputLoggerName);

  auto outputLogger =
      std::make_shared<log::async_logger>(kOutputLoggerName, std::make_shared<log::sinks::stdout_color_sink_mt>(),
                                          log::thread_pool(), log::async_overflow_policy::block);
  outputLogger->set_level(log::level::level_enum::info);
  outputLogger->set_pattern("%v");

  log::register_logger(outputLogger);
  _destroyOutputLogger = true;
}

}  // namespace sysx
