#pragma once

#include <istream>
#include <string_view>
#include <utility>
#include <vector>

#include "sysx_format.hpp"
#include "sysx_string.hpp"

namespace sysx {

/// Result of a finished external command.
struct CommandOutput {
  bool success() const noexcept { return exitStatus == 0; }

  /// Standard output if the command succeeded, standard error otherwise.
  const string &result() const noexcept { return success() ? stdOut : stdErr; }

  int exitStatus{};
  string stdOut;
  string stdErr;
};

/// Split a command line into words following POSIX shell rules for quotes and backslash escapes.
/// Throws invalid_argument on unterminated quote or trailing backslash.
std::vector<string> SplitCommandLine(std::string_view cmdLine);

/// Run given command line and wait for its completion, capturing its outputs.
/// The program is searched in PATH. Throws invalid_argument for an empty command line or if the selected output
/// (see CommandOutput::result) is not valid UTF-8, exception if the program could not be started.
CommandOutput SilentRun(std::string_view cmdLine);

/// Same as SilentRun, and print the result on the output logger.
CommandOutput Run(std::string_view cmdLine);

template <typename... Args>
CommandOutput SilentRunF(format_string<Args...> fmt, Args &&...args) {
  return SilentRun(sysx::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
CommandOutput RunF(format_string<Args...> fmt, Args &&...args) {
  return Run(sysx::format(fmt, std::forward<Args>(args)...));
}

/// Read one line from 'is', without its trailing end of line.
string ReadLine(std::istream &is);

/// Read one line from standard input.
string Input();

}  // namespace sysx
