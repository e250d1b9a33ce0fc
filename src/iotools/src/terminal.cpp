#include "terminal.hpp"

#include <sys/ioctl.h>
#include <unistd.h>

#include <optional>

namespace sysx {

std::optional<TerminalDimensions> GetTerminalDimensions(int fd) {
  if (::isatty(fd) != 1) {
    return std::nullopt;
  }
  struct winsize windowSize {};
  if (::ioctl(fd, TIOCGWINSZ, &windowSize) != 0 || windowSize.ws_col == 0 || windowSize.ws_row == 0) {
    return std::nullopt;
  }
  return TerminalDimensions{windowSize.ws_col, windowSize.ws_row};
}

std::optional<TerminalDimensions> GetTerminalDimensions() {
  for (int fd : {STDOUT_FILENO, STDERR_FILENO, STDIN_FILENO}) {
    auto dimensions = GetTerminalDimensions(fd);
    if (dimensions) {
      return dimensions;
    }
  }
  return std::nullopt;
}

std::optional<uint16_t> TerminalWidth() {
  const auto dimensions = GetTerminalDimensions();
  if (!dimensions) {
    return std::nullopt;
  }
  return dimensions->width;
}

std::optional<uint16_t> TerminalHeight() {
  const auto dimensions = GetTerminalDimensions();
  if (!dimensions) {
    return std::nullopt;
  }
  return dimensions->height;
}

}  // namespace sysx
