#pragma once

#include <cstdint>
#include <optional>

namespace sysx {

/// Size of a terminal in characters.
struct TerminalDimensions {
  bool operator==(const TerminalDimensions &) const noexcept = default;

  uint16_t width{};
  uint16_t height{};
};

/// Dimensions of the terminal attached to file descriptor 'fd', if it is one.
std::optional<TerminalDimensions> GetTerminalDimensions(int fd);

/// Dimensions of the terminal attached to standard output, standard error or standard input (first one which is a
/// terminal), or nullopt if none of them is.
std::optional<TerminalDimensions> GetTerminalDimensions();

std::optional<uint16_t> TerminalWidth();

std::optional<uint16_t> TerminalHeight();

}  // namespace sysx
