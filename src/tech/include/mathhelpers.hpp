#pragma once

#include <concepts>
#include <utility>

namespace sysx {

/// Tells whether given integral is even, with a bitwise check.
constexpr bool IsEven(std::integral auto num) noexcept { return (num & 1) == 0; }

/// Tells whether given integral is odd, with a bitwise check.
constexpr bool IsOdd(std::integral auto num) noexcept { return (num & 1) != 0; }

/// Returns both parities at once, as a pair {isEven, isOdd}.
constexpr std::pair<bool, bool> IsEvenOrOdd(std::integral auto num) noexcept {
  const bool isEven = IsEven(num);
  return {isEven, !isEven};
}

}  // namespace sysx
