#pragma once

#include <concepts>
#include <cstdint>
#include <type_traits>

namespace sysx {

template <typename T>
concept signed_or_unsigned_char = std::same_as<T, char> || std::same_as<T, unsigned char>;

/// Writes to 'buf' the 2-char hexadecimal code of given char 'ch'.
/// Given buffer should have space for at least two chars.
/// Letters will be in upper case.
/// Return a pointer to the char immediately positioned after the written hexadecimal code.
/// Examples:
///  ',' -> "2C"
///  '?' -> "3F"
constexpr char *to_upper_hex(signed_or_unsigned_char auto ch, char *buf) {
  constexpr const char *const kHexits = "0123456789ABCDEF";

  buf[0] = kHexits[static_cast<unsigned char>(ch) >> 4U];
  buf[1] = kHexits[static_cast<unsigned char>(ch) & 0x0F];

  return buf + 2;
}

/// Writes to 'buf' the 8-char binary code of given char 'ch', most significant bit first.
/// Given buffer should have space for at least eight chars.
/// Return a pointer to the char immediately positioned after the written binary code.
/// Examples:
///  'H' -> "01001000"
///  '!' -> "00100001"
constexpr char *to_bin(signed_or_unsigned_char auto ch, char *buf) {
  const auto uch = static_cast<unsigned char>(ch);
  for (int bitPos = 7; bitPos >= 0; --bitPos) {
    *buf++ = static_cast<char>('0' + ((uch >> bitPos) & 1U));
  }
  return buf;
}

/// Returns the value of the digit 'ch' in given radix (up to 16, case insensitive), or -1 if 'ch' is not a valid
/// digit in this radix.
constexpr int8_t digit_value(char ch, int radix) noexcept {
  int8_t val = -1;
  if (ch >= '0' && ch <= '9') {
    val = static_cast<int8_t>(ch - '0');
  } else if (ch >= 'a' && ch <= 'f') {
    val = static_cast<int8_t>(ch - 'a' + 10);
  } else if (ch >= 'A' && ch <= 'F') {
    val = static_cast<int8_t>(ch - 'A' + 10);
  }
  return val < radix ? val : static_cast<int8_t>(-1);
}

}  // namespace sysx
