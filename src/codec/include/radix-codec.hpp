#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>
#include <string_view>
#include <vector>

#include "char-hexadecimal-converter.hpp"
#include "sysx_string.hpp"

namespace sysx {

/// Conversion between text and its representation as a string of digits in base 2 or 16, one fixed size group of
/// digits per byte. Digit strings may contain any kind of separator characters, which are ignored when decoding.
///
/// Examples for binary (8 digits per byte):
///   Encode("H")                -> "01001000"
///   Decode("0100 1000 !@#")    -> "H"
/// Examples for hexadecimal (2 digits per byte):
///   Encode("Hello")            -> "48 65 6C 6C 6F"
///   Decode("48z65$6C\n6C_6F")  -> "Hello"
///
/// All methods are stateless and thread safe. Failing ones throw a codec_error.
template <int Radix>
class RadixCodec {
  static_assert(Radix == 2 || Radix == 16, "Only binary and hexadecimal radixes are supported");

 public:
  static constexpr int kRadix = Radix;
  static constexpr int kDigitsPerByte = Radix == 2 ? 8 : 2;

  static constexpr bool IsDigit(char ch) noexcept { return digit_value(ch, Radix) >= 0; }

  /// Return the subsequence of 'input' made only of valid digits, in the same order.
  static string Clean(std::string_view input);

  /// Decode given digit string into text, after having cleaned it.
  /// Throws codec_error if the cleaned string is empty, if its length is not a multiple of kDigitsPerByte, or if the
  /// decoded bytes are not valid UTF-8.
  static string Decode(std::string_view input);

  /// Same as Decode, but returns the raw bytes without checking UTF-8 validity.
  static std::vector<uint8_t> DecodeBytes(std::string_view input);

  /// Encode each byte of 'text' into kDigitsPerByte digits (upper case for hexadecimal), separated by a space.
  static string Encode(std::string_view text);

  static string Encode(std::span<const unsigned char> bytes);

  /// Lenient check: 'input' is not empty and made only of white spaces and digits, without any length constraint.
  /// White spaces are all UTF-8 encoded characters with the Unicode White_Space property (no-break space included).
  static bool Check(std::string_view input) noexcept;

  /// Strict check: once all white spaces are removed, 'input' is not empty, made only of digits and its length is a
  /// multiple of kDigitsPerByte.
  static bool CheckStrict(std::string_view input) noexcept;

  /// Clean 'input' and regroup its digits by chunks of kDigitsPerByte separated by a space.
  /// Throws codec_error if the cleaned string is empty or if its length is not a multiple of kDigitsPerByte.
  static string Format(std::string_view input);

 private:
  static constexpr std::size_t kNotOnlyDigitsAndSpaces = std::numeric_limits<std::size_t>::max();

  static bool IsAligned(std::size_t nbDigits) noexcept;

  /// Number of digits of 'input', or kNotOnlyDigitsAndSpaces if it contains something else than digits and white spaces.
  static std::size_t CountDigits(std::string_view input) noexcept;

  static string CleanAndCheckAlignment(std::string_view input);
};

extern template class RadixCodec<2>;
extern template class RadixCodec<16>;

using BinCodec = RadixCodec<2>;
using HexCodec = RadixCodec<16>;

}  // namespace sysx
