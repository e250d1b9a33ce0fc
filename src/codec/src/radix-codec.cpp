#include "radix-codec.hpp"

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <iterator>
#include <limits>
#include <span>
#include <string_view>
#include <system_error>
#include <vector>

#include "char-hexadecimal-converter.hpp"
#include "codec-error.hpp"
#include "mathhelpers.hpp"
#include "sysx_string.hpp"
#include "utf8.hpp"

namespace sysx {

template <int Radix>
bool RadixCodec<Radix>::IsAligned(std::size_t nbDigits) noexcept {
  if constexpr (kDigitsPerByte == 2) {
    return IsEven(nbDigits);
  } else {
    return nbDigits % kDigitsPerByte == 0;
  }
}

template <int Radix>
string RadixCodec<Radix>::Clean(std::string_view input) {
  string ret;
  ret.reserve(input.size());
  std::ranges::copy_if(input, std::back_inserter(ret), [](char ch) { return IsDigit(ch); });
  return ret;
}

template <int Radix>
string RadixCodec<Radix>::CleanAndCheckAlignment(std::string_view input) {
  string cleaned = Clean(input);
  if (cleaned.empty()) {
    throw codec_error(CodecErrc::kEmptyInput, "No base {} digit in input of size {}", Radix, input.size());
  }
  if (!IsAligned(cleaned.size())) {
    throw codec_error(CodecErrc::kMisalignedLength, "Base {} string length {} must be a multiple of {}", Radix,
                      cleaned.size(), kDigitsPerByte);
  }
  return cleaned;
}

template <int Radix>
std::vector<uint8_t> RadixCodec<Radix>::DecodeBytes(std::string_view input) {
  const string cleaned = CleanAndCheckAlignment(input);

  std::vector<uint8_t> bytes(cleaned.size() / kDigitsPerByte);
  const char *digits = cleaned.data();
  for (uint8_t &byte : bytes) {
    const auto [ptr, errc] = std::from_chars(digits, digits + kDigitsPerByte, byte, Radix);
    if (errc != std::errc() || ptr != digits + kDigitsPerByte) {
      throw codec_error(CodecErrc::kParseInt, "Unable to parse '{}' as a base {} byte",
                        std::string_view(digits, kDigitsPerByte), Radix);
    }
    digits += kDigitsPerByte;
  }
  return bytes;
}

template <int Radix>
string RadixCodec<Radix>::Decode(std::string_view input) {
  const auto bytes = DecodeBytes(input);
  if (!IsValidUtf8(std::span<const unsigned char>(bytes))) {
    throw codec_error(CodecErrc::kInvalidUtf8, "Invalid UTF-8 sequence in {} decoded bytes", bytes.size());
  }
  return string(bytes.begin(), bytes.end());
}

template <int Radix>
string RadixCodec<Radix>::Encode(std::span<const unsigned char> bytes) {
  if (bytes.empty()) {
    return {};
  }
  string ret(bytes.size() * (kDigitsPerByte + 1) - 1, ' ');
  char *out = ret.data();
  for (unsigned char byte : bytes) {
    if constexpr (Radix == 2) {
      out = to_bin(byte, out);
    } else {
      out = to_upper_hex(byte, out);
    }
    // skip the separator
    ++out;
  }
  return ret;
}

template <int Radix>
string RadixCodec<Radix>::Encode(std::string_view text) {
  return Encode(std::span<const unsigned char>(reinterpret_cast<const unsigned char *>(text.data()), text.size()));
}

template <int Radix>
std::size_t RadixCodec<Radix>::CountDigits(std::string_view input) noexcept {
  std::size_t nbDigits = 0;
  for (std::size_t pos = 0; pos < input.size();) {
    if (IsDigit(input[pos])) {
      ++nbDigits;
      ++pos;
      continue;
    }
    const auto whiteSpaceLen = Utf8WhiteSpaceLength(input, pos);
    if (whiteSpaceLen == 0) {
      return kNotOnlyDigitsAndSpaces;
    }
    pos += whiteSpaceLen;
  }
  return nbDigits;
}

template <int Radix>
bool RadixCodec<Radix>::Check(std::string_view input) noexcept {
  return !input.empty() && CountDigits(input) != kNotOnlyDigitsAndSpaces;
}

template <int Radix>
bool RadixCodec<Radix>::CheckStrict(std::string_view input) noexcept {
  const auto nbDigits = CountDigits(input);
  return nbDigits != 0 && nbDigits != kNotOnlyDigitsAndSpaces && IsAligned(nbDigits);
}

template <int Radix>
string RadixCodec<Radix>::Format(std::string_view input) {
  const string cleaned = CleanAndCheckAlignment(input);
  const auto nbBytes = cleaned.size() / kDigitsPerByte;

  string ret;
  ret.reserve(nbBytes * (kDigitsPerByte + 1) - 1);
  for (std::size_t bytePos = 0; bytePos < nbBytes; ++bytePos) {
    if (bytePos != 0) {
      ret.push_back(' ');
    }
    ret.append(cleaned, bytePos * kDigitsPerByte, kDigitsPerByte);
  }
  return ret;
}

template class RadixCodec<2>;
template class RadixCodec<16>;

}  // namespace sysx
