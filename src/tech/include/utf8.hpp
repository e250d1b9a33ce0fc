#pragma once

#include <cstdint>
#include <span>
#include <string_view>

namespace sysx {

constexpr int nb_bytes_utf8(uint32_t cp) {
  if (cp <= 0x007F) {
    return 1;
  }
  if (cp <= 0x07FF) {
    return 2;
  }
  if (cp <= 0xFFFF) {
    return 3;
  }
  if (cp <= 0x10FFFF) {
    return 4;
  }
  // invalid, assume 1
  return 1;
}

/**
 * Tells whether given bytes form a valid UTF-8 sequence.
 * Overlong encodings, UTF-16 surrogates (U+D800 to U+DFFF), code points above U+10FFFF, truncated sequences and
 * unexpected continuation bytes are all rejected.
 */
constexpr bool IsValidUtf8(std::span<const unsigned char> bytes) noexcept {
  const auto sz = bytes.size();
  for (std::size_t pos = 0; pos < sz;) {
    const unsigned char lead = bytes[pos];
    if (lead < 0x80U) {
      ++pos;
      continue;
    }

    int nbContinuationBytes;
    uint32_t cp;
    if ((lead & 0xE0U) == 0xC0U) {
      nbContinuationBytes = 1;
      cp = lead & 0x1FU;
    } else if ((lead & 0xF0U) == 0xE0U) {
      nbContinuationBytes = 2;
      cp = lead & 0x0FU;
    } else if ((lead & 0xF8U) == 0xF0U) {
      nbContinuationBytes = 3;
      cp = lead & 0x07U;
    } else {
      return false;
    }

    if (sz - pos <= static_cast<std::size_t>(nbContinuationBytes)) {
      return false;
    }
    for (int byteIdx = 1; byteIdx <= nbContinuationBytes; ++byteIdx) {
      const unsigned char ch = bytes[pos + byteIdx];
      if ((ch & 0xC0U) != 0x80U) {
        return false;
      }
      cp = (cp << 6) | (ch & 0x3FU);
    }

    if (nb_bytes_utf8(cp) != nbContinuationBytes + 1 || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
      return false;
    }

    pos += nbContinuationBytes + 1;
  }
  return true;
}

inline bool IsValidUtf8(std::string_view str) noexcept {
  return IsValidUtf8(std::span<const unsigned char>(reinterpret_cast<const unsigned char *>(str.data()), str.size()));
}

/// Tells whether given code point has the Unicode White_Space property.
constexpr bool IsUnicodeWhiteSpace(uint32_t cp) noexcept {
  switch (cp) {
    case 0x0009:
    case 0x000A:
    case 0x000B:
    case 0x000C:
    case 0x000D:
    case 0x0020:
    case 0x0085:
    case 0x00A0:
    case 0x1680:
    case 0x2028:
    case 0x2029:
    case 0x202F:
    case 0x205F:
    case 0x3000:
      return true;
    default:
      return cp >= 0x2000 && cp <= 0x200A;
  }
}

/// Returns the number of bytes of the UTF-8 encoded white space character starting at 'pos' in 'str',
/// or 0 if there is no valid white space character at this position.
constexpr std::size_t Utf8WhiteSpaceLength(std::string_view str, std::size_t pos) noexcept {
  const auto lead = static_cast<unsigned char>(str[pos]);
  if (lead < 0x80U) {
    return IsUnicodeWhiteSpace(lead) ? 1U : 0U;
  }

  std::size_t nbContinuationBytes;
  uint32_t cp;
  if ((lead & 0xE0U) == 0xC0U) {
    nbContinuationBytes = 1;
    cp = lead & 0x1FU;
  } else if ((lead & 0xF0U) == 0xE0U) {
    nbContinuationBytes = 2;
    cp = lead & 0x0FU;
  } else {
    // all white space code points are encoded on 3 bytes at most
    return 0;
  }

  if (str.size() - pos <= nbContinuationBytes) {
    return 0;
  }
  for (std::size_t byteIdx = 1; byteIdx <= nbContinuationBytes; ++byteIdx) {
    const auto ch = static_cast<unsigned char>(str[pos + byteIdx]);
    if ((ch & 0xC0U) != 0x80U) {
      return 0;
    }
    cp = (cp << 6) | (ch & 0x3FU);
  }

  if (static_cast<std::size_t>(nb_bytes_utf8(cp)) != nbContinuationBytes + 1 || !IsUnicodeWhiteSpace(cp)) {
    return 0;
  }
  return nbContinuationBytes + 1;
}

}  // namespace sysx
