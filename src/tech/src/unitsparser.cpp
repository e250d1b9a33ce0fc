#include "unitsparser.hpp"

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <span>
#include <string_view>
#include <system_error>
#include <utility>

#include "stringconv.hpp"
#include "sysx_exception.hpp"
#include "sysx_string.hpp"

namespace sysx {

int64_t ParseNumberOfBytes(std::string_view sizeStr) {
  int64_t totalNbBytes = 0;
  while (!sizeStr.empty()) {
    auto endDigitPos = sizeStr.find_first_not_of("0123456789");
    if (endDigitPos == std::string_view::npos) {
      endDigitPos = sizeStr.size();
    }
    if (endDigitPos == 0) {
      throw exception("Expected a number of bytes, got '{}'", sizeStr);
    }
    const auto nbBytes = StringToIntegral<int64_t>(sizeStr.substr(0, endDigitPos));
    sizeStr.remove_prefix(endDigitPos);

    int64_t multiplier = 1;
    if (!sizeStr.empty()) {
      const bool iMultiplier = 1UL < sizeStr.size() && sizeStr[1UL] == 'i';
      const int64_t multiplierBase = iMultiplier ? 1024L : 1000L;
      switch (sizeStr.front()) {
        case '.':
          throw exception("Decimal number not accepted for number of bytes parsing");
        case 'T':  // NOLINT(bugprone-branch-clone)
          multiplier *= multiplierBase;
          [[fallthrough]];
        case 'G':
          multiplier *= multiplierBase;
          [[fallthrough]];
        case 'M':
          multiplier *= multiplierBase;
          [[fallthrough]];
        case 'K':
          [[fallthrough]];
        case 'k':
          multiplier *= multiplierBase;
          break;
        default:
          throw exception("Invalid suffix '{}' for number of bytes parsing", sizeStr.front());
      }
      sizeStr.remove_prefix(1UL + static_cast<std::string_view::size_type>(iMultiplier));
    }
    totalNbBytes += nbBytes * multiplier;
  }

  return totalNbBytes;
}

namespace {
constexpr std::pair<int64_t, std::string_view> kBytesUnits[] = {{static_cast<int64_t>(1024) * 1024 * 1024 * 1024, "Ti"},
                                                                {static_cast<int64_t>(1024) * 1024 * 1024, "Gi"},
                                                                {static_cast<int64_t>(1024) * 1024, "Mi"},
                                                                {static_cast<int64_t>(1024), "Ki"},
                                                                {static_cast<int64_t>(1), ""}};
}

std::span<char> BytesToBuffer(int64_t numberOfBytes, std::span<char> buf) {
  char *begBuf = buf.data();
  char *endBuf = begBuf + buf.size();

  if (numberOfBytes == 0) {
    if (begBuf == endBuf) {
      throw exception("Buffer too small for number of bytes string representation");
    }
    *begBuf++ = '0';
    return {buf.data(), begBuf};
  }

  if (numberOfBytes < 0) {
    if (begBuf == endBuf) {
      throw exception("Buffer too small for number of bytes string representation");
    }
    *begBuf++ = '-';
    numberOfBytes = -numberOfBytes;
  }

  for (const auto &[unitNbBytes, unitStr] : kBytesUnits) {
    const int64_t nbUnits = numberOfBytes / unitNbBytes;
    if (nbUnits == 0) {
      continue;
    }
    numberOfBytes %= unitNbBytes;

    auto [ptr, errc] = std::to_chars(begBuf, endBuf, nbUnits);
    if (errc != std::errc()) {
      throw exception("Buffer too small for number of bytes string representation");
    }

    if (ptr + unitStr.size() > endBuf) {
      throw exception("Buffer too small for number of bytes string representation");
    }

    begBuf = std::ranges::copy(unitStr, ptr).out;
  }

  return {buf.data(), begBuf};
}

string BytesToStr(int64_t numberOfBytes) {
  char buf[64];
  const auto written = BytesToBuffer(numberOfBytes, buf);
  return {written.data(), written.size()};
}

}  // namespace sysx
