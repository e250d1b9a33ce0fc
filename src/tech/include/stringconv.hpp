#pragma once

#include <charconv>
#include <concepts>
#include <string_view>
#include <system_error>

#include "sysx_exception.hpp"

namespace sysx {

/// Parse given string as an integral in given base, throwing an exception if the string is not entirely made of a
/// representable integral.
template <std::integral Integral = int>
Integral StringToIntegral(std::string_view str, int base = 10) {
  // No need to value initialize ret, std::from_chars will set it in case no error is returned
  // And in case of error, exception is thrown instead
  Integral ret;

  const char *begPtr = str.data();
  const char *endPtr = begPtr + str.size();
  const auto [ptr, errc] = std::from_chars(begPtr, endPtr, ret, base);

  if (errc != std::errc()) {
    if (errc == std::errc::result_out_of_range) {
      throw exception("'{}' would produce an out of range integral", str);
    }
    throw exception("Unable to decode '{}' into integral", str);
  }

  if (ptr != endPtr) {
    throw exception("Only {} out of {} chars decoded into integral {}", ptr - begPtr, str.size(), ret);
  }
  return ret;
}

}  // namespace sysx
