#pragma once

#include <string_view>

#include "sysx_cctype.hpp"

namespace sysx {

/// Return a view of 'str' without its leading and trailing whitespace characters.
inline std::string_view TrimSpaces(std::string_view str) {
  while (!str.empty() && isspace(str.front())) {
    str.remove_prefix(1);
  }
  while (!str.empty() && isspace(str.back())) {
    str.remove_suffix(1);
  }
  return str;
}

/// Join all elements of given range into a single string, separated by 'sep'.
template <class StringType, class Range>
StringType Join(const Range &range, std::string_view sep) {
  StringType ret;
  bool first = true;
  for (const auto &elem : range) {
    if (!first) {
      ret.append(sep);
    }
    ret.append(elem);
    first = false;
  }
  return ret;
}

}  // namespace sysx
