#pragma once

#include <algorithm>
#include <string_view>

#include "sysx_cctype.hpp"
#include "sysx_string.hpp"

namespace sysx {

inline string ToLower(std::string_view str) {
  string ret(str);
  std::ranges::transform(ret, ret.begin(), [](char ch) { return tolower(ch); });
  return ret;
}

}  // namespace sysx
