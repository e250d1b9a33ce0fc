#pragma once

#include <cctype>

namespace sysx {
/// Safe std::isdigit version. See https://en.cppreference.com/w/cpp/string/byte/isdigit
inline bool isdigit(char ch) { return std::isdigit(static_cast<unsigned char>(ch)) != 0; }

/// Safe std::isspace version. See https://en.cppreference.com/w/cpp/string/byte/isspace
inline bool isspace(char ch) { return std::isspace(static_cast<unsigned char>(ch)) != 0; }

/// Locale independent, constexpr version of std::tolower for ASCII chars.
constexpr char tolower(char ch) { return ch >= 'A' && ch <= 'Z' ? static_cast<char>(ch - 'A' + 'a') : ch; }

}  // namespace sysx
