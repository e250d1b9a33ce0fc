#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <string_view>
#include <utility>

#include "sysx_exception.hpp"
#include "sysx_format.hpp"
#include "sysx_string.hpp"

namespace sysx {

enum class OsInfoErrc : int8_t {
  kIo,     // os-release file could not be read
  kParse,  // malformed or empty os-release content
};

class os_info_error : public exception {
 public:
  template <typename... Args>
  os_info_error(OsInfoErrc errc, format_string<Args...> fmt, Args &&...args)
      : exception(fmt, std::forward<Args>(args)...), _errc(errc) {}

  OsInfoErrc errc() const noexcept { return _errc; }

 private:
  OsInfoErrc _errc;
};

/// Operating system identification fields, for instance "ID" -> "ubuntu".
using OsInfo = std::map<string, string, std::less<>>;

inline constexpr std::string_view kDefaultOsReleasePath = "/etc/os-release";

inline constexpr std::string_view kUndefinedOsInfo = "undefined";

/// Parse the content of an os-release file made of KEY=value lines.
/// Empty lines and comments (starting with '#') are skipped, keys and values are trimmed and surrounding double quotes
/// are removed from values.
/// Throws os_info_error(kParse) for a line without '=', an empty key or a content without any entry.
OsInfo ParseOsRelease(std::string_view content);

/// Read and parse the os-release file at 'path'.
/// Throws os_info_error(kIo) if it cannot be read.
OsInfo GetOsInfo(const std::filesystem::path &path = kDefaultOsReleasePath);

/// Value of 'key' in the os-release file at 'path', or "undefined" if it is not present.
string GetOsInfoByKey(std::string_view key, const std::filesystem::path &path = kDefaultOsReleasePath);

}  // namespace sysx
