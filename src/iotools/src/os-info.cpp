#include "os-info.hpp"

#include <cstddef>
#include <filesystem>
#include <string_view>

#include "file.hpp"
#include "stringhelpers.hpp"
#include "sysx_exception.hpp"
#include "sysx_log.hpp"
#include "sysx_string.hpp"

namespace sysx {

namespace {
std::string_view TrimDoubleQuotes(std::string_view str) {
  const auto first = str.find_first_not_of('"');
  if (first == std::string_view::npos) {
    return {};
  }
  return str.substr(first, str.find_last_not_of('"') - first + 1);
}
}  // namespace

OsInfo ParseOsRelease(std::string_view content) {
  OsInfo osInfo;
  std::size_t lineNum = 0;
  while (!content.empty()) {
    ++lineNum;
    const auto endLinePos = content.find('\n');
    const std::string_view line = TrimSpaces(content.substr(0, endLinePos));
    content.remove_prefix(endLinePos == std::string_view::npos ? content.size() : endLinePos + 1);

    if (line.empty() || line.front() == '#') {
      continue;
    }

    const auto eqPos = line.find('=');
    if (eqPos == std::string_view::npos) {
      throw os_info_error(OsInfoErrc::kParse, "Invalid format at line {}: '{}'", lineNum, line);
    }
    const std::string_view key = TrimSpaces(line.substr(0, eqPos));
    if (key.empty()) {
      throw os_info_error(OsInfoErrc::kParse, "Empty key at line {}: '{}'", lineNum, line);
    }
    osInfo.insert_or_assign(string(key), string(TrimDoubleQuotes(TrimSpaces(line.substr(eqPos + 1)))));
  }
  if (osInfo.empty()) {
    throw os_info_error(OsInfoErrc::kParse, "Empty os-release file");
  }
  return osInfo;
}

OsInfo GetOsInfo(const std::filesystem::path &path) {
  string content;
  try {
    content = File(path).readAll();
  } catch (const exception &e) {
    throw os_info_error(OsInfoErrc::kIo, "{}", e.what());
  }
  log::debug("Parsing OS information from {}", path.string());
  return ParseOsRelease(content);
}

string GetOsInfoByKey(std::string_view key, const std::filesystem::path &path) {
  const OsInfo osInfo = GetOsInfo(path);
  const auto it = osInfo.find(key);
  return it == osInfo.end() ? string(kUndefinedOsInfo) : it->second;
}

}  // namespace sysx
