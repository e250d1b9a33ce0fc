#include "file.hpp"

#include <charconv>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string_view>
#include <system_error>
#include <utility>

#include "sysx_exception.hpp"
#include "sysx_invalid_argument_exception.hpp"
#include "sysx_log.hpp"
#include "sysx_string.hpp"

namespace sysx {

namespace fs = std::filesystem;

namespace {
void CreateParentDirectories(const fs::path &path) {
  const fs::path parentPath = path.parent_path();
  if (parentPath.empty()) {
    return;
  }
  std::error_code ec;
  fs::create_directories(parentPath, ec);
  if (ec) {
    throw exception("Unable to create directory {}: {}", parentPath.string(), ec.message());
  }
}
}  // namespace

fs::path NormalizePath(const fs::path &path) {
  fs::path normalized;
  for (const fs::path &component : path) {
    if (component == ".") {
      continue;
    }
    if (component == "..") {
      if (normalized.has_relative_path()) {
        normalized = normalized.parent_path();
      }
      continue;
    }
    if (component.empty()) {
      // trailing separator
      continue;
    }
    normalized /= component;
  }
  return normalized;
}

uintmax_t DirectorySize(const fs::path &dirPath) {
  std::error_code ec;
  uintmax_t totalSize = 0;
  for (fs::recursive_directory_iterator it(dirPath, ec), endIt; !ec && it != endIt; it.increment(ec)) {
    if (it->is_regular_file()) {
      totalSize += it->file_size();
    }
  }
  if (ec) {
    throw exception("Unable to compute size of {}: {}", dirPath.string(), ec.message());
  }
  return totalSize;
}

File::File(const fs::path &path, IfError ifError)
    : _filePath(NormalizePath(path.is_relative() ? fs::current_path() / path : path)), _ifError(ifError) {}

bool File::exists() const {
  std::error_code ec;
  return fs::exists(_filePath, ec);
}

string File::readAll() const {
  log::debug("Opening file {} for reading", _filePath.string());
  if (_ifError == IfError::kNoThrow && !exists()) {
    return {};
  }
  std::ifstream file(_filePath, std::ios_base::in | std::ios_base::binary);
  if (!file) {
    throw exception("Unable to open {} for reading", _filePath.string());
  }
  string data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  if (file.bad()) {
    throw exception("Error while reading file {}", _filePath.string());
  }
  return data;
}

void File::append(std::string_view data) const {
  log::debug("Opening file {} for appending", _filePath.string());
  std::ofstream fileOfStream(_filePath, std::ios_base::app | std::ios_base::binary);
  if (!fileOfStream) {
    throw exception("Unable to open {} for appending", _filePath.string());
  }
  fileOfStream.write(data.data(), static_cast<std::streamsize>(data.size()));
  if (!fileOfStream) {
    throw exception("Error while appending to file {}", _filePath.string());
  }
}

void File::write(std::string_view data) const {
  log::debug("Opening file {} for writing", _filePath.string());
  CreateParentDirectories(_filePath);
  std::ofstream fileOfStream(_filePath, std::ios_base::out | std::ios_base::trunc | std::ios_base::binary);
  if (!fileOfStream) {
    throw exception("Unable to open {} for writing", _filePath.string());
  }
  fileOfStream.write(data.data(), static_cast<std::streamsize>(data.size()));
  if (!fileOfStream) {
    throw exception("Error while writing file {}", _filePath.string());
  }
}

void File::remove() const {
  std::error_code ec;
  if (fs::remove(_filePath, ec)) {
    log::debug("Removed file {}", _filePath.string());
  } else if (ec) {
    throw exception("Unable to remove {}: {}", _filePath.string(), ec.message());
  }
}

void File::rename(const fs::path &newPath) {
  fs::path newFullPath = NormalizePath(newPath.is_relative() ? _filePath.parent_path() / newPath : newPath);
  CreateParentDirectories(newFullPath);

  std::error_code ec;
  fs::rename(_filePath, newFullPath, ec);
  if (ec) {
    throw exception("Unable to rename {}: {}", _filePath.string(), ec.message());
  }
  log::debug("Renamed file {} to {}", _filePath.string(), newFullPath.string());
  _filePath = std::move(newFullPath);
}

string File::permissions() const {
  std::error_code ec;
  const auto fileStatus = fs::status(_filePath, ec);
  if (ec) {
    throw exception("Unable to get permissions of {}: {}", _filePath.string(), ec.message());
  }
  const auto perms = static_cast<unsigned>(fileStatus.permissions() & fs::perms::mask) & 0777U;

  char buf[4];
  const auto [ptr, errc] = std::to_chars(buf, buf + sizeof(buf), perms, 8);
  return {buf, ptr};
}

void File::setPermissions(std::string_view octalPermissions) const {
  unsigned mode = 0;
  const char *endPtr = octalPermissions.data() + octalPermissions.size();
  const auto [ptr, errc] = std::from_chars(octalPermissions.data(), endPtr, mode, 8);
  if (octalPermissions.empty() || errc != std::errc() || ptr != endPtr || mode > 07777U) {
    throw invalid_argument("Invalid Unix permissions '{}'", octalPermissions);
  }

  std::error_code ec;
  fs::permissions(_filePath, static_cast<fs::perms>(mode), fs::perm_options::replace, ec);
  if (ec) {
    throw exception("Unable to set permissions of {}: {}", _filePath.string(), ec.message());
  }
}

uintmax_t File::size() const {
  std::error_code ec;
  const auto fileSize = fs::file_size(_filePath, ec);
  if (ec) {
    throw exception("Unable to get size of {}: {}", _filePath.string(), ec.message());
  }
  return fileSize;
}

fs::file_time_type File::lastWriteTime() const {
  std::error_code ec;
  const auto lastWriteTime = fs::last_write_time(_filePath, ec);
  if (ec) {
    throw exception("Unable to get last write time of {}: {}", _filePath.string(), ec.message());
  }
  return lastWriteTime;
}

}  // namespace sysx
