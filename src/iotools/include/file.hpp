#pragma once

#include <cstdint>
#include <filesystem>
#include <string_view>

#include "sysx_string.hpp"

namespace sysx {

/// Remove '.' components of 'path' and resolve '..' ones lexically, without accessing the filesystem.
std::filesystem::path NormalizePath(const std::filesystem::path &path);

/// Recursive sum of the sizes of the regular files under 'dirPath'.
uintmax_t DirectorySize(const std::filesystem::path &dirPath);

/// Handle on a file identified by its absolute, normalized path.
/// Filesystem errors are reported with sysx::exception.
class File {
 public:
  enum class IfError : int8_t { kThrow, kNoThrow };

  /// Relative paths are made absolute from the current directory.
  /// With IfError::kNoThrow, reading a missing file returns an empty string instead of throwing.
  explicit File(const std::filesystem::path &path, IfError ifError = IfError::kThrow);

  bool exists() const;

  string readAll() const;

  /// Append 'data' at the end of the file, creating it if needed.
  void append(std::string_view data) const;

  /// Replace the content of the file by 'data', creating the parent directories if needed.
  void write(std::string_view data) const;

  /// Remove the file if it exists.
  void remove() const;

  /// Move the file to 'newPath', interpreted relatively to the current parent directory of the file.
  void rename(const std::filesystem::path &newPath);

  const std::filesystem::path &path() const { return _filePath; }

  /// Unix permissions of the file in octal, for instance "644".
  string permissions() const;

  /// Set the Unix permissions from an octal string, for instance "755".
  void setPermissions(std::string_view octalPermissions) const;

  uintmax_t size() const;

  std::filesystem::file_time_type lastWriteTime() const;

 private:
  std::filesystem::path _filePath;
  IfError _ifError;
};

}  // namespace sysx
