#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include "sysx_exception.hpp"
#include "sysx_format.hpp"
#include "sysx_string.hpp"

namespace sysx {

class env_error : public exception {
 public:
  template <typename... Args>
  explicit env_error(format_string<Args...> fmt, Args &&...args) : exception(fmt, std::forward<Args>(args)...) {}
};

/// Cache of environment variables, safe to share by reference between threads.
/// When bound to the process, reads and writes also go through the OS environment.
class EnvCache {
 public:
  enum class WithProcessUpdate : int8_t { kNo, kYes };

  using Entries = std::vector<std::pair<string, string>>;

  explicit EnvCache(WithProcessUpdate withProcessUpdate = WithProcessUpdate::kNo)
      : _withProcessUpdate(withProcessUpdate) {}

  /// Creates a cache initialized with a snapshot of the current process environment.
  static EnvCache FromProcessEnvironment(WithProcessUpdate withProcessUpdate = WithProcessUpdate::kYes);

  EnvCache(const EnvCache &) = delete;
  EnvCache &operator=(const EnvCache &) = delete;

  EnvCache(EnvCache &&rhs) noexcept;
  EnvCache &operator=(EnvCache &&rhs) noexcept;

  ~EnvCache() = default;

  void set(std::string_view key, std::string_view value);

  /// Get the value of 'key', throwing env_error if it is not set.
  string get(std::string_view key) const;

  std::optional<string> find(std::string_view key) const;

  bool contains(std::string_view key) const { return find(key).has_value(); }

  /// Remove 'key' from the cache (and from the process environment if bound to it).
  /// Returns true if it was present.
  bool erase(std::string_view key);

  /// Copy of the cached entries, sorted by key.
  Entries all() const;

  std::size_t size() const;

  bool isBoundToProcess() const { return _withProcessUpdate == WithProcessUpdate::kYes; }

 private:
  std::map<string, string, std::less<>> _vars;
  mutable std::mutex _mutex;
  WithProcessUpdate _withProcessUpdate;
};

/// Command line arguments of the program.
class ProgramArguments {
 public:
  ProgramArguments(int argc, const char *const *argv);

  /// All arguments, starting with the program name.
  const std::vector<string> &full() const { return _args; }

  /// Arguments without the program name.
  std::vector<string> args() const;

  string fullStr() const;

  string str() const;

 private:
  std::vector<string> _args;
};

}  // namespace sysx
