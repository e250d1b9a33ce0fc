#include "env-cache.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <optional>
#include <string_view>
#include <utility>

#include "stringhelpers.hpp"
#include "sysx_invalid_argument_exception.hpp"
#include "sysx_log.hpp"
#include "sysx_string.hpp"

extern char **environ;

namespace sysx {

namespace {
void CheckKey(std::string_view key) {
  if (key.empty()) {
    throw invalid_argument("Environment variable name cannot be empty");
  }
  if (key.find('=') != std::string_view::npos || key.find('\0') != std::string_view::npos) {
    throw invalid_argument("Invalid environment variable name '{}'", key);
  }
}
}  // namespace

EnvCache EnvCache::FromProcessEnvironment(WithProcessUpdate withProcessUpdate) {
  EnvCache envCache(withProcessUpdate);
  for (char **envp = environ; envp != nullptr && *envp != nullptr; ++envp) {
    std::string_view entry(*envp);
    const auto eqPos = entry.find('=');
    if (eqPos == std::string_view::npos || eqPos == 0) {
      continue;
    }
    envCache._vars.insert_or_assign(string(entry.substr(0, eqPos)), string(entry.substr(eqPos + 1)));
  }
  log::debug("Loaded {} environment variables", envCache._vars.size());
  return envCache;
}

EnvCache::EnvCache(EnvCache &&rhs) noexcept : _withProcessUpdate(rhs._withProcessUpdate) {
  std::lock_guard<std::mutex> guard(rhs._mutex);
  _vars = std::move(rhs._vars);
}

EnvCache &EnvCache::operator=(EnvCache &&rhs) noexcept {
  if (&rhs != this) {
    std::scoped_lock lock(_mutex, rhs._mutex);
    _vars = std::move(rhs._vars);
    _withProcessUpdate = rhs._withProcessUpdate;
  }
  return *this;
}

void EnvCache::set(std::string_view key, std::string_view value) {
  CheckKey(key);
  string keyStr(key);
  string valueStr(value);

  std::lock_guard<std::mutex> guard(_mutex);
  if (isBoundToProcess() && ::setenv(keyStr.c_str(), valueStr.c_str(), 1) != 0) {
    throw exception("Unable to set environment variable {}: {}", keyStr, std::strerror(errno));
  }
  _vars.insert_or_assign(std::move(keyStr), std::move(valueStr));
}

string EnvCache::get(std::string_view key) const {
  auto optValue = find(key);
  if (!optValue) {
    throw env_error("Environment variable not found: {}", key);
  }
  return std::move(*optValue);
}

std::optional<string> EnvCache::find(std::string_view key) const {
  if (key.empty()) {
    return std::nullopt;
  }
  std::lock_guard<std::mutex> guard(_mutex);
  if (isBoundToProcess()) {
    string keyStr(key);
    // getenv is not thread safe with setenv, both are called under the lock
    const char *processValue = std::getenv(keyStr.c_str());
    if (processValue != nullptr) {
      return string(processValue);
    }
  }
  auto it = _vars.find(key);
  if (it == _vars.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool EnvCache::erase(std::string_view key) {
  CheckKey(key);
  std::lock_guard<std::mutex> guard(_mutex);
  bool erased = false;
  if (isBoundToProcess()) {
    string keyStr(key);
    erased = std::getenv(keyStr.c_str()) != nullptr;
    if (::unsetenv(keyStr.c_str()) != 0) {
      throw exception("Unable to unset environment variable {}: {}", keyStr, std::strerror(errno));
    }
  }
  auto it = _vars.find(key);
  if (it != _vars.end()) {
    _vars.erase(it);
    erased = true;
  }
  return erased;
}

EnvCache::Entries EnvCache::all() const {
  std::lock_guard<std::mutex> guard(_mutex);
  return {_vars.begin(), _vars.end()};
}

std::size_t EnvCache::size() const {
  std::lock_guard<std::mutex> guard(_mutex);
  return _vars.size();
}

ProgramArguments::ProgramArguments(int argc, const char *const *argv) {
  if (argc < 0) {
    throw invalid_argument("Invalid number of arguments {}", argc);
  }
  _args.reserve(static_cast<std::size_t>(argc));
  for (int argPos = 0; argPos < argc; ++argPos) {
    _args.emplace_back(argv[argPos]);
  }
}

std::vector<string> ProgramArguments::args() const {
  if (_args.empty()) {
    return {};
  }
  return {_args.begin() + 1, _args.end()};
}

string ProgramArguments::fullStr() const { return Join<string>(_args, " "); }

string ProgramArguments::str() const { return Join<string>(args(), " "); }

}  // namespace sysx
