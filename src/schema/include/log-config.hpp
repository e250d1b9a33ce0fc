#pragma once

#include <cstdint>

#include "sysx_string.hpp"

namespace sysx::schema {

struct LogConfig {
  string consoleLevel{"info"};
  string fileLevel{"off"};
  string maxFileSize{"5Mi"};  // number of bytes, with optional unit suffixes (k, Ki, M, Mi, ...)
  int32_t maxNbFiles{10};
};

}  // namespace sysx::schema
