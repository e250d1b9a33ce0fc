#pragma once

#include <cstdint>
#include <string_view>

namespace sysx {

/// Parse a log level name (off|critical|error|warning|info|debug|trace) or its position as a single digit (0-6)
/// and return its position, from 0 (off) to 6 (trace).
int8_t LogPosFromLogStr(std::string_view logStr);

}  // namespace sysx
