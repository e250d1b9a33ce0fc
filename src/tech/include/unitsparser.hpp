#pragma once

#include <cstdint>
#include <span>
#include <string_view>

#include "sysx_string.hpp"

namespace sysx {

/// Parses a human readable number of bytes.
/// It should be made of integral numbers (decimals are refused), each possibly followed by one of these units:
///  - T, G, M, k for multiples of 1000
///  - Ti, Gi, Mi, Ki for multiples of 1024
/// Several groups are summed, for instance "1Mi256Ki" is 1310720.
int64_t ParseNumberOfBytes(std::string_view sizeStr);

/// Writes to 'buf' the representation of 'numberOfBytes' with binary units (Ti, Gi, Mi, Ki).
/// Throws if 'buf' is too small. Returns the written part of 'buf'.
std::span<char> BytesToBuffer(int64_t numberOfBytes, std::span<char> buf);

string BytesToStr(int64_t numberOfBytes);

}  // namespace sysx
