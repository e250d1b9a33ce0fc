#pragma once

#include <array>
#include <compare>
#include <cstdint>
#include <optional>
#include <string_view>

#include "sysx_string.hpp"

namespace sysx {

struct SocketAddrV4 {
  auto operator<=>(const SocketAddrV4 &) const noexcept = default;

  /// "a.b.c.d:port"
  string toString() const;

  std::array<uint8_t, 4> octets{};
  uint16_t port{};
};

struct SocketAddrV6 {
  auto operator<=>(const SocketAddrV6 &) const noexcept = default;

  /// "[addr]:port", or "[addr%scope]:port" for a non zero scope id. Address is in its canonical compressed form.
  string toString() const;

  std::array<uint8_t, 16> address{};
  uint16_t port{};
  uint32_t flowInfo{};
  uint32_t scopeId{};
};

/// Tells whether 'str' is an IPv4 socket address "a.b.c.d:port" with decimal octets in [0, 255].
bool IsValidIPv4(std::string_view str);

std::optional<SocketAddrV4> ParseIPv4(std::string_view str);

/// Tells whether 'str' is an IPv6 socket address "[addr]:port", where addr may be followed by a numeric "%scope".
bool IsValidIPv6(std::string_view str);

std::optional<SocketAddrV6> ParseIPv6(std::string_view str);

/// Build an IPv6 socket address from its parts, if 'ip' is a valid IPv6 address (without brackets).
std::optional<SocketAddrV6> CreateIPv6Socket(std::string_view ip, uint16_t port, uint32_t flowInfo = 0,
                                             uint32_t scopeId = 0);

}  // namespace sysx
