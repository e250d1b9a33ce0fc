#include "socket-address.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>

#include <algorithm>
#include <charconv>
#include <concepts>
#include <cstdint>
#include <cstring>
#include <optional>
#include <string_view>
#include <system_error>

#include "sysx_format.hpp"
#include "sysx_string.hpp"

namespace sysx {

namespace {

// Only plain decimal digits are accepted, without sign nor spaces.
template <std::unsigned_integral T>
std::optional<T> ParseDecimal(std::string_view str) {
  if (str.empty() || !std::ranges::all_of(str, [](char ch) { return ch >= '0' && ch <= '9'; })) {
    return std::nullopt;
  }
  T ret;
  const char *endPtr = str.data() + str.size();
  const auto [ptr, errc] = std::from_chars(str.data(), endPtr, ret);
  if (errc != std::errc() || ptr != endPtr) {
    return std::nullopt;
  }
  return ret;
}

std::optional<std::array<uint8_t, 16>> ParseIPv6Address(std::string_view ip) {
  // inet_pton needs a null terminated string
  static constexpr std::size_t kMaxIPv6Len = INET6_ADDRSTRLEN;
  if (ip.empty() || ip.size() >= kMaxIPv6Len) {
    return std::nullopt;
  }
  char buf[kMaxIPv6Len];
  std::memcpy(buf, ip.data(), ip.size());
  buf[ip.size()] = '\0';

  in6_addr addr;
  if (::inet_pton(AF_INET6, buf, &addr) != 1) {
    return std::nullopt;
  }
  std::array<uint8_t, 16> ret;
  std::memcpy(ret.data(), addr.s6_addr, ret.size());
  return ret;
}

}  // namespace

string SocketAddrV4::toString() const {
  return sysx::format("{}.{}.{}.{}:{}", octets[0], octets[1], octets[2], octets[3], port);
}

string SocketAddrV6::toString() const {
  in6_addr addr;
  std::memcpy(addr.s6_addr, address.data(), address.size());
  char buf[INET6_ADDRSTRLEN];
  if (::inet_ntop(AF_INET6, &addr, buf, sizeof(buf)) == nullptr) {
    return {};
  }
  if (scopeId != 0) {
    return sysx::format("[{}%{}]:{}", buf, scopeId, port);
  }
  return sysx::format("[{}]:{}", buf, port);
}

std::optional<SocketAddrV4> ParseIPv4(std::string_view str) {
  const auto colonPos = str.find(':');
  if (colonPos == std::string_view::npos || str.find(':', colonPos + 1) != std::string_view::npos) {
    return std::nullopt;
  }
  const auto port = ParseDecimal<uint16_t>(str.substr(colonPos + 1));
  if (!port) {
    return std::nullopt;
  }

  SocketAddrV4 socketAddr;
  socketAddr.port = *port;

  std::string_view ipStr = str.substr(0, colonPos);
  for (std::size_t octetPos = 0; octetPos < socketAddr.octets.size(); ++octetPos) {
    const auto dotPos = ipStr.find('.');
    const bool isLast = octetPos + 1 == socketAddr.octets.size();
    if ((dotPos == std::string_view::npos) != isLast) {
      return std::nullopt;
    }
    const auto octet = ParseDecimal<uint8_t>(ipStr.substr(0, dotPos));
    if (!octet) {
      return std::nullopt;
    }
    socketAddr.octets[octetPos] = *octet;
    if (!isLast) {
      ipStr.remove_prefix(dotPos + 1);
    }
  }
  return socketAddr;
}

bool IsValidIPv4(std::string_view str) { return ParseIPv4(str).has_value(); }

std::optional<SocketAddrV6> ParseIPv6(std::string_view str) {
  if (str.empty() || str.front() != '[') {
    return std::nullopt;
  }
  const auto closingPos = str.find("]:");
  if (closingPos == std::string_view::npos) {
    return std::nullopt;
  }
  const auto port = ParseDecimal<uint16_t>(str.substr(closingPos + 2));
  if (!port) {
    return std::nullopt;
  }

  std::string_view ipStr = str.substr(1, closingPos - 1);
  uint32_t scopeId = 0;
  const auto scopePos = ipStr.find('%');
  if (scopePos != std::string_view::npos) {
    const auto optScopeId = ParseDecimal<uint32_t>(ipStr.substr(scopePos + 1));
    if (!optScopeId) {
      return std::nullopt;
    }
    scopeId = *optScopeId;
    ipStr = ipStr.substr(0, scopePos);
  }
  return CreateIPv6Socket(ipStr, *port, 0, scopeId);
}

bool IsValidIPv6(std::string_view str) { return ParseIPv6(str).has_value(); }

std::optional<SocketAddrV6> CreateIPv6Socket(std::string_view ip, uint16_t port, uint32_t flowInfo,
                                             uint32_t scopeId) {
  const auto address = ParseIPv6Address(ip);
  if (!address) {
    return std::nullopt;
  }
  return SocketAddrV6{*address, port, flowInfo, scopeId};
}

}  // namespace sysx
