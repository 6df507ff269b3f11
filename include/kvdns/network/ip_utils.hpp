// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Kvdns, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include <arpa/inet.h>
#include <array>
#include <cstdint>
#include <cstring>
#include <optional>
#include <string>
#include <vector>

namespace kvdns
{
namespace network
{

/// \brief An IP address in 16-byte form; IPv4 is held v4-mapped
/// (::ffff:a.b.c.d).
using IpAddress16 = std::array<std::uint8_t, 16>;

/// \brief Parse an IPv4 or IPv6 literal.
/// \return std::nullopt when \p text is neither.
inline std::optional<IpAddress16> parseIpAddress(const std::string &text)
{
  IpAddress16 address{};

  in_addr v4;
  if (inet_pton(AF_INET, text.c_str(), &v4) == 1)
  {
    address[10] = 0xff;
    address[11] = 0xff;
    std::memcpy(address.data() + 12, &v4, 4);
    return address;
  }

  in6_addr v6;
  if (inet_pton(AF_INET6, text.c_str(), &v6) == 1)
  {
    std::memcpy(address.data(), &v6, 16);
    return address;
  }
  return std::nullopt;
}

/// \brief True for ::ffff:0:0/96
inline bool isV4Mapped(const IpAddress16 &address)
{
  for (std::size_t i = 0; i < 10; ++i)
  {
    if (address[i] != 0)
    {
      return false;
    }
  }
  return address[10] == 0xff && address[11] == 0xff;
}

/// \brief Last four bytes, the IPv4 part of a v4-mapped address.
inline std::vector<std::uint8_t> ipv4Bytes(const IpAddress16 &address)
{
  return std::vector<std::uint8_t>(address.begin() + 12, address.end());
}

inline std::vector<std::uint8_t> ipv6Bytes(const IpAddress16 &address)
{
  return std::vector<std::uint8_t>(address.begin(), address.end());
}

} // namespace network
} // namespace kvdns
