// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Kvdns, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace kvdns
{
namespace network
{
namespace dns
{

/// \brief DNS record types. Only A and AAAA are served; any other 16-bit
/// value is carried through unchanged.
enum class DnsType : std::uint16_t
{
  A = 1,            ///< IPv4 address
  NS = 2,           ///< Name server
  CNAME = 5,        ///< Canonical name
  SOA = 6,          ///< Start of authority
  PTR = 12,         ///< Pointer record
  MX = 15,          ///< Mail exchange
  TXT = 16,         ///< Text record
  AAAA = 28,        ///< IPv6 address
  ANY = 255         ///< All records
};

/// \brief DNS record class (RFC 1035). Only IN is served.
enum class DnsClass : std::uint16_t
{
  IN = 1,           ///< Internet class
  CS = 2,           ///< CSNET class (obsolete)
  CH = 3,           ///< CHAOS class
  HS = 4,           ///< Hesiod class
  ANY = 255         ///< Any class
};

/// \brief DNS response codes used by this server
enum class DnsResponseCode : std::uint8_t
{
  NOERROR = 0,      ///< No error
  FORMERR = 1,      ///< Format error
  SERVFAIL = 2,     ///< Server failure
  NXDOMAIN = 3      ///< Name does not exist
};

namespace constants
{
  constexpr std::uint16_t DNS_DEFAULT_PORT = 1053;
  constexpr std::size_t DNS_HEADER_SIZE = 12;
  constexpr std::size_t DNS_MAX_UDP_SIZE = 512;
  constexpr std::size_t DNS_MAX_LABEL_SIZE = 63;
  constexpr std::size_t DNS_MAX_NAME_SIZE = 255;       ///< Encoded octets, root label included
  constexpr std::uint16_t DNS_FLAG_RESPONSE = 1 << 15;
  constexpr std::uint16_t DNS_RCODE_MASK = 0x000F;
  constexpr std::uint32_t DNS_DEFAULT_TTL = 1800;
  constexpr std::size_t IPV4_ADDRESS_SIZE = 4;
  constexpr std::size_t IPV6_ADDRESS_SIZE = 16;
} // namespace constants

/// \brief Fixed 12-byte message header. Flags are kept raw; this server only
/// ever sets QR and, under the NXDOMAIN policy, RCODE.
struct DnsHeader
{
  std::uint16_t id = 0;             ///< Transaction identifier, echoed verbatim
  std::uint16_t flags = 0;          ///< Raw flag word
  std::uint16_t qdcount = 0;        ///< Question count
  std::uint16_t ancount = 0;        ///< Answer count
  std::uint16_t nscount = 0;        ///< Authority count
  std::uint16_t arcount = 0;        ///< Additional count

  bool isResponse() const { return (flags & constants::DNS_FLAG_RESPONSE) != 0; }

  DnsResponseCode rcode() const
  {
    return static_cast<DnsResponseCode>(flags & constants::DNS_RCODE_MASK);
  }

  void setRcode(DnsResponseCode code)
  {
    flags = static_cast<std::uint16_t>((flags & ~constants::DNS_RCODE_MASK) |
                                       static_cast<std::uint16_t>(code));
  }

  bool operator==(const DnsHeader &other) const
  {
    return id == other.id && flags == other.flags && qdcount == other.qdcount &&
           ancount == other.ancount && nscount == other.nscount && arcount == other.arcount;
  }
  bool operator!=(const DnsHeader &other) const { return !(*this == other); }
};

/// \brief Question section entry
struct DnsQuestion
{
  std::string qname;                ///< Dot-joined labels, case as received
  DnsType qtype;                    ///< Query type
  DnsClass qclass;                  ///< Query class

  DnsQuestion(const std::string &name = "", DnsType type = DnsType::A,
              DnsClass cls = DnsClass::IN)
    : qname(name), qtype(type), qclass(cls)
  {
  }

  bool operator==(const DnsQuestion &other) const
  {
    return qname == other.qname && qtype == other.qtype && qclass == other.qclass;
  }
  bool operator!=(const DnsQuestion &other) const { return !(*this == other); }
};

/// \brief Answer, authority or additional section entry.
///
/// rdlength mirrors rdata.size() for decoded records; the encoder always
/// writes the actual size.
struct DnsResourceRecord
{
  std::string name;                 ///< Domain name
  DnsType type;                     ///< Record type
  DnsClass cls;                     ///< Record class
  std::uint32_t ttl;                ///< Time to live (seconds)
  std::uint16_t rdlength;           ///< Resource data length
  std::vector<std::uint8_t> rdata;  ///< Resource data (raw)

  DnsResourceRecord(const std::string &n = "", DnsType t = DnsType::A,
                    DnsClass c = DnsClass::IN, std::uint32_t ttlValue = 0,
                    std::vector<std::uint8_t> data = {})
    : name(n), type(t), cls(c), ttl(ttlValue),
      rdlength(static_cast<std::uint16_t>(data.size())), rdata(std::move(data))
  {
  }

  bool operator==(const DnsResourceRecord &other) const
  {
    return name == other.name && type == other.type && cls == other.cls && ttl == other.ttl &&
           rdlength == other.rdlength && rdata == other.rdata;
  }
  bool operator!=(const DnsResourceRecord &other) const { return !(*this == other); }
};

/// \brief A whole message; lives for one request only.
struct DnsMessage
{
  DnsHeader header;
  std::vector<DnsQuestion> questions;
  std::vector<DnsResourceRecord> answers;
  std::vector<DnsResourceRecord> authority;
  std::vector<DnsResourceRecord> additional;

  bool operator==(const DnsMessage &other) const
  {
    return header == other.header && questions == other.questions && answers == other.answers &&
           authority == other.authority && additional == other.additional;
  }
  bool operator!=(const DnsMessage &other) const { return !(*this == other); }
};

inline std::string toString(DnsType type)
{
  switch (type)
  {
  case DnsType::A:
    return "A";
  case DnsType::NS:
    return "NS";
  case DnsType::CNAME:
    return "CNAME";
  case DnsType::SOA:
    return "SOA";
  case DnsType::PTR:
    return "PTR";
  case DnsType::MX:
    return "MX";
  case DnsType::TXT:
    return "TXT";
  case DnsType::AAAA:
    return "AAAA";
  case DnsType::ANY:
    return "ANY";
  }
  return "TYPE" + std::to_string(static_cast<std::uint16_t>(type));
}

} // namespace dns
} // namespace network
} // namespace kvdns
