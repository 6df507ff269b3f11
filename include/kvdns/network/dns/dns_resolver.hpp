// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Kvdns, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <kvdns/core/logger.hpp>
#include <kvdns/network/dns/dns_types.hpp>
#include <kvdns/network/ip_utils.hpp>
#include <kvdns/storage/key_lookup.hpp>

namespace kvdns
{
namespace network
{
namespace dns
{

/// \brief Where a looked-up address ends up in the response
enum class RecordPlacement
{
  None,           ///< Nothing is synthesized
  AnswerA,        ///< A record (last 4 bytes) in the answer section
  AnswerAAAA,     ///< AAAA record (16 bytes) in the answer section
  AdditionalAAAA  ///< AAAA record in the additional section
};

/// \brief Chooses the placement from the queried name and type.
using RecordPlacementPolicy = std::function<RecordPlacement(const std::string &, DnsType)>;

/// \brief Default placement: the name itself says which family it holds.
///
/// A name containing "ip4" answers A queries only. A name containing "ip6"
/// answers AAAA queries, and for any other type the AAAA record goes to the
/// additional section. "ip4" is checked first. Other names get nothing.
inline RecordPlacement namingConventionPlacement(const std::string &name, DnsType type)
{
  if (name.find("ip4") != std::string::npos)
  {
    return type == DnsType::A ? RecordPlacement::AnswerA : RecordPlacement::None;
  }
  if (name.find("ip6") != std::string::npos)
  {
    return type == DnsType::AAAA ? RecordPlacement::AnswerAAAA : RecordPlacement::AdditionalAAAA;
  }
  return RecordPlacement::None;
}

struct ResolverConfig
{
  std::uint32_t ttl = constants::DNS_DEFAULT_TTL; ///< TTL of every synthesized record
  bool nxdomainOnMiss = false;                    ///< Answer NXDOMAIN when a lookup misses
};

struct ResolveResult
{
  std::vector<DnsResourceRecord> answers;
  std::vector<DnsResourceRecord> authorities;
  std::vector<DnsResourceRecord> additionals;
  bool miss = false; ///< The store had no usable value for the name
};

/// \brief Answers A/AAAA questions for class IN from a key-value store.
///
/// The store is keyed by the question name as received and holds an IPv4 or
/// IPv6 literal. Thread-safe as long as the KeyLookup is.
class Resolver
{
public:
  Resolver(std::shared_ptr<storage::KeyLookup> lookup, ResolverConfig config = {},
           RecordPlacementPolicy placement = namingConventionPlacement)
      : _lookup(std::move(lookup)), _config(config), _placement(std::move(placement))
  {
    if (!_lookup)
    {
      throw std::invalid_argument("Resolver requires a key lookup");
    }
    if (!_placement)
    {
      throw std::invalid_argument("Resolver requires a placement policy");
    }
  }

  const ResolverConfig &config() const { return _config; }

  ResolveResult resolve(const DnsQuestion &question) const
  {
    ResolveResult result;
    if (question.qclass != DnsClass::IN)
    {
      return result;
    }
    if (question.qtype != DnsType::A && question.qtype != DnsType::AAAA)
    {
      KVDNS_LOG_DEBUG("Ignoring " << toString(question.qtype) << " question for '"
                                  << question.qname << "'");
      return result;
    }

    std::string value;
    try
    {
      value = _lookup->get(question.qname);
    }
    catch (const storage::KeyLookupException &e)
    {
      KVDNS_LOG_ERROR("Lookup of '" << question.qname << "' failed: " << e.what());
      result.miss = true;
      return result;
    }

    if (value.empty())
    {
      KVDNS_LOG_DEBUG("No entry for '" << question.qname << "' (" << toString(question.qtype)
                                       << ")");
      result.miss = true;
      return result;
    }

    auto address = parseIpAddress(value);
    if (!address)
    {
      KVDNS_LOG_ERROR("LookupFailure: value '" << value << "' stored for '" << question.qname
                                               << "' is not an IP address");
      result.miss = true;
      return result;
    }

    switch (_placement(question.qname, question.qtype))
    {
    case RecordPlacement::AnswerA:
      result.answers.emplace_back(question.qname, DnsType::A, DnsClass::IN, _config.ttl,
                                  ipv4Bytes(*address));
      break;
    case RecordPlacement::AnswerAAAA:
      result.answers.emplace_back(question.qname, DnsType::AAAA, DnsClass::IN, _config.ttl,
                                  ipv6Bytes(*address));
      break;
    case RecordPlacement::AdditionalAAAA:
      result.additionals.emplace_back(question.qname, DnsType::AAAA, DnsClass::IN, _config.ttl,
                                      ipv6Bytes(*address));
      break;
    case RecordPlacement::None:
      break;
    }
    return result;
  }

private:
  std::shared_ptr<storage::KeyLookup> _lookup;
  ResolverConfig _config;
  RecordPlacementPolicy _placement;
};

} // namespace dns
} // namespace network
} // namespace kvdns
