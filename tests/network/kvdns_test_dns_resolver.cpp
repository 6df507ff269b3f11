// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Kvdns, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

using namespace kvdns::network::dns;
using kvdns::storage::InMemoryKeyLookup;
using kvdns::storage::KeyLookup;
using kvdns::storage::KeyLookupException;

namespace
{
class FailingLookup : public KeyLookup
{
public:
  std::string get(const std::string &) override
  {
    throw KeyLookupException("connection refused");
  }
};

class CountingLookup : public InMemoryKeyLookup
{
public:
  std::string get(const std::string &key) override
  {
    ++calls;
    return InMemoryKeyLookup::get(key);
  }

  int calls = 0;
};

std::shared_ptr<InMemoryKeyLookup> sampleStore()
{
  auto store = std::make_shared<InMemoryKeyLookup>();
  store->set("foo.ip4", "127.0.0.1");
  store->set("bar.ip6", "::1");
  store->set("plain.example", "10.0.0.1");
  store->set("bad.ip4", "not-an-address");
  return store;
}

std::vector<std::uint8_t> loopback6()
{
  std::vector<std::uint8_t> bytes(16, 0);
  bytes[15] = 1;
  return bytes;
}
} // namespace

TEST_CASE("Resolver answers A for ip4 names", "[resolver]")
{
  kvdns::test::initializeTestLogging();
  Resolver resolver(sampleStore());

  auto result = resolver.resolve(DnsQuestion("foo.ip4", DnsType::A, DnsClass::IN));
  REQUIRE_FALSE(result.miss);
  REQUIRE(result.answers.size() == 1);
  REQUIRE(result.authorities.empty());
  REQUIRE(result.additionals.empty());

  const auto &answer = result.answers[0];
  REQUIRE(answer.name == "foo.ip4");
  REQUIRE(answer.type == DnsType::A);
  REQUIRE(answer.cls == DnsClass::IN);
  REQUIRE(answer.ttl == 1800);
  REQUIRE(answer.rdlength == 4);
  REQUIRE(answer.rdata == std::vector<std::uint8_t>{127, 0, 0, 1});

  SECTION("AAAA against an ip4 name yields nothing")
  {
    auto aaaa = resolver.resolve(DnsQuestion("foo.ip4", DnsType::AAAA, DnsClass::IN));
    REQUIRE(aaaa.answers.empty());
    REQUIRE(aaaa.authorities.empty());
    REQUIRE(aaaa.additionals.empty());
    REQUIRE_FALSE(aaaa.miss);
  }
}

TEST_CASE("Resolver answers AAAA for ip6 names", "[resolver]")
{
  Resolver resolver(sampleStore());

  auto result = resolver.resolve(DnsQuestion("bar.ip6", DnsType::AAAA, DnsClass::IN));
  REQUIRE(result.answers.size() == 1);
  REQUIRE(result.answers[0].type == DnsType::AAAA);
  REQUIRE(result.answers[0].rdlength == 16);
  REQUIRE(result.answers[0].rdata == loopback6());
  REQUIRE(result.additionals.empty());

  SECTION("A against an ip6 name puts AAAA in the additional section")
  {
    auto a = resolver.resolve(DnsQuestion("bar.ip6", DnsType::A, DnsClass::IN));
    REQUIRE(a.answers.empty());
    REQUIRE(a.authorities.empty());
    REQUIRE(a.additionals.size() == 1);
    REQUIRE(a.additionals[0].type == DnsType::AAAA);
    REQUIRE(a.additionals[0].ttl == 1800);
    REQUIRE(a.additionals[0].rdata == loopback6());
  }
}

TEST_CASE("Resolver uses the configured TTL", "[resolver][config]")
{
  ResolverConfig config;
  config.ttl = 60;
  Resolver resolver(sampleStore(), config);

  auto result = resolver.resolve(DnsQuestion("foo.ip4", DnsType::A, DnsClass::IN));
  REQUIRE(result.answers.size() == 1);
  REQUIRE(result.answers[0].ttl == 60);
}

TEST_CASE("Resolver returns nothing for unsupported queries", "[resolver]")
{
  auto store = std::make_shared<CountingLookup>();
  store->set("foo.ip4", "127.0.0.1");
  Resolver resolver(store);

  SECTION("Non-IN class does not touch the store")
  {
    auto result = resolver.resolve(DnsQuestion("foo.ip4", DnsType::A, DnsClass::CH));
    REQUIRE(result.answers.empty());
    REQUIRE_FALSE(result.miss);
    REQUIRE(store->calls == 0);
  }

  SECTION("Types other than A and AAAA do not touch the store")
  {
    kvdns::test::initializeTestLogging();
    std::vector<std::string> lines;
    kvdns::core::Logger::setExternalHandler(
      [&lines](kvdns::core::Logger::Level, const std::string &, const std::string &raw)
      { lines.push_back(raw); });

    auto result = resolver.resolve(DnsQuestion("foo.ip4", DnsType::MX, DnsClass::IN));
    auto other = resolver.resolve(
      DnsQuestion("foo.ip4", static_cast<DnsType>(99), DnsClass::IN));
    kvdns::core::Logger::clearExternalHandler();

    REQUIRE(result.answers.empty());
    REQUIRE(other.answers.empty());
    REQUIRE(store->calls == 0);
    REQUIRE(lines.size() == 2);
    REQUIRE(lines[0] == "Ignoring MX question for 'foo.ip4'");
    REQUIRE(lines[1] == "Ignoring TYPE99 question for 'foo.ip4'");
  }

  SECTION("Names without ip4 or ip6 produce no records")
  {
    store->set("plain.example", "10.0.0.1");
    auto result = resolver.resolve(DnsQuestion("plain.example", DnsType::A, DnsClass::IN));
    REQUIRE(result.answers.empty());
    REQUIRE(result.additionals.empty());
    REQUIRE_FALSE(result.miss);
    REQUIRE(store->calls == 1);
  }
}

TEST_CASE("Resolver misses", "[resolver][miss]")
{
  SECTION("Absent key")
  {
    Resolver resolver(sampleStore());
    auto result = resolver.resolve(DnsQuestion("nothere.ip4", DnsType::A, DnsClass::IN));
    REQUIRE(result.miss);
    REQUIRE(result.answers.empty());
  }

  SECTION("Unparseable stored value")
  {
    Resolver resolver(sampleStore());
    auto result = resolver.resolve(DnsQuestion("bad.ip4", DnsType::A, DnsClass::IN));
    REQUIRE(result.miss);
    REQUIRE(result.answers.empty());
  }

  SECTION("Store failure")
  {
    Resolver resolver(std::make_shared<FailingLookup>());
    auto result = resolver.resolve(DnsQuestion("foo.ip4", DnsType::A, DnsClass::IN));
    REQUIRE(result.miss);
    REQUIRE(result.answers.empty());
  }
}

TEST_CASE("Placement policy is replaceable", "[resolver][policy]")
{
  auto alwaysA = [](const std::string &, DnsType type)
  { return type == DnsType::A ? RecordPlacement::AnswerA : RecordPlacement::None; };
  Resolver resolver(sampleStore(), ResolverConfig{}, alwaysA);

  auto result = resolver.resolve(DnsQuestion("plain.example", DnsType::A, DnsClass::IN));
  REQUIRE(result.answers.size() == 1);
  REQUIRE(result.answers[0].rdata == std::vector<std::uint8_t>{10, 0, 0, 1});
}

TEST_CASE("Naming convention placement", "[resolver][policy]")
{
  REQUIRE(namingConventionPlacement("a.ip4", DnsType::A) == RecordPlacement::AnswerA);
  REQUIRE(namingConventionPlacement("a.ip4", DnsType::AAAA) == RecordPlacement::None);
  REQUIRE(namingConventionPlacement("a.ip6", DnsType::AAAA) == RecordPlacement::AnswerAAAA);
  REQUIRE(namingConventionPlacement("a.ip6", DnsType::A) == RecordPlacement::AdditionalAAAA);
  REQUIRE(namingConventionPlacement("ip4.ip6", DnsType::AAAA) == RecordPlacement::None);
  REQUIRE(namingConventionPlacement("example.com", DnsType::A) == RecordPlacement::None);
}

TEST_CASE("Resolver rejects missing collaborators", "[resolver]")
{
  REQUIRE_THROWS_AS(Resolver(nullptr), std::invalid_argument);
  REQUIRE_THROWS_AS(Resolver(sampleStore(), ResolverConfig{}, nullptr), std::invalid_argument);
}
