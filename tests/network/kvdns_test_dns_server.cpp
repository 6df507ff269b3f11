// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Kvdns, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>
#include <condition_variable>
#include <mutex>

using namespace kvdns::network::dns;
using kvdns::storage::InMemoryKeyLookup;

namespace
{
std::shared_ptr<const Resolver> makeResolver(ResolverConfig config = {})
{
  auto store = std::make_shared<InMemoryKeyLookup>();
  store->set("foo.ip4", "127.0.0.1");
  store->set("bar.ip6", "::1");
  return std::make_shared<const Resolver>(store, config);
}

DnsServerConfig testConfig()
{
  DnsServerConfig config;
  config.bindAddress = "127.0.0.1";
  config.port = "0";
  config.minThreads = 1;
  config.maxThreads = 2;
  config.pollInterval = std::chrono::milliseconds(20);
  return config;
}

/// Stops the loop and joins its thread even when a REQUIRE bails out
struct RunningServer
{
  DnsServer &server;
  std::thread loop;

  explicit RunningServer(DnsServer &s) : server(s)
  {
    server.bind();
    loop = std::thread([this]() { server.run(); });
  }

  ~RunningServer() { stop(); }

  void stop()
  {
    server.stop();
    if (loop.joinable())
    {
      loop.join();
    }
  }
};

/// KeyLookup whose get() blocks until open() is called
class GatedLookup : public kvdns::storage::KeyLookup
{
public:
  std::string get(const std::string &key) override
  {
    std::unique_lock<std::mutex> lock(_mutex);
    ++_entered;
    _changed.notify_all();
    _changed.wait(lock, [this]() { return _open; });
    return key == "foo.ip4" ? "127.0.0.1" : "";
  }

  bool waitEntered(int count, std::chrono::milliseconds timeout)
  {
    std::unique_lock<std::mutex> lock(_mutex);
    return _changed.wait_for(lock, timeout, [this, count]() { return _entered >= count; });
  }

  int entered()
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _entered;
  }

  void open()
  {
    {
      std::lock_guard<std::mutex> lock(_mutex);
      _open = true;
    }
    _changed.notify_all();
  }

private:
  std::mutex _mutex;
  std::condition_variable _changed;
  int _entered = 0;
  bool _open = false;
};

/// Releases blocked lookups before the server is torn down
struct OpenOnExit
{
  GatedLookup &lookup;
  ~OpenOnExit() { lookup.open(); }
};

/// Collects log messages for the lifetime of the object
class LogCapture
{
public:
  LogCapture()
  {
    kvdns::core::Logger::setExternalHandler(
      [this](kvdns::core::Logger::Level, const std::string &, const std::string &raw)
      {
        {
          std::lock_guard<std::mutex> lock(_mutex);
          _lines.push_back(raw);
        }
        _changed.notify_all();
      });
  }

  ~LogCapture() { kvdns::core::Logger::clearExternalHandler(); }

  bool waitFor(const std::string &text, std::size_t count, std::chrono::milliseconds timeout)
  {
    std::unique_lock<std::mutex> lock(_mutex);
    return _changed.wait_for(lock, timeout,
                             [&]()
                             {
                               std::size_t found = 0;
                               for (const auto &line : _lines)
                               {
                                 if (line.find(text) != std::string::npos)
                                 {
                                   ++found;
                                 }
                               }
                               return found >= count;
                             });
  }

private:
  std::mutex _mutex;
  std::condition_variable _changed;
  std::vector<std::string> _lines;
};

DnsMessage respond(const DnsServer &server, const std::vector<std::uint8_t> &request)
{
  auto response = server.processRequest(request);
  REQUIRE(response.has_value());
  return DnsCodec::decodeStrict(*response);
}
} // namespace

//
// Per-request processing
//
TEST_CASE("DnsServer answers stored names", "[server][process]")
{
  kvdns::test::initializeTestLogging();
  DnsServer server(testConfig(), makeResolver());

  SECTION("A for an ip4 name")
  {
    DnsMessage response = respond(server, kvdns::test::buildQuery(0x1234, "foo.ip4", DnsType::A));
    REQUIRE(response.header.id == 0x1234);
    REQUIRE(response.header.flags == constants::DNS_FLAG_RESPONSE);
    REQUIRE(response.header.rcode() == DnsResponseCode::NOERROR);
    REQUIRE(response.questions.size() == 1);
    REQUIRE(response.questions[0] == DnsQuestion("foo.ip4", DnsType::A, DnsClass::IN));
    REQUIRE(response.answers.size() == 1);
    REQUIRE(response.answers[0].rdata == std::vector<std::uint8_t>{127, 0, 0, 1});
    REQUIRE(response.answers[0].ttl == 1800);
  }

  SECTION("AAAA for an ip6 name")
  {
    DnsMessage response = respond(server, kvdns::test::buildQuery(7, "bar.ip6", DnsType::AAAA));
    REQUIRE(response.answers.size() == 1);
    REQUIRE(response.answers[0].type == DnsType::AAAA);
    REQUIRE(response.answers[0].rdlength == 16);
  }

  SECTION("A for an ip6 name")
  {
    DnsMessage response = respond(server, kvdns::test::buildQuery(8, "bar.ip6", DnsType::A));
    REQUIRE(response.answers.empty());
    REQUIRE(response.authority.empty());
    REQUIRE(response.additional.size() == 1);
    REQUIRE(response.header.arcount == 1);
  }

  SECTION("Unknown name is an empty NOERROR response")
  {
    DnsMessage response = respond(server, kvdns::test::buildQuery(9, "nope.ip4", DnsType::A));
    REQUIRE(response.header.isResponse());
    REQUIRE(response.header.rcode() == DnsResponseCode::NOERROR);
    REQUIRE(response.header.ancount == 0);
    REQUIRE(response.answers.empty());
    REQUIRE(response.questions.size() == 1);
  }
}

TEST_CASE("DnsServer clears request flags", "[server][process]")
{
  DnsServer server(testConfig(), makeResolver());

  auto request = kvdns::test::buildQuery(5, "foo.ip4", DnsType::A);
  request[2] = 0x01; // RD
  request[3] = 0x20; // Z bit
  DnsMessage response = respond(server, request);
  REQUIRE(response.header.flags == constants::DNS_FLAG_RESPONSE);
}

TEST_CASE("DnsServer resolves every question in order", "[server][process]")
{
  DnsServer server(testConfig(), makeResolver());

  DnsMessage query;
  query.header.id = 77;
  query.questions.emplace_back("bar.ip6", DnsType::AAAA, DnsClass::IN);
  query.questions.emplace_back("missing.ip4", DnsType::A, DnsClass::IN);
  query.questions.emplace_back("foo.ip4", DnsType::A, DnsClass::IN);

  DnsMessage response = respond(server, DnsCodec::encode(query));
  REQUIRE(response.questions == query.questions);
  REQUIRE(response.header.qdcount == 3);
  REQUIRE(response.header.ancount == 2);
  REQUIRE(response.answers.size() == 2);
  REQUIRE(response.answers[0].name == "bar.ip6");
  REQUIRE(response.answers[1].name == "foo.ip4");
}

TEST_CASE("DnsServer recomputes counts from inconsistent queries", "[server][process][malformed]")
{
  DnsServer server(testConfig(), makeResolver());

  auto request = kvdns::test::buildQuery(3, "foo.ip4", DnsType::A);
  request[7] = 4;  // ancount
  request[11] = 2; // arcount

  auto response = server.processRequest(request);
  REQUIRE(response.has_value());
  DnsMessage decoded = DnsCodec::decodeStrict(*response);
  REQUIRE(decoded.header.qdcount == 1);
  REQUIRE(decoded.header.ancount == 1);
  REQUIRE(decoded.header.nscount == 0);
  REQUIRE(decoded.header.arcount == 0);
}

TEST_CASE("DnsServer malformed query policy", "[server][process][malformed]")
{
  auto truncated = kvdns::test::buildQuery(0x55AA, "foo.ip4", DnsType::A);
  truncated.resize(truncated.size() - 2);

  SECTION("Best effort answers from the partial question")
  {
    DnsServer server(testConfig(), makeResolver());
    auto response = server.processRequest(truncated);
    REQUIRE(response.has_value());
    DnsMessage decoded = DnsCodec::decodeStrict(*response);
    REQUIRE(decoded.header.id == 0x55AA);
    REQUIRE(decoded.header.isResponse());
    REQUIRE(decoded.questions.size() == 1);
    REQUIRE(decoded.questions[0].qname == "foo.ip4");
    REQUIRE(decoded.answers.empty());
  }

  SECTION("Best effort answers a short header with an empty response")
  {
    DnsServer server(testConfig(), makeResolver());
    auto response = server.processRequest(std::vector<std::uint8_t>{0x01});
    REQUIRE(response.has_value());
    REQUIRE(response->size() == constants::DNS_HEADER_SIZE);
  }

  SECTION("Drop sends nothing")
  {
    DnsServerConfig config = testConfig();
    config.malformedPolicy = MalformedQueryPolicy::Drop;
    DnsServer server(config, makeResolver());
    REQUIRE_FALSE(server.processRequest(truncated).has_value());
    REQUIRE(server.processRequest(kvdns::test::buildQuery(1, "foo.ip4", DnsType::A)).has_value());
  }
}

TEST_CASE("DnsServer NXDOMAIN policy", "[server][process][nxdomain]")
{
  ResolverConfig resolverConfig;
  resolverConfig.nxdomainOnMiss = true;
  DnsServer server(testConfig(), makeResolver(resolverConfig));

  DnsMessage miss = respond(server, kvdns::test::buildQuery(1, "nope.ip4", DnsType::A));
  REQUIRE(miss.header.rcode() == DnsResponseCode::NXDOMAIN);
  REQUIRE(miss.header.isResponse());

  DnsMessage hit = respond(server, kvdns::test::buildQuery(2, "foo.ip4", DnsType::A));
  REQUIRE(hit.header.rcode() == DnsResponseCode::NOERROR);
}

//
// Socket handling
//
TEST_CASE("DnsServer bind failures", "[server][socket]")
{
  SECTION("Unresolvable port")
  {
    DnsServerConfig config = testConfig();
    config.port = "not-a-port";
    DnsServer server(config, makeResolver());
    REQUIRE_THROWS_AS(server.bind(), DnsServerException);
  }

  SECTION("Port already in use")
  {
    DnsServer first(testConfig(), makeResolver());
    first.bind();
    REQUIRE(first.port() != 0);

    DnsServerConfig config = testConfig();
    config.port = std::to_string(first.port());
    DnsServer second(config, makeResolver());
    REQUIRE_THROWS_AS(second.bind(), DnsServerException);
  }
}

TEST_CASE("DnsServer answers over UDP", "[server][socket][udp]")
{
  kvdns::test::initializeTestLogging();
  DnsServer server(testConfig(), makeResolver());
  RunningServer running(server);

  auto reply = kvdns::test::udpExchange(server.port(),
                                        kvdns::test::buildQuery(0xCAFE, "foo.ip4", DnsType::A));
  REQUIRE(reply.has_value());
  DnsMessage response = DnsCodec::decodeStrict(*reply);
  REQUIRE(response.header.id == 0xCAFE);
  REQUIRE(response.answers.size() == 1);
  REQUIRE(response.answers[0].rdata == std::vector<std::uint8_t>{127, 0, 0, 1});

  SECTION("Concurrent clients all get their own answer")
  {
    constexpr int clients = 8;
    std::atomic<int> matched{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < clients; ++i)
    {
      threads.emplace_back(
        [&server, &matched, i]()
        {
          auto id = static_cast<std::uint16_t>(1000 + i);
          auto r = kvdns::test::udpExchange(server.port(),
                                            kvdns::test::buildQuery(id, "bar.ip6", DnsType::AAAA));
          if (r && DnsCodec::decode(*r).message.header.id == id)
          {
            matched.fetch_add(1);
          }
        });
    }
    for (auto &t : threads)
    {
      t.join();
    }
    REQUIRE(matched.load() == clients);
  }

  running.stop();
  REQUIRE_FALSE(server.isRunning());
}

TEST_CASE("DnsServer with no waiting room answers while workers are free",
          "[server][socket][udp][pool]")
{
  DnsServerConfig config = testConfig();
  config.minThreads = 2;
  config.maxThreads = 4;
  config.maxQueuedRequests = 0;
  DnsServer server(config, makeResolver());
  RunningServer running(server);

  for (std::uint16_t id = 1; id <= 3; ++id)
  {
    auto reply = kvdns::test::udpExchange(server.port(),
                                          kvdns::test::buildQuery(id, "foo.ip4", DnsType::A),
                                          std::chrono::milliseconds(500));
    REQUIRE(reply.has_value());
    DnsMessage response = DnsCodec::decodeStrict(*reply);
    REQUIRE(response.header.id == id);
    REQUIRE(response.answers.size() == 1);
  }
}

TEST_CASE("DnsServer drops requests when saturated and keeps serving",
          "[server][socket][udp][pool]")
{
  kvdns::test::initializeTestLogging();
  LogCapture logs;
  auto gate = std::make_shared<GatedLookup>();

  DnsServerConfig config = testConfig();
  config.minThreads = 1;
  config.maxThreads = 1;
  config.maxQueuedRequests = 1;
  DnsServer server(config, std::make_shared<const Resolver>(gate));
  RunningServer running(server);
  OpenOnExit release{*gate};

  kvdns::test::UdpClient busy(server.port());
  kvdns::test::UdpClient queued(server.port());
  kvdns::test::UdpClient overflowA(server.port());
  kvdns::test::UdpClient overflowB(server.port());

  // The only worker blocks inside the first lookup
  REQUIRE(busy.send(kvdns::test::buildQuery(1, "foo.ip4", DnsType::A)));
  REQUIRE(gate->waitEntered(1, std::chrono::seconds(2)));

  // One request fits in the queue, the rest are dropped
  REQUIRE(queued.send(kvdns::test::buildQuery(2, "foo.ip4", DnsType::A)));
  REQUIRE(overflowA.send(kvdns::test::buildQuery(3, "foo.ip4", DnsType::A)));
  REQUIRE(overflowB.send(kvdns::test::buildQuery(4, "foo.ip4", DnsType::A)));
  REQUIRE(logs.waitFor("dropped: too many requests in flight", 2, std::chrono::seconds(2)));

  gate->open();

  auto first = busy.receive();
  REQUIRE(first.has_value());
  REQUIRE(DnsCodec::decodeStrict(*first).header.id == 1);
  REQUIRE(DnsCodec::decodeStrict(*first).answers.size() == 1);

  auto second = queued.receive();
  REQUIRE(second.has_value());
  REQUIRE(DnsCodec::decodeStrict(*second).header.id == 2);
  REQUIRE(DnsCodec::decodeStrict(*second).answers.size() == 1);

  REQUIRE_FALSE(overflowA.receive(std::chrono::milliseconds(300)).has_value());
  REQUIRE_FALSE(overflowB.receive(std::chrono::milliseconds(300)).has_value());
  REQUIRE(gate->entered() == 2);

  // The receive loop is still alive
  auto fresh = kvdns::test::udpExchange(server.port(),
                                        kvdns::test::buildQuery(5, "foo.ip4", DnsType::A));
  REQUIRE(fresh.has_value());
  REQUIRE(DnsCodec::decodeStrict(*fresh).header.id == 5);
  REQUIRE(DnsCodec::decodeStrict(*fresh).answers.size() == 1);
}

TEST_CASE("DnsServer stop before run returns immediately", "[server][socket]")
{
  DnsServer server(testConfig(), makeResolver());
  server.stop();
  server.run();
  REQUIRE_FALSE(server.isRunning());
}
