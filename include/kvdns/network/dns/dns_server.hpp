// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Kvdns, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include <arpa/inet.h>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <memory>
#include <netdb.h>
#include <netinet/in.h>
#include <optional>
#include <poll.h>
#include <stdexcept>
#include <string>
#include <sys/socket.h>
#include <unistd.h>
#include <vector>

#include <kvdns/core/logger.hpp>
#include <kvdns/core/thread_pool.hpp>
#include <kvdns/network/dns/dns_codec.hpp>
#include <kvdns/network/dns/dns_resolver.hpp>

namespace kvdns
{
namespace network
{
namespace dns
{

/// \brief Socket resolve, bind, receive or send failure
class DnsServerException : public std::runtime_error
{
public:
  explicit DnsServerException(const std::string &message) : std::runtime_error(message) {}
};

/// \brief What to do with a query that does not decode cleanly
enum class MalformedQueryPolicy
{
  BestEffort, ///< Answer from whatever was decoded
  Drop        ///< Send nothing
};

struct DnsServerConfig
{
  std::string bindAddress = "0.0.0.0";
  std::string port = "1053";                                ///< Service name or number; "0" picks a free port
  MalformedQueryPolicy malformedPolicy = MalformedQueryPolicy::BestEffort;
  std::size_t minThreads = 2;
  std::size_t maxThreads = 16;
  std::size_t maxQueuedRequests = 256;                      ///< Further datagrams are dropped
  std::chrono::milliseconds pollInterval{100};              ///< How often run() checks for stop()
};

/// \brief UDP front end: one receive loop, one pool task per datagram.
///
/// Every datagram is decoded, each question resolved in order and the
/// response sent back to the sender from the worker thread. The receive loop
/// never waits on a handler; in-flight requests are bounded by the pool's
/// thread and queue limits and anything past that is dropped with a warning.
class DnsServer
{
public:
  DnsServer(DnsServerConfig config, std::shared_ptr<const Resolver> resolver)
      : _config(std::move(config)), _resolver(std::move(resolver))
  {
    if (!_resolver)
    {
      throw std::invalid_argument("DnsServer requires a resolver");
    }
  }

  ~DnsServer()
  {
    stop();
    if (_pool)
    {
      _pool->shutdown();
    }
    if (_fd >= 0)
    {
      ::close(_fd);
    }
  }

  DnsServer(const DnsServer &) = delete;
  DnsServer &operator=(const DnsServer &) = delete;

  /// \brief Resolve and bind the listening address and start the workers.
  /// \throws DnsServerException if the address cannot be resolved or bound.
  void bind()
  {
    if (_fd >= 0)
    {
      return;
    }

    addrinfo *res = nullptr;
    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_DGRAM;
    hints.ai_protocol = IPPROTO_UDP;
    hints.ai_flags = AI_PASSIVE;
    int rc = ::getaddrinfo(_config.bindAddress.c_str(), _config.port.c_str(), &hints, &res);
    if (rc != 0 || !res)
    {
      throw DnsServerException("Cannot resolve UDP address " + _config.bindAddress + ":" +
                               _config.port + ": " + gai_strerror(rc));
    }

    int fd = ::socket(res->ai_family, SOCK_DGRAM | SOCK_CLOEXEC, 0);
    if (fd < 0)
    {
      ::freeaddrinfo(res);
      throw DnsServerException(std::string("UDP socket: ") + std::strerror(errno));
    }
    if (::bind(fd, res->ai_addr, res->ai_addrlen) < 0)
    {
      int err = errno;
      ::freeaddrinfo(res);
      ::close(fd);
      throw DnsServerException("Cannot bind UDP " + _config.bindAddress + ":" + _config.port +
                               ": " + std::strerror(err));
    }
    ::freeaddrinfo(res);

    sockaddr_in local{};
    socklen_t localLen = sizeof(local);
    if (::getsockname(fd, reinterpret_cast<sockaddr *>(&local), &localLen) == 0)
    {
      _boundPort = ntohs(local.sin_port);
    }
    _fd = fd;

    _pool = std::make_unique<core::ThreadPool>(_config.minThreads, _config.maxThreads,
                                               std::chrono::seconds(30),
                                               _config.maxQueuedRequests);
    KVDNS_LOG_INFO("DNS server listening on " << _config.bindAddress << ":" << _boundPort);
  }

  /// \brief Receive until stop(). Binds first if bind() was not called.
  /// \throws DnsServerException from bind().
  void run()
  {
    bind();
    _running = true;

    std::uint8_t buffer[constants::DNS_MAX_UDP_SIZE];
    while (!_stopRequested)
    {
      pollfd pfd{};
      pfd.fd = _fd;
      pfd.events = POLLIN;
      int ready = ::poll(&pfd, 1, static_cast<int>(_config.pollInterval.count()));
      if (ready <= 0)
      {
        if (ready < 0 && errno != EINTR)
        {
          KVDNS_LOG_ERROR("poll failed: " << std::strerror(errno));
        }
        continue;
      }

      sockaddr_storage peer{};
      socklen_t peerLen = sizeof(peer);
      ssize_t received = ::recvfrom(_fd, buffer, sizeof(buffer), 0,
                                    reinterpret_cast<sockaddr *>(&peer), &peerLen);
      if (received < 0)
      {
        if (errno != EINTR && errno != EAGAIN && errno != EWOULDBLOCK)
        {
          KVDNS_LOG_ERROR("recvfrom failed: " << std::strerror(errno));
        }
        continue;
      }

      KVDNS_LOG_INFO("Received request from " << peerToString(peer));

      auto request = std::make_shared<std::vector<std::uint8_t>>(buffer, buffer + received);
      bool accepted = _pool->tryEnqueue([this, request, peer, peerLen]()
                                        { handle(*request, peer, peerLen); });
      if (!accepted)
      {
        KVDNS_LOG_WARN("Request from " << peerToString(peer)
                                       << " dropped: too many requests in flight");
      }
    }
    _running = false;
    KVDNS_LOG_INFO("DNS server stopped");
  }

  /// \brief Make run() return within one poll interval. A stop() before
  /// run() makes run() return immediately.
  void stop() { _stopRequested = true; }

  bool isRunning() const { return _running; }

  /// \brief Bound port, 0 before bind().
  std::uint16_t port() const { return _boundPort; }

  /// \brief Build the response for one datagram.
  /// \return std::nullopt when nothing should be sent back.
  std::optional<std::vector<std::uint8_t>> processRequest(const std::uint8_t *data,
                                                          std::size_t size) const
  {
    DnsDecodeResult decoded = DnsCodec::decode(data, size);
    if (!decoded.ok())
    {
      KVDNS_LOG_ERROR("Failed to decode query: " << decoded.errorDetail);
      if (_config.malformedPolicy == MalformedQueryPolicy::Drop)
      {
        return std::nullopt;
      }
    }

    DnsMessage response;
    response.header.id = decoded.message.header.id;
    response.header.flags = constants::DNS_FLAG_RESPONSE;

    bool anyMiss = false;
    for (const auto &question : decoded.message.questions)
    {
      response.questions.push_back(question);
      ResolveResult result = _resolver->resolve(question);
      anyMiss = anyMiss || result.miss;
      append(response.answers, result.answers);
      append(response.authority, result.authorities);
      append(response.additional, result.additionals);
    }

    if (anyMiss && _resolver->config().nxdomainOnMiss)
    {
      response.header.setRcode(DnsResponseCode::NXDOMAIN);
    }

    std::vector<std::uint8_t> encoded;
    try
    {
      encoded = DnsCodec::encode(response);
    }
    catch (const DnsCodecException &e)
    {
      KVDNS_LOG_ERROR("Failed to encode response " << response.header.id << ": " << e.what());
      return std::nullopt;
    }

    if (DnsCodec::exceedsUdpLimit(encoded))
    {
      KVDNS_LOG_WARN("Response " << response.header.id << " is " << encoded.size()
                                 << " bytes, over the " << constants::DNS_MAX_UDP_SIZE
                                 << " byte UDP limit");
    }
    return encoded;
  }

  std::optional<std::vector<std::uint8_t>> processRequest(const std::vector<std::uint8_t> &data) const
  {
    return processRequest(data.data(), data.size());
  }

  static std::string peerToString(const sockaddr_storage &peer)
  {
    char host[INET6_ADDRSTRLEN] = {0};
    std::uint16_t port = 0;
    if (peer.ss_family == AF_INET)
    {
      const auto *v4 = reinterpret_cast<const sockaddr_in *>(&peer);
      ::inet_ntop(AF_INET, &v4->sin_addr, host, sizeof(host));
      port = ntohs(v4->sin_port);
      return std::string(host) + ":" + std::to_string(port);
    }
    if (peer.ss_family == AF_INET6)
    {
      const auto *v6 = reinterpret_cast<const sockaddr_in6 *>(&peer);
      ::inet_ntop(AF_INET6, &v6->sin6_addr, host, sizeof(host));
      port = ntohs(v6->sin6_port);
      return "[" + std::string(host) + "]:" + std::to_string(port);
    }
    return "unknown";
  }

private:
  static void append(std::vector<DnsResourceRecord> &to, const std::vector<DnsResourceRecord> &from)
  {
    to.insert(to.end(), from.begin(), from.end());
  }

  void handle(const std::vector<std::uint8_t> &request, const sockaddr_storage &peer,
              socklen_t peerLen) const
  {
    auto response = processRequest(request);
    if (!response)
    {
      return;
    }
    ssize_t sent = ::sendto(_fd, response->data(), response->size(), 0,
                            reinterpret_cast<const sockaddr *>(&peer), peerLen);
    if (sent < 0)
    {
      KVDNS_LOG_ERROR("Failed to send response to " << peerToString(peer) << ": "
                                                    << std::strerror(errno));
    }
  }

  const DnsServerConfig _config;
  std::shared_ptr<const Resolver> _resolver;
  int _fd = -1;
  std::uint16_t _boundPort = 0;
  std::atomic<bool> _running{false};
  std::atomic<bool> _stopRequested{false};
  std::unique_ptr<core::ThreadPool> _pool;
};

} // namespace dns
} // namespace network
} // namespace kvdns
