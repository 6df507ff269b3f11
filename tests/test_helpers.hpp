// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// Shared test helpers for the kvdns test suite

#pragma once

#include "kvdns/kvdns.hpp"
#include <arpa/inet.h>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <netinet/in.h>
#include <optional>
#include <poll.h>
#include <string>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>
#include <vector>

namespace kvdns::test
{

/// \brief Automatic logger initialization for tests
struct LoggerInit
{
  LoggerInit() { kvdns::core::Logger::setLevel(kvdns::core::Logger::Level::Debug); }
};

/// \brief Static logger initializer - call once per test executable
inline void initializeTestLogging()
{
  static LoggerInit init;
  (void)init;
}

/// \brief Writes \p content to \p path and removes the file when destroyed
class TempFile
{
public:
  TempFile(std::string path, const std::string &content) : _path(std::move(path))
  {
    std::ofstream out(_path, std::ios::trunc);
    out << content;
  }

  ~TempFile() { std::remove(_path.c_str()); }

  const std::string &path() const { return _path; }

private:
  std::string _path;
};

/// \brief Wire form of a single-question query
inline std::vector<std::uint8_t> buildQuery(std::uint16_t id, const std::string &name,
                                            kvdns::network::dns::DnsType type,
                                            kvdns::network::dns::DnsClass cls =
                                              kvdns::network::dns::DnsClass::IN)
{
  kvdns::network::dns::DnsMessage query;
  query.header.id = id;
  query.questions.emplace_back(name, type, cls);
  return kvdns::network::dns::DnsCodec::encode(query);
}

/// \brief Loopback UDP client that sends and receives separately, so a test
/// can have several requests outstanding at once
class UdpClient
{
public:
  explicit UdpClient(std::uint16_t port) : _fd(::socket(AF_INET, SOCK_DGRAM, 0))
  {
    _server.sin_family = AF_INET;
    _server.sin_port = htons(port);
    _server.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  }

  ~UdpClient()
  {
    if (_fd >= 0)
    {
      ::close(_fd);
    }
  }

  UdpClient(const UdpClient &) = delete;
  UdpClient &operator=(const UdpClient &) = delete;

  bool send(const std::vector<std::uint8_t> &request)
  {
    return _fd >= 0 && ::sendto(_fd, request.data(), request.size(), 0,
                                reinterpret_cast<sockaddr *>(&_server), sizeof(_server)) >= 0;
  }

  /// \return std::nullopt on timeout
  std::optional<std::vector<std::uint8_t>>
  receive(std::chrono::milliseconds timeout = std::chrono::milliseconds(2000))
  {
    if (_fd < 0)
    {
      return std::nullopt;
    }
    pollfd pfd{};
    pfd.fd = _fd;
    pfd.events = POLLIN;
    if (::poll(&pfd, 1, static_cast<int>(timeout.count())) <= 0)
    {
      return std::nullopt;
    }
    std::uint8_t buffer[4096];
    ssize_t n = ::recv(_fd, buffer, sizeof(buffer), 0);
    if (n < 0)
    {
      return std::nullopt;
    }
    return std::vector<std::uint8_t>(buffer, buffer + n);
  }

private:
  int _fd;
  sockaddr_in _server{};
};

/// \brief Send \p request to 127.0.0.1:\p port over UDP and wait for one
/// reply.
/// \return std::nullopt on timeout
inline std::optional<std::vector<std::uint8_t>>
udpExchange(std::uint16_t port, const std::vector<std::uint8_t> &request,
            std::chrono::milliseconds timeout = std::chrono::milliseconds(2000))
{
  UdpClient client(port);
  if (!client.send(request))
  {
    return std::nullopt;
  }
  return client.receive(timeout);
}

} // namespace kvdns::test
