// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Kvdns, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <memory>
#include <mutex>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <string>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <vector>
#include "kvdns/core/logger.hpp"
#include "kvdns/storage/key_lookup.hpp"

namespace kvdns
{
namespace storage
{

  /// \brief Connection parameters for RedisKeyLookup.
  struct RedisConfig
  {
    std::string host = "localhost";
    std::uint16_t port = 6379;
    std::string password;             ///< AUTH is sent only when non-empty
    int db = 0;                       ///< SELECT is sent only when non-zero
    int timeoutMs = 0;                ///< Socket send/receive timeout, 0 = none
    std::size_t maxIdleConnections = 8;
  };

  /// \brief One decoded RESP2 reply.
  struct RespReply
  {
    enum class Type
    {
      Status,
      Error,
      Integer,
      Bulk,
      Nil,
      Array
    };

    Type type = Type::Nil;
    std::string str;
    std::int64_t integer = 0;
    std::vector<RespReply> elements;
  };

  /// \brief A blocking RESP2 connection. Not thread-safe; the pool hands
  /// each connection to one caller at a time.
  class RedisConnection
  {
  public:
    explicit RedisConnection(const RedisConfig& config)
    {
      connectTo(config);
      try
      {
        if (!config.password.empty())
        {
          expectStatus(command({"AUTH", config.password}), "AUTH");
        }
        if (config.db != 0)
        {
          expectStatus(command({"SELECT", std::to_string(config.db)}),
                       "SELECT");
        }
      }
      catch (...)
      {
        ::close(_fd);
        throw;
      }
    }

    ~RedisConnection()
    {
      if (_fd >= 0)
      {
        ::close(_fd);
      }
    }

    RedisConnection(const RedisConnection&) = delete;
    RedisConnection& operator=(const RedisConnection&) = delete;

    /// \brief Send one command and read its reply.
    /// \throws KeyLookupException on I/O or protocol failure; the connection
    /// must be discarded afterwards.
    RespReply command(const std::vector<std::string>& args)
    {
      std::string request = "*" + std::to_string(args.size()) + "\r\n";
      for (const auto& arg : args)
      {
        request += "$" + std::to_string(arg.size()) + "\r\n";
        request += arg;
        request += "\r\n";
      }
      sendAll(request);
      return readReply();
    }

  private:
    void connectTo(const RedisConfig& config)
    {
      addrinfo* res = nullptr;
      addrinfo hints{};
      hints.ai_family = AF_UNSPEC;
      hints.ai_socktype = SOCK_STREAM;
      hints.ai_protocol = IPPROTO_TCP;
      std::string ps = std::to_string(config.port);
      int rc = ::getaddrinfo(config.host.c_str(), ps.c_str(), &hints, &res);
      if (rc != 0 || !res)
      {
        throw KeyLookupException("Redis: cannot resolve " + config.host +
                                 ": " + gai_strerror(rc));
      }

      int lastErrno = 0;
      for (addrinfo* ai = res; ai; ai = ai->ai_next)
      {
        _fd = ::socket(ai->ai_family, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (_fd < 0)
        {
          lastErrno = errno;
          continue;
        }
        if (config.timeoutMs > 0)
        {
          timeval tv{};
          tv.tv_sec = config.timeoutMs / 1000;
          tv.tv_usec = (config.timeoutMs % 1000) * 1000;
          ::setsockopt(_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
          ::setsockopt(_fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
        }
        int one = 1;
        ::setsockopt(_fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
        if (::connect(_fd, ai->ai_addr, ai->ai_addrlen) == 0)
        {
          break;
        }
        lastErrno = errno;
        ::close(_fd);
        _fd = -1;
      }
      ::freeaddrinfo(res);

      if (_fd < 0)
      {
        throw KeyLookupException("Redis: cannot connect to " + config.host +
                                 ":" + ps + ": " + std::strerror(lastErrno));
      }
    }

    static void expectStatus(const RespReply& reply, const char* what)
    {
      if (reply.type == RespReply::Type::Error)
      {
        throw KeyLookupException(std::string("Redis ") + what +
                                 " failed: " + reply.str);
      }
    }

    void sendAll(const std::string& data)
    {
      std::size_t sent = 0;
      while (sent < data.size())
      {
        ssize_t n =
            ::send(_fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0)
        {
          if (errno == EINTR)
          {
            continue;
          }
          throw KeyLookupException(std::string("Redis send: ") +
                                   std::strerror(errno));
        }
        sent += static_cast<std::size_t>(n);
      }
    }

    void fill()
    {
      char chunk[4096];
      while (true)
      {
        ssize_t n = ::recv(_fd, chunk, sizeof(chunk), 0);
        if (n > 0)
        {
          _buffer.append(chunk, static_cast<std::size_t>(n));
          return;
        }
        if (n == 0)
        {
          throw KeyLookupException("Redis connection closed by peer");
        }
        if (errno == EINTR)
        {
          continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK)
        {
          throw KeyLookupException("Redis read timed out");
        }
        throw KeyLookupException(std::string("Redis recv: ") +
                                 std::strerror(errno));
      }
    }

    std::string readLine()
    {
      while (true)
      {
        auto pos = _buffer.find("\r\n", _offset);
        if (pos != std::string::npos)
        {
          std::string line = _buffer.substr(_offset, pos - _offset);
          _offset = pos + 2;
          compact();
          return line;
        }
        fill();
      }
    }

    std::string readExact(std::size_t count)
    {
      while (_buffer.size() - _offset < count)
      {
        fill();
      }
      std::string data = _buffer.substr(_offset, count);
      _offset += count;
      compact();
      return data;
    }

    void compact()
    {
      if (_offset == _buffer.size())
      {
        _buffer.clear();
        _offset = 0;
      }
    }

    static std::int64_t toInteger(const std::string& text)
    {
      try
      {
        std::size_t used = 0;
        std::int64_t value = std::stoll(text, &used);
        if (used == text.size())
        {
          return value;
        }
      }
      catch (const std::logic_error&)
      {
      }
      throw KeyLookupException("Redis protocol error: bad integer '" + text +
                               "'");
    }

    RespReply readReply()
    {
      std::string line = readLine();
      if (line.empty())
      {
        throw KeyLookupException("Redis protocol error: empty reply line");
      }

      RespReply reply;
      std::string payload = line.substr(1);
      switch (line[0])
      {
      case '+':
        reply.type = RespReply::Type::Status;
        reply.str = payload;
        break;
      case '-':
        reply.type = RespReply::Type::Error;
        reply.str = payload;
        break;
      case ':':
        reply.type = RespReply::Type::Integer;
        reply.integer = toInteger(payload);
        break;
      case '$':
      {
        std::int64_t length = toInteger(payload);
        if (length < 0)
        {
          reply.type = RespReply::Type::Nil;
          break;
        }
        reply.type = RespReply::Type::Bulk;
        reply.str = readExact(static_cast<std::size_t>(length));
        if (readExact(2) != "\r\n")
        {
          throw KeyLookupException(
              "Redis protocol error: bulk string not terminated");
        }
        break;
      }
      case '*':
      {
        std::int64_t count = toInteger(payload);
        if (count < 0)
        {
          reply.type = RespReply::Type::Nil;
          break;
        }
        reply.type = RespReply::Type::Array;
        for (std::int64_t i = 0; i < count; ++i)
        {
          reply.elements.push_back(readReply());
        }
        break;
      }
      default:
        throw KeyLookupException("Redis protocol error: unexpected reply '" +
                                 line + "'");
      }
      return reply;
    }

    int _fd = -1;
    std::string _buffer;
    std::size_t _offset = 0;
  };

  /// \brief KeyLookup backed by a Redis server (plain GET per key).
  ///
  /// Connections are opened lazily and pooled; one that fails mid-command
  /// is dropped and the next lookup opens a fresh one. A nil reply is a
  /// miss, an error reply or I/O failure throws KeyLookupException.
  class RedisKeyLookup : public KeyLookup
  {
  public:
    explicit RedisKeyLookup(RedisConfig config) : _config(std::move(config))
    {
    }

    std::string get(const std::string& key) override
    {
      RespReply reply = run({"GET", key});
      switch (reply.type)
      {
      case RespReply::Type::Nil:
        return std::string();
      case RespReply::Type::Bulk:
      case RespReply::Type::Status:
        return reply.str;
      case RespReply::Type::Error:
        throw KeyLookupException("Redis GET " + key + " failed: " + reply.str);
      default:
        throw KeyLookupException("Redis GET " + key +
                                 " returned an unexpected reply type");
      }
    }

    /// \brief Round trip a PING; logs and returns false when the server is
    /// unreachable.
    bool ping()
    {
      try
      {
        RespReply reply = run({"PING"});
        return reply.type == RespReply::Type::Status && reply.str == "PONG";
      }
      catch (const KeyLookupException& e)
      {
        kvdns::core::Logger::warning(std::string("RedisKeyLookup: ") +
                                     e.what());
        return false;
      }
    }

    const RedisConfig& config() const { return _config; }

    std::size_t idleConnectionCount() const
    {
      std::lock_guard<std::mutex> lock(_mutex);
      return _idle.size();
    }

  private:
    RespReply run(const std::vector<std::string>& args)
    {
      std::unique_ptr<RedisConnection> connection = acquire();
      // A throw here destroys the connection instead of returning it
      RespReply reply = connection->command(args);
      release(std::move(connection));
      return reply;
    }

    std::unique_ptr<RedisConnection> acquire()
    {
      {
        std::lock_guard<std::mutex> lock(_mutex);
        if (!_idle.empty())
        {
          auto connection = std::move(_idle.back());
          _idle.pop_back();
          return connection;
        }
      }
      kvdns::core::Logger::debug("RedisKeyLookup: Opening connection to " +
                                 _config.host + ":" +
                                 std::to_string(_config.port));
      return std::make_unique<RedisConnection>(_config);
    }

    void release(std::unique_ptr<RedisConnection> connection)
    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (_idle.size() < _config.maxIdleConnections)
      {
        _idle.push_back(std::move(connection));
      }
    }

    const RedisConfig _config;
    mutable std::mutex _mutex;
    std::vector<std::unique_ptr<RedisConnection>> _idle;
  };

} // namespace storage
} // namespace kvdns
