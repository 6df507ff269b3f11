// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Kvdns, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#include <kvdns/kvdns.hpp>
#include <atomic>
#include <csignal>
#include <fstream>
#include <iostream>
#include <limits>

#define KVDNS_DEFAULT_CONFIG_FILE_PATH "/etc/kvdns/kvdns.toml"

namespace
{
  /// Settings gathered from the command line and the TOML file. Unset
  /// fields fall back to the defaults of the structs they feed.
  struct Config
  {
    std::optional<std::string> configFile;
    struct
    {
      std::optional<std::string> port;
      std::optional<std::uint32_t> expiry;
      std::optional<bool> nxdomainOnMiss;
      std::optional<bool> dropMalformed;
    } server;
    struct
    {
      std::optional<std::string> host;
      std::optional<std::uint16_t> port;
      std::optional<std::string> password;
      std::optional<int> db;
      std::optional<int> timeoutMs;
    } redis;
    struct
    {
      std::optional<std::size_t> minThreads;
      std::optional<std::size_t> maxThreads;
      std::optional<std::size_t> queueSize;
    } threadPool;
    struct
    {
      std::optional<std::string> level;
      std::optional<std::string> file;
      std::optional<bool> async;
    } log;
  };

  std::atomic<kvdns::network::dns::DnsServer*> g_server{nullptr};

  /// \brief Print help message
  void printHelp()
  {
    std::cout
        << "Usage: kvdns [options]\n"
        << "  -h, --help                     Show this help message\n"
        << "  -c, --config <file>            Configuration file path (default: "
        << KVDNS_DEFAULT_CONFIG_FILE_PATH << ")\n"
        << "      --port <port>              UDP port to listen on (default: 1053)\n"
        << "      --expiry <seconds>         TTL of every answer (default: 1800)\n"
        << "      --nxdomain-on-miss         Answer NXDOMAIN when a name is not stored\n"
        << "      --drop-malformed           Do not answer queries that fail to decode\n"
        << "      --redis-host <host>        Redis host (default: localhost)\n"
        << "      --redis-port <port>        Redis port (default: 6379)\n"
        << "      --redis-password <secret>  Redis AUTH password\n"
        << "      --redis-db <n>             Redis database index (default: 0)\n"
        << "      --redis-timeout-ms <ms>    Redis socket timeout, 0 = none (default: 0)\n"
        << "      --threadpool-min <n>       Minimum worker threads (default: 2)\n"
        << "      --threadpool-max <n>       Maximum worker threads (default: 16)\n"
        << "      --threadpool-queue <n>     Requests waiting for a busy worker (default: 256)\n"
        << "  -l, --log-level <level>        Log level (trace, debug, info, warning, "
           "error, fatal)\n"
        << "  -f, --log-file <file>          Log file path (default: standard output)\n";
  }

  /// \brief Parse a non-negative decimal no greater than \p max.
  /// \throws std::runtime_error naming \p what on bad input.
  std::uint64_t parseUnsigned(const std::string& text, const std::string& what,
                              std::uint64_t max)
  {
    try
    {
      std::size_t used = 0;
      if (!text.empty() && text[0] != '-')
      {
        unsigned long long value = std::stoull(text, &used);
        if (used == text.size() && value <= max)
        {
          return value;
        }
      }
    }
    catch (const std::exception&)
    {
    }
    throw std::runtime_error("Invalid " + what + ": " + text);
  }

  /// \brief Parse command-line arguments into the config
  void parseCliArgs(int argc, char** argv, Config& config)
  {
    auto value = [&](int& i, const std::string& arg) -> std::string
    {
      if (i + 1 >= argc)
      {
        throw std::runtime_error("Missing value for " + arg);
      }
      return argv[++i];
    };

    for (int i = 1; i < argc; ++i)
    {
      std::string arg = argv[i];
      if (arg == "--port")
      {
        config.server.port = value(i, arg);
      }
      else if (arg == "--expiry")
      {
        config.server.expiry = static_cast<std::uint32_t>(parseUnsigned(
            value(i, arg), "expiry", std::numeric_limits<std::uint32_t>::max()));
      }
      else if (arg == "-c" || arg == "--config")
      {
        config.configFile = value(i, arg);
      }
      else if (arg == "--nxdomain-on-miss")
      {
        config.server.nxdomainOnMiss = true;
      }
      else if (arg == "--drop-malformed")
      {
        config.server.dropMalformed = true;
      }
      else if (arg == "--redis-host")
      {
        config.redis.host = value(i, arg);
      }
      else if (arg == "--redis-port")
      {
        config.redis.port = static_cast<std::uint16_t>(
            parseUnsigned(value(i, arg), "redis port", 65535));
      }
      else if (arg == "--redis-password")
      {
        config.redis.password = value(i, arg);
      }
      else if (arg == "--redis-db")
      {
        config.redis.db = static_cast<int>(parseUnsigned(
            value(i, arg), "redis db", std::numeric_limits<int>::max()));
      }
      else if (arg == "--redis-timeout-ms")
      {
        config.redis.timeoutMs = static_cast<int>(parseUnsigned(
            value(i, arg), "redis timeout", std::numeric_limits<int>::max()));
      }
      else if (arg == "--threadpool-min")
      {
        config.threadPool.minThreads = static_cast<std::size_t>(parseUnsigned(
            value(i, arg), "threadpool min threads", 4096));
      }
      else if (arg == "--threadpool-max")
      {
        config.threadPool.maxThreads = static_cast<std::size_t>(parseUnsigned(
            value(i, arg), "threadpool max threads", 4096));
      }
      else if (arg == "--threadpool-queue")
      {
        config.threadPool.queueSize = static_cast<std::size_t>(parseUnsigned(
            value(i, arg), "threadpool queue size", 1u << 20));
      }
      else if (arg == "-l" || arg == "--log-level")
      {
        config.log.level = value(i, arg);
      }
      else if (arg == "-f" || arg == "--log-file")
      {
        config.log.file = value(i, arg);
      }
      else if (arg == "-h" || arg == "--help")
      {
        printHelp();
        std::exit(0);
      }
      else
      {
        throw std::runtime_error("Unknown option: " + arg);
      }
    }
  }

  template <typename T>
  void fillFrom(std::optional<T>& target, std::optional<int64_t> value,
                const std::string& key, std::uint64_t max)
  {
    if (target.has_value() || !value)
    {
      return;
    }
    if (*value < 0 || static_cast<std::uint64_t>(*value) > max)
    {
      throw std::runtime_error("Invalid value for " + key + ": " +
                               std::to_string(*value));
    }
    target = static_cast<T>(*value);
  }

  /// \brief Fill unset fields from the TOML file. The command line wins.
  /// \throws std::runtime_error if an explicitly named file cannot be read.
  void parseTomlConfig(Config& config)
  {
    std::string path = config.configFile.value_or(KVDNS_DEFAULT_CONFIG_FILE_PATH);
    if (!config.configFile && !std::ifstream(path).good())
    {
      return;
    }

    kvdns::core::ConfigLoader loader(path);
    KVDNS_LOG_INFO("Using config file: " << path);

    if (!config.server.port)
    {
      if (auto port = loader.getString("kvdns.server.port"))
      {
        config.server.port = *port;
      }
      else if (auto portNumber = loader.getInt("kvdns.server.port"))
      {
        config.server.port = std::to_string(*portNumber);
      }
    }
    fillFrom(config.server.expiry, loader.getInt("kvdns.server.expiry"),
             "kvdns.server.expiry", std::numeric_limits<std::uint32_t>::max());
    if (!config.server.nxdomainOnMiss)
    {
      config.server.nxdomainOnMiss = loader.getBool("kvdns.server.nxdomain_on_miss");
    }
    if (!config.server.dropMalformed)
    {
      config.server.dropMalformed = loader.getBool("kvdns.server.drop_malformed");
    }

    if (!config.redis.host)
    {
      config.redis.host = loader.getString("kvdns.redis.host");
    }
    fillFrom(config.redis.port, loader.getInt("kvdns.redis.port"), "kvdns.redis.port",
             65535);
    if (!config.redis.password)
    {
      config.redis.password = loader.getString("kvdns.redis.password");
    }
    fillFrom(config.redis.db, loader.getInt("kvdns.redis.db"), "kvdns.redis.db",
             std::numeric_limits<int>::max());
    fillFrom(config.redis.timeoutMs, loader.getInt("kvdns.redis.timeout_ms"),
             "kvdns.redis.timeout_ms", std::numeric_limits<int>::max());

    fillFrom(config.threadPool.minThreads, loader.getInt("kvdns.threadPool.minThreads"),
             "kvdns.threadPool.minThreads", 4096);
    fillFrom(config.threadPool.maxThreads, loader.getInt("kvdns.threadPool.maxThreads"),
             "kvdns.threadPool.maxThreads", 4096);
    fillFrom(config.threadPool.queueSize, loader.getInt("kvdns.threadPool.queueSize"),
             "kvdns.threadPool.queueSize", 1u << 20);

    if (!config.log.level)
    {
      config.log.level = loader.getString("kvdns.log.level");
    }
    if (!config.log.file)
    {
      config.log.file = loader.getString("kvdns.log.file");
    }
    if (!config.log.async)
    {
      config.log.async = loader.getBool("kvdns.log.async");
    }
  }

  void initLogger(const Config& config)
  {
    auto level = kvdns::core::Logger::Level::Info;
    if (config.log.level)
    {
      auto parsed = kvdns::core::Logger::parseLevel(*config.log.level);
      if (!parsed)
      {
        throw std::runtime_error("Invalid log level: " + *config.log.level);
      }
      level = *parsed;
    }
    kvdns::core::Logger::init(level, config.log.file.value_or(""),
                              config.log.async.value_or(false));
  }
} // namespace

int main(int argc, char** argv)
{
  using namespace kvdns::network::dns;

  try
  {
    Config config;
    parseCliArgs(argc, argv, config);
    parseTomlConfig(config);
    initLogger(config);

    kvdns::storage::RedisConfig redisConfig;
    redisConfig.host = config.redis.host.value_or(redisConfig.host);
    redisConfig.port = config.redis.port.value_or(redisConfig.port);
    redisConfig.password = config.redis.password.value_or("");
    redisConfig.db = config.redis.db.value_or(0);
    redisConfig.timeoutMs = config.redis.timeoutMs.value_or(0);
    auto lookup = std::make_shared<kvdns::storage::RedisKeyLookup>(redisConfig);
    if (!lookup->ping())
    {
      KVDNS_LOG_WARN("Redis at " << redisConfig.host << ":" << redisConfig.port
                                 << " is not answering; lookups will be retried per request");
    }

    ResolverConfig resolverConfig;
    resolverConfig.ttl = config.server.expiry.value_or(constants::DNS_DEFAULT_TTL);
    resolverConfig.nxdomainOnMiss = config.server.nxdomainOnMiss.value_or(false);
    auto resolver = std::make_shared<const Resolver>(lookup, resolverConfig);

    DnsServerConfig serverConfig;
    serverConfig.port =
        config.server.port.value_or(std::to_string(constants::DNS_DEFAULT_PORT));
    serverConfig.malformedPolicy = config.server.dropMalformed.value_or(false)
                                       ? MalformedQueryPolicy::Drop
                                       : MalformedQueryPolicy::BestEffort;
    serverConfig.minThreads = config.threadPool.minThreads.value_or(serverConfig.minThreads);
    serverConfig.maxThreads = config.threadPool.maxThreads.value_or(serverConfig.maxThreads);
    serverConfig.maxQueuedRequests =
        config.threadPool.queueSize.value_or(serverConfig.maxQueuedRequests);

    DnsServer server(serverConfig, resolver);
    server.bind();

    g_server = &server;
    auto onSignal = [](int)
    {
      if (auto* s = g_server.load())
      {
        s->stop();
      }
    };
    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    server.run();
    g_server = nullptr;
  }
  catch (const std::exception& ex)
  {
    KVDNS_LOG_FATAL("kvdns: " << ex.what());
    kvdns::core::Logger::shutdown();
    return EXIT_FAILURE;
  }

  kvdns::core::Logger::shutdown();
  return 0;
}
