// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Kvdns, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace kvdns
{
namespace core
{

namespace detail
{
  /// \brief Extract filename from full path at compile-time
  constexpr const char *basename(const char *path)
  {
    const char *file = path;
    while (*path)
    {
      if (*path == '/' || *path == '\\')
      {
        file = path + 1;
      }
      ++path;
    }
    return file;
  }
} // namespace detail

class LoggerStream;

/// \brief Process-wide logger with log levels, optional file output and an
/// optional background writer thread.
///
/// Without a call to init() every line goes to standard output at Info level.
class Logger
{
public:
  enum class Level
  {
    Trace,
    Debug,
    Info,
    Warning,
    Error,
    Fatal
  };

  /// \brief External sink; receives the level, the formatted line and the
  /// bare message.
  using ExternalHandler = std::function<void(Level level, const std::string &formattedMessage,
                                             const std::string &rawMessage)>;

  struct Endl
  {
  };
  static inline constexpr Endl endl{};

  /// \brief Configure the logger.
  /// \param level Minimum level that is emitted
  /// \param filePath Append to this file; empty means standard output
  /// \param async Hand lines to a writer thread instead of writing inline
  static void init(Level level = Level::Info, const std::string &filePath = "",
                   bool async = false, const std::string &timeFormat = "%Y-%m-%d %H:%M:%S")
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);

    data.minLevel = level;
    data.asyncMode = async;
    data.exit = false;
    data.timestampFormat = timeFormat;
    data.fileStream.reset();
    if (!filePath.empty())
    {
      data.fileStream = std::make_unique<std::ofstream>(filePath, std::ios::app);
      if (!data.fileStream->is_open())
      {
        std::cerr << "[Logger] Failed to open log file: " << filePath << std::endl;
        data.fileStream.reset();
      }
    }

    if (data.asyncMode && !data.workerThread.joinable())
    {
      data.workerThread = std::thread(runWorker);
    }
  }

  /// \brief Write out anything still queued by the async writer.
  static void flush()
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    drainQueue(data);
    if (data.fileStream)
    {
      data.fileStream->flush();
    }
    else
    {
      std::cout.flush();
    }
  }

  static void shutdown()
  {
    flush();
    auto &data = getData();
    {
      std::lock_guard<std::mutex> lock(data.mutex);
      data.exit = true;
    }
    data.cv.notify_one();

    if (data.workerThread.joinable())
    {
      data.workerThread.join();
    }
  }

  static void setLevel(Level level)
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.minLevel = level;
  }

  static Level getLevel()
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    return data.minLevel;
  }

  /// \brief Map a level name ("trace", "debug", "info", "warning"/"warn",
  /// "error", "fatal", any case) to a Level.
  static std::optional<Level> parseLevel(std::string name)
  {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (name == "trace")
      return Level::Trace;
    if (name == "debug")
      return Level::Debug;
    if (name == "info")
      return Level::Info;
    if (name == "warning" || name == "warn")
      return Level::Warning;
    if (name == "error")
      return Level::Error;
    if (name == "fatal")
      return Level::Fatal;
    return std::nullopt;
  }

  /// \brief Route every line to \p handler instead of the console or file.
  static void setExternalHandler(ExternalHandler handler)
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.externalHandler = std::move(handler);
  }

  static void clearExternalHandler()
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.externalHandler = nullptr;
  }

  /// \brief Set the line format.
  /// Placeholders:
  ///   %T - timestamp
  ///   %t - thread ID (hex hash)
  ///   %L - level name
  ///   %m - message
  ///   %F - source file name (KVDNS_LOG_* macros only)
  ///   %l - source line (KVDNS_LOG_* macros only)
  ///   %f - function name (KVDNS_LOG_* macros only)
  ///   %% - literal percent sign
  /// Empty formats are ignored.
  static void setLogFormat(const std::string &format)
  {
    if (format.empty())
    {
      return;
    }
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.logFormat = format;
    compileFormat(format, data.compiledFormat);
  }

  static std::string getLogFormat()
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    return data.logFormat;
  }

  static void trace(const std::string &message) { log(Level::Trace, message); }
  static void debug(const std::string &message) { log(Level::Debug, message); }
  static void info(const std::string &message) { log(Level::Info, message); }
  static void warning(const std::string &message) { log(Level::Warning, message); }
  static void error(const std::string &message) { log(Level::Error, message); }
  static void fatal(const std::string &message) { log(Level::Fatal, message); }

#if defined(__GNUC__) || defined(__clang__)
  __attribute__((format(printf, 2, 3)))
#endif
  static void logf(Level level, const char *fmt, ...)
  {
    va_list args;
    va_start(args, fmt);
    logFormatted(level, fmt, args);
    va_end(args);
  }

  static LoggerStream stream(Level level);

  static void log(Level level, const std::string &message)
  {
    log(level, message, nullptr, 0, nullptr);
  }

  /// \brief Log with source location; \p file may be null when unknown.
  static void log(Level level, const std::string &message, const char *file, int line,
                  const char *function)
  {
    auto &data = getData();
    std::unique_lock<std::mutex> lock(data.mutex);
    if (level < data.minLevel)
    {
      return;
    }
    if (data.compiledFormat.empty())
    {
      compileFormat(data.logFormat, data.compiledFormat);
    }
    auto segments = data.compiledFormat;
    auto timestampFmt = data.timestampFormat;
    lock.unlock();

    std::string output = formatLine(level, message, file, line, function, segments, timestampFmt);

    lock.lock();
    if (data.externalHandler)
    {
      auto handler = data.externalHandler;
      lock.unlock();
      handler(level, output, message);
      return;
    }

    if (data.asyncMode)
    {
      data.queue.push(std::move(output));
      lock.unlock();
      data.cv.notify_one();
      return;
    }

    write(data, output);
  }

  static const char *levelToString(Level level)
  {
    switch (level)
    {
    case Level::Trace:
      return "TRACE";
    case Level::Debug:
      return "DEBUG";
    case Level::Info:
      return "INFO";
    case Level::Warning:
      return "WARN";
    case Level::Error:
      return "ERROR";
    case Level::Fatal:
      return "FATAL";
    default:
      return "UNKNOWN";
    }
  }

private:
  enum class FormatToken
  {
    Literal,
    Timestamp,
    ThreadId,
    Level,
    Message,
    File,
    Line,
    Function
  };

  struct FormatSegment
  {
    FormatToken token;
    std::string literal; ///< Only used when token == Literal
  };

  struct LoggerData
  {
    std::mutex mutex;
    std::condition_variable cv;
    std::queue<std::string> queue;
    std::thread workerThread;
    std::atomic<bool> exit{false};
    bool asyncMode = false;
    Level minLevel = Level::Info;
    std::unique_ptr<std::ofstream> fileStream;
    std::string timestampFormat = "%Y-%m-%d %H:%M:%S";
    ExternalHandler externalHandler;
    std::string logFormat = "[%T] [%L] %m";
    std::vector<FormatSegment> compiledFormat;

    ~LoggerData()
    {
      exit = true;
      cv.notify_all();
      if (workerThread.joinable())
      {
        workerThread.join();
      }
    }
  };

  static LoggerData &getData()
  {
    static LoggerData data;
    return data;
  }

  /// Caller holds data.mutex.
  static void write(LoggerData &data, const std::string &entry)
  {
    if (data.fileStream)
    {
      (*data.fileStream) << entry;
      data.fileStream->flush();
    }
    else
    {
      std::cout << entry;
    }
  }

  /// Caller holds data.mutex.
  static void drainQueue(LoggerData &data)
  {
    while (!data.queue.empty())
    {
      write(data, data.queue.front());
      data.queue.pop();
    }
  }

  static void runWorker()
  {
    auto &data = getData();
    std::unique_lock<std::mutex> lock(data.mutex);
    while (true)
    {
      data.cv.wait(lock, [&data] { return !data.queue.empty() || data.exit; });
      drainQueue(data);
      if (data.exit)
      {
        break;
      }
    }
  }

  static void compileFormat(const std::string &format, std::vector<FormatSegment> &segments)
  {
    segments.clear();
    std::string currentLiteral;

    for (std::size_t i = 0; i < format.size(); ++i)
    {
      if (format[i] != '%' || i + 1 >= format.size())
      {
        currentLiteral += format[i];
        continue;
      }

      FormatToken token = FormatToken::Literal;
      switch (format[i + 1])
      {
      case 'T':
        token = FormatToken::Timestamp;
        break;
      case 't':
        token = FormatToken::ThreadId;
        break;
      case 'L':
        token = FormatToken::Level;
        break;
      case 'm':
        token = FormatToken::Message;
        break;
      case 'F':
        token = FormatToken::File;
        break;
      case 'l':
        token = FormatToken::Line;
        break;
      case 'f':
        token = FormatToken::Function;
        break;
      case '%':
        currentLiteral += '%';
        ++i;
        continue;
      default:
        // Unknown placeholder, keep the % as a literal
        currentLiteral += format[i];
        continue;
      }

      if (!currentLiteral.empty())
      {
        segments.push_back({FormatToken::Literal, std::move(currentLiteral)});
        currentLiteral.clear();
      }
      segments.push_back({token, ""});
      ++i;
    }

    if (!currentLiteral.empty())
    {
      segments.push_back({FormatToken::Literal, std::move(currentLiteral)});
    }
  }

  static void logFormatted(Level level, const char *fmt, va_list args)
  {
    va_list argsCopy;
    va_copy(argsCopy, args);
    int size = std::vsnprintf(nullptr, 0, fmt, argsCopy);
    va_end(argsCopy);

    if (size < 0)
    {
      log(level, "[Logger] Invalid format string");
      return;
    }

    std::vector<char> buffer(static_cast<std::size_t>(size) + 1);
    std::vsnprintf(buffer.data(), buffer.size(), fmt, args);
    log(level, std::string(buffer.data(), static_cast<std::size_t>(size)));
  }

  static std::string timestamp(const std::string &timestampFmt)
  {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, timestampFmt.c_str());
    if (timestampFmt.find("%S") != std::string::npos)
    {
      oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    }
    return oss.str();
  }

  static std::string formatLine(Level level, const std::string &message, const char *file,
                                int line, const char *function,
                                const std::vector<FormatSegment> &segments,
                                const std::string &timestampFmt)
  {
    std::ostringstream oss;
    for (const auto &seg : segments)
    {
      switch (seg.token)
      {
      case FormatToken::Literal:
        oss << seg.literal;
        break;
      case FormatToken::Timestamp:
        oss << timestamp(timestampFmt);
        break;
      case FormatToken::ThreadId:
        {
          std::size_t threadHash = std::hash<std::thread::id>{}(std::this_thread::get_id());
          oss << std::hex << std::setfill('0') << std::setw(sizeof(std::size_t) * 2)
              << threadHash << std::dec;
        }
        break;
      case FormatToken::Level:
        oss << levelToString(level);
        break;
      case FormatToken::Message:
        oss << message;
        break;
      case FormatToken::File:
        if (file)
          oss << detail::basename(file);
        break;
      case FormatToken::Line:
        if (file)
          oss << line;
        break;
      case FormatToken::Function:
        if (function)
          oss << function;
        break;
      }
    }
    oss << '\n';
    return oss.str();
  }
};

/// \brief Collects streamed values and emits them as one line on destruction
/// or on Logger::endl.
class LoggerStream
{
public:
  explicit LoggerStream(Logger::Level level) : _level(level), _flushed(false) {}

  LoggerStream(LoggerStream &&other) noexcept
      : _level(other._level), _stream(std::move(other._stream)), _flushed(other._flushed)
  {
    other._flushed = true;
  }

  template <typename T> LoggerStream &operator<<(const T &value)
  {
    _stream << value;
    return *this;
  }

  LoggerStream &operator<<(Logger::Endl)
  {
    flush();
    return *this;
  }

  ~LoggerStream()
  {
    if (!_flushed && !_stream.str().empty())
    {
      try
      {
        flush();
      }
      catch (const std::exception &e)
      {
        std::cerr << "[Logger] Failed to emit streamed line: " << e.what() << std::endl;
      }
    }
  }

private:
  Logger::Level _level;
  std::ostringstream _stream;
  bool _flushed;

  void flush()
  {
    Logger::log(_level, _stream.str());
    _stream.str("");
    _flushed = true;
  }
};

inline LoggerStream Logger::stream(Logger::Level level) { return LoggerStream(level); }

} // namespace core
} // namespace kvdns

/// \brief Stream-style logging with source location
#define KVDNS_LOG_WITH_LEVEL(level, msg)                                                           \
  do                                                                                               \
  {                                                                                                \
    std::ostringstream _kvdnsOss;                                                                  \
    _kvdnsOss << msg;                                                                              \
    kvdns::core::Logger::log(kvdns::core::Logger::Level::level, _kvdnsOss.str(), __FILE__,         \
                             __LINE__, __func__);                                                  \
  } while (0)

#define KVDNS_LOG_TRACE(msg) KVDNS_LOG_WITH_LEVEL(Trace, msg)
#define KVDNS_LOG_DEBUG(msg) KVDNS_LOG_WITH_LEVEL(Debug, msg)
#define KVDNS_LOG_INFO(msg) KVDNS_LOG_WITH_LEVEL(Info, msg)
#define KVDNS_LOG_WARN(msg) KVDNS_LOG_WITH_LEVEL(Warning, msg)
#define KVDNS_LOG_ERROR(msg) KVDNS_LOG_WITH_LEVEL(Error, msg)
#define KVDNS_LOG_FATAL(msg) KVDNS_LOG_WITH_LEVEL(Fatal, msg)

/// \brief Printf-style logging with source location.
/// \warning Lines are cut at 4095 bytes; use Logger::logf() for longer ones.
#define KVDNS_LOG_WITH_LEVELF(level, fmt, ...)                                                     \
  do                                                                                               \
  {                                                                                                \
    char _kvdnsBuf[4096];                                                                          \
    std::snprintf(_kvdnsBuf, sizeof(_kvdnsBuf), fmt, ##__VA_ARGS__);                               \
    kvdns::core::Logger::log(kvdns::core::Logger::Level::level, _kvdnsBuf, __FILE__, __LINE__,     \
                             __func__);                                                            \
  } while (0)

#define KVDNS_LOG_TRACEF(fmt, ...) KVDNS_LOG_WITH_LEVELF(Trace, fmt, ##__VA_ARGS__)
#define KVDNS_LOG_DEBUGF(fmt, ...) KVDNS_LOG_WITH_LEVELF(Debug, fmt, ##__VA_ARGS__)
#define KVDNS_LOG_INFOF(fmt, ...) KVDNS_LOG_WITH_LEVELF(Info, fmt, ##__VA_ARGS__)
#define KVDNS_LOG_WARNF(fmt, ...) KVDNS_LOG_WITH_LEVELF(Warning, fmt, ##__VA_ARGS__)
#define KVDNS_LOG_ERRORF(fmt, ...) KVDNS_LOG_WITH_LEVELF(Error, fmt, ##__VA_ARGS__)
#define KVDNS_LOG_FATALF(fmt, ...) KVDNS_LOG_WITH_LEVELF(Fatal, fmt, ##__VA_ARGS__)
