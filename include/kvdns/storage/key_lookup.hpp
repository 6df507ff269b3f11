// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Kvdns, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include "kvdns/core/logger.hpp"

namespace kvdns
{
namespace storage
{

  /// \brief Thrown when the backing store cannot be reached or answers with
  /// an error. A missing key is not an error.
  class KeyLookupException : public std::runtime_error
  {
  public:
    explicit KeyLookupException(const std::string& message)
      : std::runtime_error(message)
    {
    }
  };

  /// \brief Read-only string lookup used by the resolver.
  ///
  /// Implementations are shared by all request handlers and must be safe to
  /// call from several threads at once.
  class KeyLookup
  {
  public:
    virtual ~KeyLookup() = default;

    /// \brief Value stored under \p key, or an empty string when absent.
    /// \throws KeyLookupException on store failure.
    virtual std::string get(const std::string& key) = 0;
  };

  /// \brief Map-backed lookup for tests and static deployments.
  class InMemoryKeyLookup : public KeyLookup
  {
  public:
    InMemoryKeyLookup() = default;

    explicit InMemoryKeyLookup(
        std::unordered_map<std::string, std::string> entries)
      : _entries(std::move(entries))
    {
    }

    void set(const std::string& key, const std::string& value)
    {
      std::unique_lock<std::shared_mutex> lock(_mutex);
      _entries[key] = value;
    }

    bool remove(const std::string& key)
    {
      std::unique_lock<std::shared_mutex> lock(_mutex);
      return _entries.erase(key) > 0;
    }

    std::string get(const std::string& key) override
    {
      std::shared_lock<std::shared_mutex> lock(_mutex);
      auto it = _entries.find(key);
      if (it == _entries.end())
      {
        kvdns::core::Logger::trace("InMemoryKeyLookup: Key '" + key +
                                   "' not found");
        return std::string();
      }
      return it->second;
    }

  private:
    mutable std::shared_mutex _mutex;
    std::unordered_map<std::string, std::string> _entries;
  };

} // namespace storage
} // namespace kvdns
