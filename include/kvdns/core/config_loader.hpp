// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Kvdns, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <kvdns/parsers/minimal_toml.hpp>
#include <optional>
#include <stdexcept>
#include <string>

namespace kvdns
{
namespace core
{
/// \brief Loads a TOML configuration file and serves typed values by dotted
/// key.
class ConfigLoader
{
public:
  /// \brief Loads \p filename.
  /// \throws std::runtime_error if the file cannot be read or parsed.
  explicit ConfigLoader(const std::string &filename) : _filename(filename)
  {
    _table = parsers::toml::parse_file(_filename);
  }

  /// \brief Re-reads the file; keeps the previous table and returns false on
  /// failure.
  bool reload()
  {
    try
    {
      _table = parsers::toml::parse_file(_filename);
      return true;
    }
    catch (const std::exception &)
    {
      return false;
    }
  }

  const std::string &filename() const { return _filename; }

  const parsers::toml::table &table() const { return _table; }

  /// \tparam T int64_t, double, bool or std::string
  template <typename T> std::optional<T> get(const std::string &dottedKey) const
  {
    auto node = _table.at_path(dottedKey);
    if (!node)
    {
      return std::nullopt;
    }
    return node.as<T>();
  }

  std::optional<int64_t> getInt(const std::string &key) const { return get<int64_t>(key); }

  std::optional<bool> getBool(const std::string &key) const { return get<bool>(key); }

  std::optional<std::string> getString(const std::string &key) const
  {
    return get<std::string>(key);
  }

private:
  std::string _filename;
  parsers::toml::table _table;
};

} // namespace core
} // namespace kvdns
