// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Kvdns, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cctype>
#include <cstdint>
#include <fstream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace kvdns
{
namespace parsers
{
namespace toml
{

/// Subset of TOML used by kvdns configuration files: [dotted.sections],
/// key = value pairs, basic and literal strings, integers, floats, booleans,
/// single-line arrays and # comments.

class table;
class array;

using value_type = std::variant<std::monostate, int64_t, double, bool, std::string,
                                std::shared_ptr<table>, std::shared_ptr<array>>;

/// \brief Thrown for malformed input, with the 1-based line number.
class parse_error : public std::runtime_error
{
public:
  parse_error(const std::string &message, std::size_t line)
      : std::runtime_error("TOML parse error at line " + std::to_string(line) + ": " + message),
        _line(line)
  {
  }

  std::size_t line() const { return _line; }

private:
  std::size_t _line;
};

class array
{
public:
  using container_type = std::vector<value_type>;

  void push_back(value_type val) { _values.push_back(std::move(val)); }
  std::size_t size() const { return _values.size(); }
  bool empty() const { return _values.empty(); }
  container_type::const_iterator begin() const { return _values.begin(); }
  container_type::const_iterator end() const { return _values.end(); }
  const value_type &operator[](std::size_t idx) const { return _values[idx]; }

private:
  container_type _values;
};

class node
{
public:
  node() = default;
  node(value_type val) : _value(std::move(val)) {}

  bool is_value() const { return !std::holds_alternative<std::monostate>(_value); }
  bool is_string() const { return std::holds_alternative<std::string>(_value); }
  bool is_integer() const { return std::holds_alternative<int64_t>(_value); }
  bool is_boolean() const { return std::holds_alternative<bool>(_value); }
  bool is_array() const { return std::holds_alternative<std::shared_ptr<array>>(_value); }
  bool is_table() const { return std::holds_alternative<std::shared_ptr<table>>(_value); }

  /// \brief Typed access; integers also convert to double.
  template <typename T> std::optional<T> as() const
  {
    if constexpr (std::is_same_v<T, double>)
    {
      if (auto *val = std::get_if<double>(&_value))
        return *val;
      if (auto *val = std::get_if<int64_t>(&_value))
        return static_cast<double>(*val);
      return std::nullopt;
    }
    else
    {
      if (auto *val = std::get_if<T>(&_value))
        return *val;
      return std::nullopt;
    }
  }

  const array *as_array() const
  {
    if (auto *val = std::get_if<std::shared_ptr<array>>(&_value))
      return val->get();
    return nullptr;
  }

  table *as_table() const
  {
    if (auto *val = std::get_if<std::shared_ptr<table>>(&_value))
      return val->get();
    return nullptr;
  }

  explicit operator bool() const { return is_value(); }

private:
  value_type _value;
};

class table
{
public:
  using container_type = std::unordered_map<std::string, node>;

  bool contains(const std::string &key) const { return _values.find(key) != _values.end(); }
  bool empty() const { return _values.empty(); }
  std::size_t size() const { return _values.size(); }

  node &operator[](const std::string &key) { return _values[key]; }

  void insert(const std::string &key, node value) { _values[key] = std::move(value); }

  /// \brief Look up "a.b.c" through nested tables; an empty node when any
  /// part is missing.
  node at_path(const std::string &dottedPath) const
  {
    const table *current = this;
    std::size_t start = 0;
    while (current)
    {
      std::size_t dot = dottedPath.find('.', start);
      std::string part = dottedPath.substr(start, dot == std::string::npos ? std::string::npos
                                                                           : dot - start);
      auto it = current->_values.find(part);
      if (it == current->_values.end())
        return node();
      if (dot == std::string::npos)
        return it->second;
      current = it->second.as_table();
      start = dot + 1;
    }
    return node();
  }

  container_type::const_iterator begin() const { return _values.begin(); }
  container_type::const_iterator end() const { return _values.end(); }

private:
  container_type _values;
};

class parser
{
public:
  explicit parser(std::string input) : _input(std::move(input)) {}

  table parse()
  {
    table root;
    table *current = &root;

    while (true)
    {
      skipBlank();
      if (isEnd())
        break;

      if (peek() == '[')
      {
        current = ensureTable(root, parseSection());
      }
      else
      {
        parseKeyValue(*current);
      }
      expectLineEnd();
    }
    return root;
  }

private:
  std::string _input;
  std::size_t _pos = 0;
  std::size_t _line = 1;

  bool isEnd() const { return _pos >= _input.size(); }
  char peek() const { return isEnd() ? '\0' : _input[_pos]; }

  char advance()
  {
    if (isEnd())
      return '\0';
    char c = _input[_pos++];
    if (c == '\n')
      ++_line;
    return c;
  }

  [[noreturn]] void fail(const std::string &message) const { throw parse_error(message, _line); }

  void skipSpaces()
  {
    while (peek() == ' ' || peek() == '\t')
      advance();
  }

  void skipComment()
  {
    if (peek() == '#')
    {
      while (!isEnd() && peek() != '\n')
        advance();
    }
  }

  /// Whitespace, newlines and comments between statements.
  void skipBlank()
  {
    while (!isEnd())
    {
      if (std::isspace(static_cast<unsigned char>(peek())))
        advance();
      else if (peek() == '#')
        skipComment();
      else
        break;
    }
  }

  void expectLineEnd()
  {
    skipSpaces();
    skipComment();
    if (!isEnd() && peek() != '\n' && peek() != '\r')
      fail(std::string("unexpected character '") + peek() + "'");
  }

  static bool isKeyChar(char c)
  {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.';
  }

  std::string parseSection()
  {
    advance(); // '['
    skipSpaces();
    std::string section;
    while (isKeyChar(peek()))
      section += advance();
    skipSpaces();
    if (peek() != ']')
      fail("unterminated section header");
    advance();
    if (section.empty())
      fail("empty section name");
    return section;
  }

  void parseKeyValue(table &target)
  {
    std::string key;
    while (isKeyChar(peek()))
      key += advance();
    if (key.empty())
      fail(std::string("expected a key, found '") + peek() + "'");

    skipSpaces();
    if (peek() != '=')
      fail("expected '=' after key '" + key + "'");
    advance();
    skipSpaces();

    // Dotted keys create nested tables
    std::size_t dot = key.rfind('.');
    if (dot == std::string::npos)
    {
      target.insert(key, node(parseValue()));
    }
    else
    {
      ensureTable(target, key.substr(0, dot))->insert(key.substr(dot + 1), node(parseValue()));
    }
  }

  value_type parseValue()
  {
    char c = peek();
    if (c == '"' || c == '\'')
      return parseString();
    if (c == '[')
      return parseArray();
    if (c == 't' || c == 'f')
      return parseBool();
    if (c == '+' || c == '-' || std::isdigit(static_cast<unsigned char>(c)))
      return parseNumber();
    fail("invalid value");
  }

  std::string parseString()
  {
    char quote = advance();
    std::string str;
    while (!isEnd() && peek() != quote && peek() != '\n')
    {
      char c = advance();
      if (c != '\\' || quote == '\'')
      {
        str += c;
        continue;
      }
      char esc = advance();
      switch (esc)
      {
      case 'n':
        str += '\n';
        break;
      case 't':
        str += '\t';
        break;
      case 'r':
        str += '\r';
        break;
      default:
        str += esc;
      }
    }
    if (peek() != quote)
      fail("unterminated string");
    advance();
    return str;
  }

  value_type parseArray()
  {
    advance(); // '['
    auto arr = std::make_shared<array>();
    skipBlank();
    while (!isEnd() && peek() != ']')
    {
      arr->push_back(parseValue());
      skipBlank();
      if (peek() == ',')
      {
        advance();
        skipBlank();
      }
      else if (peek() != ']')
      {
        fail("expected ',' or ']' in array");
      }
    }
    if (peek() != ']')
      fail("unterminated array");
    advance();
    return arr;
  }

  bool parseBool()
  {
    std::string word;
    while (std::isalpha(static_cast<unsigned char>(peek())))
      word += advance();
    if (word == "true")
      return true;
    if (word == "false")
      return false;
    fail("invalid boolean value: " + word);
  }

  value_type parseNumber()
  {
    std::string num;
    bool isFloat = false;
    if (peek() == '+' || peek() == '-')
      num += advance();
    while (std::isdigit(static_cast<unsigned char>(peek())) || peek() == '.' || peek() == 'e' ||
           peek() == 'E' || peek() == '_' || ((peek() == '+' || peek() == '-') && !num.empty() &&
                                              (num.back() == 'e' || num.back() == 'E')))
    {
      char c = advance();
      if (c == '_')
        continue;
      if (c == '.' || c == 'e' || c == 'E')
        isFloat = true;
      num += c;
    }

    try
    {
      std::size_t used = 0;
      value_type result = isFloat ? value_type(std::stod(num, &used))
                                  : value_type(static_cast<int64_t>(std::stoll(num, &used)));
      if (used != num.size())
        fail("invalid number: " + num);
      return result;
    }
    catch (const std::logic_error &)
    {
      fail("invalid number: " + num);
    }
  }

  table *ensureTable(table &root, const std::string &path)
  {
    table *current = &root;
    std::stringstream ss(path);
    std::string part;
    while (std::getline(ss, part, '.'))
    {
      if (!current->contains(part))
        current->insert(part, node(std::make_shared<table>()));
      current = (*current)[part].as_table();
      if (!current)
        fail("'" + path + "' is not a table");
    }
    return current;
  }
};

inline table parse(const std::string &tomlString) { return parser(tomlString).parse(); }

inline table parse_file(const std::string &filename)
{
  std::ifstream file(filename);
  if (!file.is_open())
    throw std::runtime_error("Cannot open file: " + filename);

  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

} // namespace toml
} // namespace parsers
} // namespace kvdns
