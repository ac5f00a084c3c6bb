// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of svgtr, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once
/// \file minimal_toml.hpp
/// \brief Read-only TOML subset used for svgtr configuration files.
///
/// Supported: [tables] and [dotted.tables], bare and dotted keys, basic and
/// literal strings, integers, floats, booleans, single-line and multi-line
/// arrays of scalars, '#' comments. Not supported: inline tables, arrays of
/// tables, dates, multi-line strings.
///
/// Tables are flattened: every value is stored under its full dotted path,
/// e.g. "[svgtr.log]\nlevel = 'debug'" yields key "svgtr.log.level".

#include <cctype>
#include <cstdint>
#include <fstream>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace svgtr
{
namespace parsers
{
namespace toml
{

using scalar = std::variant<int64_t, double, bool, std::string>;
using array = std::vector<scalar>;
using value = std::variant<int64_t, double, bool, std::string, array>;

/// \brief Raised for malformed input; carries the 1-based line number.
class parse_error : public std::runtime_error
{
public:
  parse_error(const std::string &msg, std::size_t line)
      : std::runtime_error("line " + std::to_string(line) + ": " + msg), _line(line)
  {
  }

  std::size_t line() const { return _line; }

private:
  std::size_t _line;
};

/// \brief Flattened table of dotted keys to values.
class table
{
public:
  using container_type = std::map<std::string, value>;
  using const_iterator = container_type::const_iterator;

  bool contains(const std::string &dottedKey) const
  {
    return _values.find(dottedKey) != _values.end();
  }

  /// \brief True when at least one key lives below the given table path.
  bool hasTable(const std::string &path) const
  {
    auto it = _values.lower_bound(path + ".");
    return it != _values.end() && it->first.compare(0, path.size() + 1, path + ".") == 0;
  }

  bool empty() const { return _values.empty(); }
  std::size_t size() const { return _values.size(); }

  const value *find(const std::string &dottedKey) const
  {
    auto it = _values.find(dottedKey);
    return it == _values.end() ? nullptr : &it->second;
  }

  template <typename T> std::optional<T> get(const std::string &dottedKey) const
  {
    const value *v = find(dottedKey);
    if (!v)
    {
      return std::nullopt;
    }
    if constexpr (std::is_same_v<T, double>)
    {
      if (auto *i = std::get_if<int64_t>(v))
      {
        return static_cast<double>(*i);
      }
    }
    if (auto *typed = std::get_if<T>(v))
    {
      return *typed;
    }
    return std::nullopt;
  }

  /// \brief Inserts a value; a duplicate key is a parse error in TOML.
  bool insert(const std::string &dottedKey, value v)
  {
    return _values.emplace(dottedKey, std::move(v)).second;
  }

  const_iterator begin() const { return _values.begin(); }
  const_iterator end() const { return _values.end(); }

private:
  container_type _values;
};

class parser
{
public:
  explicit parser(std::string input) : _input(std::move(input)) {}

  table parse()
  {
    table result;
    std::string section;

    while (true)
    {
      skipBlankLinesAndComments();
      if (isEnd())
      {
        break;
      }
      if (peek() == '[')
      {
        section = parseSectionHeader();
      }
      else
      {
        std::string key = parseKey();
        skipInlineSpace();
        expect('=');
        skipInlineSpace();
        value v = parseValue();
        std::string fullKey = section.empty() ? key : section + "." + key;
        if (!result.insert(fullKey, std::move(v)))
        {
          throw parse_error("duplicate key '" + fullKey + "'", _line);
        }
      }
      finishLine();
    }
    return result;
  }

private:
  std::string _input;
  std::size_t _pos{0};
  std::size_t _line{1};

  bool isEnd() const { return _pos >= _input.size(); }
  char peek() const { return isEnd() ? '\0' : _input[_pos]; }

  char advance()
  {
    if (isEnd())
    {
      return '\0';
    }
    char c = _input[_pos++];
    if (c == '\n')
    {
      ++_line;
    }
    return c;
  }

  void expect(char c)
  {
    if (peek() != c)
    {
      throw parse_error(std::string("expected '") + c + "'", _line);
    }
    advance();
  }

  void skipInlineSpace()
  {
    while (peek() == ' ' || peek() == '\t')
    {
      advance();
    }
  }

  void skipComment()
  {
    if (peek() == '#')
    {
      while (!isEnd() && peek() != '\n')
      {
        advance();
      }
    }
  }

  void skipBlankLinesAndComments()
  {
    while (!isEnd())
    {
      char c = peek();
      if (c == ' ' || c == '\t' || c == '\r' || c == '\n')
      {
        advance();
      }
      else if (c == '#')
      {
        skipComment();
      }
      else
      {
        break;
      }
    }
  }

  void finishLine()
  {
    skipInlineSpace();
    skipComment();
    if (peek() == '\r')
    {
      advance();
    }
    if (!isEnd() && peek() != '\n')
    {
      throw parse_error("unexpected trailing characters", _line);
    }
  }

  std::string parseSectionHeader()
  {
    advance(); // '['
    if (peek() == '[')
    {
      throw parse_error("arrays of tables are not supported", _line);
    }
    skipInlineSpace();
    std::string name = parseKey();
    skipInlineSpace();
    expect(']');
    return name;
  }

  /// Bare or quoted key segments joined by '.'.
  std::string parseKey()
  {
    std::string key;
    while (true)
    {
      skipInlineSpace();
      if (peek() == '"' || peek() == '\'')
      {
        key += parseString();
      }
      else
      {
        std::size_t start = _pos;
        while (!isEnd() &&
               (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_' || peek() == '-'))
        {
          advance();
        }
        if (start == _pos)
        {
          throw parse_error("expected key", _line);
        }
        key.append(_input, start, _pos - start);
      }
      skipInlineSpace();
      if (peek() != '.')
      {
        break;
      }
      advance();
      key.push_back('.');
    }
    return key;
  }

  value parseValue()
  {
    char c = peek();
    if (c == '[')
    {
      return parseArray();
    }
    scalar s = parseScalar();
    return std::visit([](auto &&v) -> value { return v; }, s);
  }

  scalar parseScalar()
  {
    char c = peek();
    if (c == '"' || c == '\'')
    {
      return parseString();
    }
    if (c == 't' || c == 'f')
    {
      return parseBool();
    }
    if (c == '+' || c == '-' || std::isdigit(static_cast<unsigned char>(c)))
    {
      return parseNumber();
    }
    throw parse_error("invalid value", _line);
  }

  array parseArray()
  {
    advance(); // '['
    array arr;
    while (true)
    {
      skipBlankLinesAndComments();
      if (peek() == ']')
      {
        advance();
        return arr;
      }
      if (isEnd())
      {
        throw parse_error("unterminated array", _line);
      }
      arr.push_back(parseScalar());
      skipBlankLinesAndComments();
      if (peek() == ',')
      {
        advance();
      }
      else if (peek() != ']')
      {
        throw parse_error("expected ',' or ']' in array", _line);
      }
    }
  }

  std::string parseString()
  {
    char quote = advance();
    std::string str;
    while (!isEnd() && peek() != quote && peek() != '\n')
    {
      char c = advance();
      if (c == '\\' && quote == '"')
      {
        char e = advance();
        switch (e)
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
        case '\\':
          str += '\\';
          break;
        case '"':
          str += '"';
          break;
        default:
          throw parse_error(std::string("unsupported escape '\\") + e + "'", _line);
        }
      }
      else
      {
        str += c;
      }
    }
    if (peek() != quote)
    {
      throw parse_error("unterminated string", _line);
    }
    advance();
    return str;
  }

  bool parseBool()
  {
    if (_input.compare(_pos, 4, "true") == 0)
    {
      _pos += 4;
      return true;
    }
    if (_input.compare(_pos, 5, "false") == 0)
    {
      _pos += 5;
      return false;
    }
    throw parse_error("invalid boolean", _line);
  }

  scalar parseNumber()
  {
    std::string num;
    bool isFloat = false;
    if (peek() == '+' || peek() == '-')
    {
      num += advance();
    }
    while (!isEnd())
    {
      char c = peek();
      if (std::isdigit(static_cast<unsigned char>(c)))
      {
        num += advance();
      }
      else if (c == '_')
      {
        advance();
      }
      else if (c == '.' || c == 'e' || c == 'E' ||
               ((c == '+' || c == '-') && !num.empty() && (num.back() == 'e' || num.back() == 'E')))
      {
        isFloat = true;
        num += advance();
      }
      else
      {
        break;
      }
    }
    try
    {
      if (isFloat)
      {
        return std::stod(num);
      }
      return static_cast<int64_t>(std::stoll(num));
    }
    catch (const std::exception &)
    {
      throw parse_error("invalid number '" + num + "'", _line);
    }
  }
};

inline table parse(const std::string &tomlString)
{
  parser p(tomlString);
  return p.parse();
}

inline table parse_file(const std::string &filename)
{
  std::ifstream file(filename);
  if (!file.is_open())
  {
    throw std::runtime_error("Cannot open file: " + filename);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

} // namespace toml
} // namespace parsers
} // namespace svgtr
