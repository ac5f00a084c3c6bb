// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of svgtr, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once
/// \file json.hpp
/// \brief Small JSON value type with a non-throwing parser and a
/// deterministic serializer, used for translation mapping files.
///
/// Objects are ordered maps, so serialization is stable regardless of
/// insertion order. Strings are UTF-8; \uXXXX escapes (including surrogate
/// pairs) are decoded on input and non-ASCII text is written unescaped.

#include <cctype>
#include <charconv>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace svgtr
{
namespace parsers
{

enum class JsonType
{
  Null,
  Boolean,
  Int,
  Double,
  String,
  Array,
  Object
};

/// \brief Location of a parse error in the source text.
struct JsonLocation
{
  std::size_t offset{0};
  std::size_t line{1};
  std::size_t column{1};
};

struct JsonError
{
  std::string message;
  JsonLocation where;

  std::string toString() const
  {
    return "line " + std::to_string(where.line) + ", column " + std::to_string(where.column) +
           ": " + message;
  }
};

/// \brief Parse limits to prevent resource exhaustion.
struct ParseLimits
{
  std::size_t depthMax{64};
  std::size_t stringLengthMax{1u << 20};
};

struct SerializeOptions
{
  bool pretty{false};
  std::string indent{"  "};
};

struct ParseResult;

class Json
{
public:
  using Array = std::vector<Json>;
  using Object = std::map<std::string, Json>;

  class type_error : public std::runtime_error
  {
  public:
    explicit type_error(const std::string &msg) : std::runtime_error(msg) {}
  };

  class parse_error : public std::runtime_error
  {
  public:
    explicit parse_error(const std::string &msg) : std::runtime_error(msg) {}
  };

  Json() : _value(nullptr) {}
  Json(std::nullptr_t) : _value(nullptr) {}
  Json(bool b) : _value(b) {}
  template <typename T,
            std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>, int> = 0>
  Json(T i) : _value(static_cast<std::int64_t>(i))
  {
  }
  Json(double d) : _value(d) {}
  Json(const char *s) : _value(std::string(s)) {}
  Json(const std::string &s) : _value(s) {}
  Json(std::string &&s) : _value(std::move(s)) {}
  Json(Array a) : _value(std::move(a)) {}
  Json(Object o) : _value(std::move(o)) {}

  static Json object() { return Json(Object{}); }
  static Json array() { return Json(Array{}); }

  JsonType type() const { return static_cast<JsonType>(_value.index()); }

  bool isNull() const { return type() == JsonType::Null; }
  bool isBool() const { return type() == JsonType::Boolean; }
  bool isNumber() const { return type() == JsonType::Int || type() == JsonType::Double; }
  bool isString() const { return type() == JsonType::String; }
  bool isArray() const { return type() == JsonType::Array; }
  bool isObject() const { return type() == JsonType::Object; }

  bool getBool() const { return as<bool>("boolean"); }
  std::int64_t getInt() const { return as<std::int64_t>("integer"); }
  double getDouble() const
  {
    if (type() == JsonType::Int)
    {
      return static_cast<double>(std::get<std::int64_t>(_value));
    }
    return as<double>("number");
  }
  const std::string &getString() const { return as<std::string>("string"); }
  const Array &getArray() const { return as<Array>("array"); }
  const Object &getObject() const { return as<Object>("object"); }
  Array &getArray() { return asMutable<Array>("array"); }
  Object &getObject() { return asMutable<Object>("object"); }

  std::size_t size() const
  {
    if (isArray())
      return getArray().size();
    if (isObject())
      return getObject().size();
    return 0;
  }

  bool contains(const std::string &key) const { return find(key) != nullptr; }

  /// \brief Member lookup; nullptr when absent or when this is not an object.
  const Json *find(const std::string &key) const
  {
    if (!isObject())
    {
      return nullptr;
    }
    const auto &obj = std::get<Object>(_value);
    auto it = obj.find(key);
    return it == obj.end() ? nullptr : &it->second;
  }

  /// \brief Object member access; converts a null value to an empty object.
  Json &operator[](const std::string &key)
  {
    if (isNull())
    {
      _value = Object{};
    }
    return asMutable<Object>("object")[key];
  }

  void push_back(Json value)
  {
    if (isNull())
    {
      _value = Array{};
    }
    asMutable<Array>("array").push_back(std::move(value));
  }

  bool operator==(const Json &other) const { return _value == other._value; }
  bool operator!=(const Json &other) const { return !(*this == other); }

  std::string dump(const SerializeOptions &options = SerializeOptions{}) const
  {
    std::string out;
    serialize(out, options, 0);
    return out;
  }

  /// \brief Pretty print with the given indent width (0 = compact).
  std::string dump(int indent) const
  {
    SerializeOptions opt;
    opt.pretty = indent > 0;
    opt.indent = std::string(indent > 0 ? static_cast<std::size_t>(indent) : 0, ' ');
    return dump(opt);
  }

  static ParseResult parse(std::string_view text, const ParseLimits &limits = ParseLimits{});
  static Json parseOrThrow(std::string_view text, const ParseLimits &limits = ParseLimits{});

  static void escapeString(std::string_view str, std::string &out)
  {
    out.push_back('"');
    for (char c : str)
    {
      switch (c)
      {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\b':
        out += "\\b";
        break;
      case '\f':
        out += "\\f";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        if (static_cast<unsigned char>(c) < 0x20)
        {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
          out += buf;
        }
        else
        {
          out.push_back(c);
        }
      }
    }
    out.push_back('"');
  }

private:
  using Value =
    std::variant<std::nullptr_t, bool, std::int64_t, double, std::string, Array, Object>;
  Value _value;

  template <typename T> const T &as(const char *what) const
  {
    if (auto *v = std::get_if<T>(&_value))
    {
      return *v;
    }
    throw type_error(std::string("JSON value is not a ") + what);
  }

  template <typename T> T &asMutable(const char *what)
  {
    if (auto *v = std::get_if<T>(&_value))
    {
      return *v;
    }
    throw type_error(std::string("JSON value is not a ") + what);
  }

  void newline(std::string &out, const SerializeOptions &options, int depth) const
  {
    if (!options.pretty)
    {
      return;
    }
    out.push_back('\n');
    for (int i = 0; i < depth; ++i)
    {
      out += options.indent;
    }
  }

  void serialize(std::string &out, const SerializeOptions &options, int depth) const
  {
    switch (type())
    {
    case JsonType::Null:
      out += "null";
      break;
    case JsonType::Boolean:
      out += getBool() ? "true" : "false";
      break;
    case JsonType::Int:
      out += std::to_string(getInt());
      break;
    case JsonType::Double:
    {
      char buf[32];
      std::snprintf(buf, sizeof(buf), "%.17g", std::get<double>(_value));
      out += buf;
      break;
    }
    case JsonType::String:
      escapeString(getString(), out);
      break;
    case JsonType::Array:
    {
      const auto &arr = getArray();
      if (arr.empty())
      {
        out += "[]";
        break;
      }
      out.push_back('[');
      for (std::size_t i = 0; i < arr.size(); ++i)
      {
        if (i > 0)
        {
          out.push_back(',');
        }
        newline(out, options, depth + 1);
        arr[i].serialize(out, options, depth + 1);
      }
      newline(out, options, depth);
      out.push_back(']');
      break;
    }
    case JsonType::Object:
    {
      const auto &obj = getObject();
      if (obj.empty())
      {
        out += "{}";
        break;
      }
      out.push_back('{');
      bool first = true;
      for (const auto &[key, value] : obj)
      {
        if (!first)
        {
          out.push_back(',');
        }
        first = false;
        newline(out, options, depth + 1);
        escapeString(key, out);
        out += options.pretty ? ": " : ":";
        value.serialize(out, options, depth + 1);
      }
      newline(out, options, depth);
      out.push_back('}');
      break;
    }
    }
  }
};

/// \brief Result of a non-throwing parse operation.
struct ParseResult
{
  Json value;
  bool ok{false};
  JsonError error;
};

class JsonParser
{
public:
  JsonParser(std::string_view text, const ParseLimits &limits) : _text(text), _limits(limits) {}

  ParseResult parse()
  {
    ParseResult result;
    if (_text.size() >= 3 && _text.compare(0, 3, "\xEF\xBB\xBF") == 0)
    {
      _pos = 3;
    }
    if (parseValue(result.value, 0))
    {
      skipWhitespace();
      if (_pos < _text.size())
      {
        _error = "Extra characters after JSON value";
      }
      else
      {
        result.ok = true;
        return result;
      }
    }
    result.value = Json();
    result.error.message = _error.empty() ? "Parse error" : _error;
    result.error.where = location();
    return result;
  }

private:
  std::string_view _text;
  std::size_t _pos{0};
  ParseLimits _limits;
  std::string _error;

  JsonLocation location() const
  {
    JsonLocation loc;
    loc.offset = _pos;
    for (std::size_t i = 0; i < _pos && i < _text.size(); ++i)
    {
      if (_text[i] == '\n')
      {
        ++loc.line;
        loc.column = 1;
      }
      else
      {
        ++loc.column;
      }
    }
    return loc;
  }

  bool fail(const char *msg)
  {
    _error = msg;
    return false;
  }

  void skipWhitespace()
  {
    while (_pos < _text.size() && (_text[_pos] == ' ' || _text[_pos] == '\t' ||
                                   _text[_pos] == '\n' || _text[_pos] == '\r'))
    {
      ++_pos;
    }
  }

  bool consumeLiteral(std::string_view word)
  {
    if (_text.compare(_pos, word.size(), word) == 0)
    {
      _pos += word.size();
      return true;
    }
    return false;
  }

  bool parseValue(Json &out, std::size_t depth)
  {
    if (depth > _limits.depthMax)
    {
      return fail("Maximum nesting depth exceeded");
    }
    skipWhitespace();
    if (_pos >= _text.size())
    {
      return fail("Unexpected end of input");
    }
    char c = _text[_pos];
    switch (c)
    {
    case 'n':
      if (consumeLiteral("null"))
      {
        out = Json();
        return true;
      }
      return fail("Invalid literal");
    case 't':
      if (consumeLiteral("true"))
      {
        out = Json(true);
        return true;
      }
      return fail("Invalid literal");
    case 'f':
      if (consumeLiteral("false"))
      {
        out = Json(false);
        return true;
      }
      return fail("Invalid literal");
    case '"':
    {
      std::string s;
      if (!parseString(s))
      {
        return false;
      }
      out = Json(std::move(s));
      return true;
    }
    case '[':
      return parseArray(out, depth);
    case '{':
      return parseObject(out, depth);
    default:
      if (c == '-' || std::isdigit(static_cast<unsigned char>(c)))
      {
        return parseNumber(out);
      }
      return fail("Unexpected character");
    }
  }

  bool parseNumber(Json &out)
  {
    auto isDigit = [this]() {
      return _pos < _text.size() && std::isdigit(static_cast<unsigned char>(_text[_pos]));
    };
    std::size_t start = _pos;
    if (_text[_pos] == '-')
    {
      ++_pos;
    }
    if (!isDigit())
    {
      return fail("Invalid number format");
    }
    if (_text[_pos] == '0')
    {
      ++_pos;
    }
    else
    {
      while (isDigit())
        ++_pos;
    }
    bool isFloat = false;
    if (_pos < _text.size() && _text[_pos] == '.')
    {
      isFloat = true;
      ++_pos;
      if (!isDigit())
      {
        return fail("Invalid number format");
      }
      while (isDigit())
        ++_pos;
    }
    if (_pos < _text.size() && (_text[_pos] == 'e' || _text[_pos] == 'E'))
    {
      isFloat = true;
      ++_pos;
      if (_pos < _text.size() && (_text[_pos] == '+' || _text[_pos] == '-'))
      {
        ++_pos;
      }
      if (!isDigit())
      {
        return fail("Invalid number format");
      }
      while (isDigit())
        ++_pos;
    }
    std::string_view num = _text.substr(start, _pos - start);
    if (!isFloat)
    {
      std::int64_t i = 0;
      auto res = std::from_chars(num.data(), num.data() + num.size(), i);
      if (res.ec == std::errc{})
      {
        out = Json(i);
        return true;
      }
    }
    out = Json(std::strtod(std::string(num).c_str(), nullptr));
    return true;
  }

  bool parseHex4(std::uint32_t &cp)
  {
    if (_pos + 4 > _text.size())
    {
      return fail("Truncated unicode escape");
    }
    cp = 0;
    for (int i = 0; i < 4; ++i)
    {
      char c = _text[_pos++];
      cp <<= 4;
      if (c >= '0' && c <= '9')
        cp |= static_cast<std::uint32_t>(c - '0');
      else if (c >= 'a' && c <= 'f')
        cp |= static_cast<std::uint32_t>(c - 'a' + 10);
      else if (c >= 'A' && c <= 'F')
        cp |= static_cast<std::uint32_t>(c - 'A' + 10);
      else
        return fail("Invalid unicode escape");
    }
    return true;
  }

  static void appendUtf8(std::uint32_t cp, std::string &out)
  {
    if (cp <= 0x7F)
    {
      out.push_back(static_cast<char>(cp));
    }
    else if (cp <= 0x7FF)
    {
      out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else if (cp <= 0xFFFF)
    {
      out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else
    {
      out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
  }

  bool parseString(std::string &str)
  {
    ++_pos; // opening quote
    while (_pos < _text.size() && _text[_pos] != '"')
    {
      if (str.size() > _limits.stringLengthMax)
      {
        return fail("String length exceeds limit");
      }
      char c = _text[_pos++];
      if (static_cast<unsigned char>(c) < 0x20)
      {
        return fail("Control character in string");
      }
      if (c != '\\')
      {
        str.push_back(c);
        continue;
      }
      if (_pos >= _text.size())
      {
        return fail("Unexpected end of string");
      }
      char e = _text[_pos++];
      switch (e)
      {
      case '"':
        str += '"';
        break;
      case '\\':
        str += '\\';
        break;
      case '/':
        str += '/';
        break;
      case 'b':
        str += '\b';
        break;
      case 'f':
        str += '\f';
        break;
      case 'n':
        str += '\n';
        break;
      case 'r':
        str += '\r';
        break;
      case 't':
        str += '\t';
        break;
      case 'u':
      {
        std::uint32_t cp = 0;
        if (!parseHex4(cp))
        {
          return false;
        }
        if (cp >= 0xD800 && cp <= 0xDBFF)
        {
          std::uint32_t low = 0;
          if (_text.compare(_pos, 2, "\\u") != 0)
          {
            return fail("Unpaired surrogate in unicode escape");
          }
          _pos += 2;
          if (!parseHex4(low))
          {
            return false;
          }
          if (low < 0xDC00 || low > 0xDFFF)
          {
            return fail("Invalid low surrogate in unicode escape");
          }
          cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
        }
        else if (cp >= 0xDC00 && cp <= 0xDFFF)
        {
          return fail("Unpaired surrogate in unicode escape");
        }
        appendUtf8(cp, str);
        break;
      }
      default:
        return fail("Invalid escape sequence");
      }
    }
    if (_pos >= _text.size())
    {
      return fail("Unterminated string");
    }
    ++_pos; // closing quote
    return true;
  }

  bool parseArray(Json &out, std::size_t depth)
  {
    ++_pos; // '['
    Json::Array arr;
    skipWhitespace();
    if (_pos < _text.size() && _text[_pos] == ']')
    {
      ++_pos;
      out = Json(std::move(arr));
      return true;
    }
    while (true)
    {
      Json element;
      if (!parseValue(element, depth + 1))
      {
        return false;
      }
      arr.push_back(std::move(element));
      skipWhitespace();
      if (_pos >= _text.size())
      {
        return fail("Unexpected end of array");
      }
      if (_text[_pos] == ']')
      {
        ++_pos;
        break;
      }
      if (_text[_pos] != ',')
      {
        return fail("Expected ',' or ']'");
      }
      ++_pos;
    }
    out = Json(std::move(arr));
    return true;
  }

  bool parseObject(Json &out, std::size_t depth)
  {
    ++_pos; // '{'
    Json::Object obj;
    skipWhitespace();
    if (_pos < _text.size() && _text[_pos] == '}')
    {
      ++_pos;
      out = Json(std::move(obj));
      return true;
    }
    while (true)
    {
      skipWhitespace();
      if (_pos >= _text.size() || _text[_pos] != '"')
      {
        return fail("Expected string key");
      }
      std::string key;
      if (!parseString(key))
      {
        return false;
      }
      skipWhitespace();
      if (_pos >= _text.size() || _text[_pos] != ':')
      {
        return fail("Expected ':'");
      }
      ++_pos;
      Json value;
      if (!parseValue(value, depth + 1))
      {
        return false;
      }
      obj[key] = std::move(value);
      skipWhitespace();
      if (_pos >= _text.size())
      {
        return fail("Unexpected end of object");
      }
      if (_text[_pos] == '}')
      {
        ++_pos;
        break;
      }
      if (_text[_pos] != ',')
      {
        return fail("Expected ',' or '}'");
      }
      ++_pos;
    }
    out = Json(std::move(obj));
    return true;
  }
};

inline ParseResult Json::parse(std::string_view text, const ParseLimits &limits)
{
  JsonParser parser(text, limits);
  return parser.parse();
}

inline Json Json::parseOrThrow(std::string_view text, const ParseLimits &limits)
{
  auto result = parse(text, limits);
  if (!result.ok)
  {
    throw parse_error("JSON parse error at " + result.error.toString());
  }
  return std::move(result.value);
}

} // namespace parsers
} // namespace svgtr
