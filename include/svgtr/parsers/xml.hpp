// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of svgtr, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once
/// \file xml.hpp
/// \brief Non-validating XML 1.0 tokenizer with a mutable DOM and serializer.
///
/// Design goals:
///  - Header-only, zero external deps
///  - Non-validating (no DTD/XSD); no external entity expansion
///  - Whitespace in character data is preserved so that documents survive a
///    parse/serialize round trip with unaffected regions intact
///  - Prolog items (declaration, doctype, comments, PIs) are kept verbatim
///  - Named entities other than the five predefined ones (typically declared
///    in an internal DTD subset) are carried through undecoded
///
/// Example:
/// \code
/// svgtr::parsers::xml::Error err;
/// auto doc = svgtr::parsers::xml::Document::parse("<svg><text>hi</text></svg>", &err);
/// if (!doc) { /* err.line, err.column, err.message */ }
/// doc->root()->setAttribute("width", "10");
/// std::string out = doc->serialize();
/// \endcode

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace svgtr
{
namespace parsers
{
namespace xml
{
/// \brief Token kinds produced by the tokenizer.
enum class TokenKind
{
  Invalid,
  Eof,
  XmlDecl,
  Doctype,
  StartElement,
  EndElement,
  EmptyElement,
  Text,
  CData,
  Comment,
  ProcessingInstruction
};

/// \brief Error information for parse failures.
struct Error
{
  std::size_t offset{0};
  std::size_t line{1};
  std::size_t column{1};
  std::string message;

  std::string toString() const
  {
    return "line " + std::to_string(line) + ", column " + std::to_string(column) + ": " + message;
  }
};

/// \brief Tokenizer safety limits.
struct Options
{
  std::size_t maxDepth{256};           ///< Max element nesting depth
  std::size_t maxAttrsPerElement{256}; ///< Max attributes per element
  std::size_t maxNameLength{1024};     ///< Max length of element or attribute names
  std::size_t maxTextSpan{1u << 24};   ///< Max contiguous text span in bytes (16 MiB)
  std::size_t maxTotalTokens{0};       ///< 0=unbounded; otherwise cap total tokens
};

/// \brief Attribute view (name/value) for tokens. Values are raw source slices.
struct Attribute
{
  std::string_view name;
  std::string_view value;
};

/// \brief Token produced by the tokenizer.
struct Token
{
  TokenKind kind{TokenKind::Invalid};
  std::string_view name;             ///< Element name or PI target
  std::string_view text;             ///< Text/CData/Comment body
  std::string_view raw;              ///< Whole markup slice for XmlDecl/Doctype/Comment/PI
  std::vector<Attribute> attributes; ///< For StartElement/EmptyElement
  std::size_t depth{0};
  std::size_t offset{0};
  std::size_t line{1};
  std::size_t column{1};
};

/// \brief Pull tokenizer over a contiguous UTF-8 buffer. Unlike a data-only
/// reader it reports every character of character data, including
/// whitespace between elements.
class Tokenizer
{
public:
  explicit Tokenizer(std::string_view input, const Options &opt = Options{})
      : _input(input), _opt(opt)
  {
  }

  const Token &current() const { return _token; }

  /// \brief Returns last error pointer if any (nullptr if none).
  const Error *error() const { return _hasError ? &_error : nullptr; }

  /// \brief Advance to the next token. Returns false on error or at EOF.
  bool next()
  {
    if (_hasError || _emittedEof)
    {
      return false;
    }
    if (_opt.maxTotalTokens != 0 && _producedTokens >= _opt.maxTotalTokens)
    {
      return fail("token limit exceeded");
    }
    if (eof())
    {
      emitEof();
      return false;
    }

    std::size_t startOffset = _cur;
    std::size_t startLine = _line;
    std::size_t startCol = _col;

    if (peek() != '<')
    {
      return readText(startOffset, startLine, startCol);
    }
    advance();
    if (eof())
    {
      return fail("unexpected end after '<'");
    }
    char n = peek();
    if (n == '?')
    {
      advance();
      return readProcessingInstruction(startOffset, startLine, startCol);
    }
    if (n == '!')
    {
      advance();
      if (matchString("--"))
      {
        return readDelimited(TokenKind::Comment, "-->", "unterminated comment", startOffset,
                             startLine, startCol);
      }
      if (matchString("[CDATA["))
      {
        return readDelimited(TokenKind::CData, "]]>", "unterminated CDATA", startOffset,
                             startLine, startCol);
      }
      if (matchString("DOCTYPE"))
      {
        return readDoctype(startOffset, startLine, startCol);
      }
      return fail("unsupported markup declaration");
    }
    if (n == '/')
    {
      advance();
      return readEndTag(startOffset, startLine, startCol);
    }
    return readStartOrEmptyTag(startOffset, startLine, startCol);
  }

  /// \brief Decode predefined entities and numeric character references.
  ///
  /// Other named entities are copied through as "&name;" and their names
  /// are added to \p unknownOut when provided.
  static bool decodeEntities(std::string_view in, std::string &out, Error *err = nullptr,
                             std::set<std::string> *unknownOut = nullptr)
  {
    out.clear();
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size();)
    {
      char ch = in[i];
      if (ch != '&')
      {
        out.push_back(ch);
        ++i;
        continue;
      }
      std::size_t semi = in.find(';', i + 1);
      if (semi == std::string_view::npos)
      {
        if (err)
        {
          *err = {i, 0, 0, "unterminated entity"};
        }
        return false;
      }
      std::string_view ent = in.substr(i + 1, semi - (i + 1));
      if (ent == "lt")
        out.push_back('<');
      else if (ent == "gt")
        out.push_back('>');
      else if (ent == "amp")
        out.push_back('&');
      else if (ent == "apos")
        out.push_back('\'');
      else if (ent == "quot")
        out.push_back('"');
      else if (!ent.empty() && ent[0] == '#')
      {
        if (!appendCharRef(ent, out))
        {
          if (err)
          {
            *err = {i, 0, 0, "invalid character reference"};
          }
          return false;
        }
      }
      else if (isEntityName(ent))
      {
        out.push_back('&');
        out.append(ent.data(), ent.size());
        out.push_back(';');
        if (unknownOut)
        {
          unknownOut->insert(std::string(ent));
        }
      }
      else
      {
        if (err)
        {
          *err = {i, 0, 0, "malformed entity reference"};
        }
        return false;
      }
      i = semi + 1;
    }
    return true;
  }

  static bool isNameStart(char ch)
  {
    return ch == ':' || ch == '_' || (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') ||
           static_cast<unsigned char>(ch) >= 0x80;
  }

  static bool isNameChar(char ch)
  {
    return isNameStart(ch) || ch == '-' || ch == '.' || (ch >= '0' && ch <= '9');
  }

  static bool isEntityName(std::string_view s)
  {
    if (s.empty() || !isNameStart(s[0]))
    {
      return false;
    }
    return std::all_of(s.begin() + 1, s.end(), [](char c) { return isNameChar(c); });
  }

private:
  bool eof() const { return _cur >= _input.size(); }

  char peek() const { return _input[_cur]; }

  void advance()
  {
    char ch = _input[_cur++];
    if (ch == '\n')
    {
      ++_line;
      _col = 1;
    }
    else
    {
      ++_col;
    }
  }

  void advanceTo(std::size_t pos)
  {
    while (_cur < pos)
    {
      advance();
    }
  }

  void skipSpaces()
  {
    while (!eof())
    {
      char ch = peek();
      if (ch != ' ' && ch != '\t' && ch != '\r' && ch != '\n')
      {
        break;
      }
      advance();
    }
  }

  bool matchString(std::string_view s)
  {
    if (_input.compare(_cur, s.size(), s) != 0)
    {
      return false;
    }
    advanceTo(_cur + s.size());
    return true;
  }

  std::string_view readName()
  {
    std::size_t start = _cur;
    if (eof() || !isNameStart(peek()))
    {
      return std::string_view{};
    }
    advance();
    while (!eof() && isNameChar(peek()))
    {
      advance();
    }
    std::size_t len = _cur - start;
    if (len > _opt.maxNameLength)
    {
      fail("name too long");
      return std::string_view{};
    }
    return _input.substr(start, len);
  }

  bool readQuotedValue(std::string_view &out)
  {
    if (eof())
    {
      return fail("expected quote");
    }
    char quote = peek();
    if (quote != '"' && quote != '\'')
    {
      return fail("expected '\"' or '\\'' for attribute value");
    }
    advance();
    std::size_t start = _cur;
    std::size_t end = _input.find(quote, start);
    if (end == std::string_view::npos)
    {
      return fail("unterminated attribute value");
    }
    if (end - start > _opt.maxTextSpan)
    {
      return fail("attribute value too long");
    }
    advanceTo(end + 1);
    out = _input.substr(start, end - start);
    if (out.find('<') != std::string_view::npos)
    {
      return fail("'<' not allowed in attribute value");
    }
    return true;
  }

  bool readAttributes(std::vector<Attribute> &attrs)
  {
    attrs.clear();
    while (true)
    {
      std::size_t before = _cur;
      skipSpaces();
      if (eof())
      {
        return fail("unexpected end in attributes");
      }
      char ch = peek();
      if (ch == '/' || ch == '>')
      {
        return true;
      }
      if (_cur == before)
      {
        return fail("whitespace required between attributes");
      }
      std::string_view name = readName();
      if (name.empty())
      {
        return fail("invalid attribute name");
      }
      skipSpaces();
      if (eof() || peek() != '=')
      {
        return fail("expected '=' after attribute name");
      }
      advance();
      skipSpaces();
      std::string_view value;
      if (!readQuotedValue(value))
      {
        return false;
      }
      for (const auto &a : attrs)
      {
        if (a.name == name)
        {
          return fail("duplicate attribute");
        }
      }
      attrs.push_back(Attribute{name, value});
      if (attrs.size() > _opt.maxAttrsPerElement)
      {
        return fail("too many attributes");
      }
    }
  }

  bool readProcessingInstruction(std::size_t startOffset, std::size_t startLine,
                                 std::size_t startCol)
  {
    std::string_view target = readName();
    if (target.empty())
    {
      return fail("invalid PI target");
    }
    std::size_t pos = _input.find("?>", _cur);
    if (pos == std::string_view::npos)
    {
      return fail("unterminated processing instruction");
    }
    std::string_view content = _input.substr(_cur, pos - _cur);
    advanceTo(pos + 2);

    bool isDecl = target == "xml";
    if (isDecl && (startOffset != 0 || _producedTokens != 0))
    {
      return fail("XML declaration allowed only at the start of the document");
    }
    _token = Token{};
    _token.kind = isDecl ? TokenKind::XmlDecl : TokenKind::ProcessingInstruction;
    _token.name = target;
    _token.text = content;
    return produced(startOffset, startLine, startCol);
  }

  bool readDelimited(TokenKind kind, std::string_view endSeq, const char *unterminated,
                     std::size_t startOffset, std::size_t startLine, std::size_t startCol)
  {
    std::size_t pos = _input.find(endSeq, _cur);
    if (pos == std::string_view::npos)
    {
      return fail(unterminated);
    }
    std::string_view body = _input.substr(_cur, pos - _cur);
    advanceTo(pos + endSeq.size());
    _token = Token{};
    _token.kind = kind;
    _token.text = body;
    return produced(startOffset, startLine, startCol);
  }

  bool readDoctype(std::size_t startOffset, std::size_t startLine, std::size_t startCol)
  {
    // Up to the next '>' outside the internal subset and outside quotes.
    std::size_t pos = _cur;
    int bracket = 0;
    char quote = '\0';
    while (pos < _input.size())
    {
      char ch = _input[pos];
      if (quote != '\0')
      {
        if (ch == quote)
        {
          quote = '\0';
        }
      }
      else if (ch == '"' || ch == '\'')
      {
        quote = ch;
      }
      else if (ch == '[')
      {
        ++bracket;
      }
      else if (ch == ']' && bracket > 0)
      {
        --bracket;
      }
      else if (ch == '>' && bracket == 0)
      {
        break;
      }
      ++pos;
    }
    if (pos >= _input.size())
    {
      return fail("unterminated doctype");
    }
    std::string_view body = _input.substr(_cur, pos - _cur);
    advanceTo(pos + 1);
    _token = Token{};
    _token.kind = TokenKind::Doctype;
    _token.text = body;
    return produced(startOffset, startLine, startCol);
  }

  bool readEndTag(std::size_t startOffset, std::size_t startLine, std::size_t startCol)
  {
    std::string_view name = readName();
    if (name.empty())
    {
      return fail("invalid end tag name");
    }
    skipSpaces();
    if (eof() || peek() != '>')
    {
      return fail("expected '>' after end tag name");
    }
    advance();

    if (_elementStack.empty())
    {
      return fail("end tag without matching start tag");
    }
    if (_elementStack.back() != name)
    {
      std::string msg = "mismatched end tag - expected </" + std::string(_elementStack.back()) +
                        "> but got </" + std::string(name) + ">";
      return fail(msg);
    }
    _elementStack.pop_back();

    _token = Token{};
    _token.kind = TokenKind::EndElement;
    _token.name = name;
    _token.depth = _elementStack.size() + 1;
    return produced(startOffset, startLine, startCol);
  }

  bool readStartOrEmptyTag(std::size_t startOffset, std::size_t startLine, std::size_t startCol)
  {
    std::string_view name = readName();
    if (name.empty())
    {
      return fail("invalid start tag name");
    }
    Token tok;
    tok.kind = TokenKind::StartElement;
    tok.name = name;
    if (!readAttributes(tok.attributes))
    {
      return false;
    }

    bool empty = false;
    if (peek() == '/')
    {
      empty = true;
      advance();
    }
    if (eof() || peek() != '>')
    {
      return fail("expected '>' to end start tag");
    }
    advance();

    if (_elementStack.size() + 1 > _opt.maxDepth)
    {
      return fail("maximum element depth exceeded");
    }
    tok.depth = _elementStack.size() + 1;
    if (empty)
    {
      tok.kind = TokenKind::EmptyElement;
    }
    else
    {
      _elementStack.push_back(name);
    }
    _token = std::move(tok);
    return produced(startOffset, startLine, startCol);
  }

  bool readText(std::size_t startOffset, std::size_t startLine, std::size_t startCol)
  {
    std::size_t end = _input.find('<', _cur);
    if (end == std::string_view::npos)
    {
      end = _input.size();
    }
    if (end - _cur > _opt.maxTextSpan)
    {
      return fail("text span too large");
    }
    std::string_view sv = _input.substr(_cur, end - _cur);
    advanceTo(end);
    _token = Token{};
    _token.kind = TokenKind::Text;
    _token.text = sv;
    return produced(startOffset, startLine, startCol);
  }

  void emitEof()
  {
    if (!_elementStack.empty())
    {
      std::string unclosed = "unclosed elements at end of document:";
      for (const auto &elem : _elementStack)
      {
        unclosed += " <" + std::string(elem) + ">";
      }
      fail(unclosed);
      return;
    }
    _token = Token{};
    _token.kind = TokenKind::Eof;
    _token.offset = _cur;
    _token.line = _line;
    _token.column = _col;
    _emittedEof = true;
  }

  bool produced(std::size_t startOffset, std::size_t startLine, std::size_t startCol)
  {
    if (_token.kind != TokenKind::EndElement && _token.kind != TokenKind::StartElement &&
        _token.kind != TokenKind::EmptyElement)
    {
      _token.depth = _elementStack.size();
    }
    _token.raw = _input.substr(startOffset, _cur - startOffset);
    _token.offset = startOffset;
    _token.line = startLine;
    _token.column = startCol;
    ++_producedTokens;
    return true;
  }

  bool fail(const std::string &msg)
  {
    _hasError = true;
    _error.offset = _cur;
    _error.line = _line;
    _error.column = _col;
    _error.message = msg;
    return false;
  }

  // Append a numeric char ref (e.g. "#10" or "#x1F4A9") to out as UTF-8.
  static bool appendCharRef(std::string_view entBody, std::string &out)
  {
    if (entBody.size() < 2)
    {
      return false;
    }
    uint32_t code = 0;
    bool hex = entBody[1] == 'x' || entBody[1] == 'X';
    std::size_t first = hex ? 2 : 1;
    if (first >= entBody.size())
    {
      return false;
    }
    for (std::size_t i = first; i < entBody.size(); ++i)
    {
      char c = entBody[i];
      uint32_t v = 0;
      if (c >= '0' && c <= '9')
        v = static_cast<uint32_t>(c - '0');
      else if (hex && c >= 'a' && c <= 'f')
        v = static_cast<uint32_t>(c - 'a' + 10);
      else if (hex && c >= 'A' && c <= 'F')
        v = static_cast<uint32_t>(c - 'A' + 10);
      else
        return false;
      code = hex ? (code << 4) | v : code * 10u + v;
      if (code > 0x10FFFFu)
      {
        return false;
      }
    }
    return encodeUtf8(code, out);
  }

  static bool encodeUtf8(uint32_t cp, std::string &out)
  {
    if (cp == 0 || (cp >= 0xD800u && cp <= 0xDFFFu) || cp > 0x10FFFFu)
    {
      return false;
    }
    if (cp <= 0x7Fu)
    {
      out.push_back(static_cast<char>(cp));
    }
    else if (cp <= 0x7FFu)
    {
      out.push_back(static_cast<char>(0xC0u | ((cp >> 6) & 0x1Fu)));
      out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
    }
    else if (cp <= 0xFFFFu)
    {
      out.push_back(static_cast<char>(0xE0u | ((cp >> 12) & 0x0Fu)));
      out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
      out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
    }
    else
    {
      out.push_back(static_cast<char>(0xF0u | ((cp >> 18) & 0x07u)));
      out.push_back(static_cast<char>(0x80u | ((cp >> 12) & 0x3Fu)));
      out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
      out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
    }
    return true;
  }

  std::string_view _input;
  Options _opt{};

  std::size_t _cur{0};
  std::size_t _line{1};
  std::size_t _col{1};

  Token _token{};

  bool _hasError{false};
  Error _error{};
  bool _emittedEof{false};
  std::size_t _producedTokens{0};
  std::vector<std::string_view> _elementStack{};
};

/// \brief DOM node kinds.
enum class NodeKind
{
  Document,
  Element,
  Text,
  CData,
  Comment,
  ProcessingInstruction,
  Declaration,
  Doctype
};

/// \brief Mutable DOM node. Children are owned; the parent pointer is not.
///
/// Element names are stored qualified ("svg:text"); namespace URIs are
/// resolved on demand through the in-scope xmlns declarations. Text and
/// CData values are entity-decoded. Comment, PI, Declaration and Doctype
/// values hold the complete source markup and are written back unchanged.
class Node
{
public:
  struct Attr
  {
    std::string name;
    std::string value;
  };

  using NodePtr = std::unique_ptr<Node>;
  static constexpr std::size_t npos = static_cast<std::size_t>(-1);

  explicit Node(NodeKind kind, std::string name = {}, std::string value = {})
      : _kind(kind), _name(std::move(name)), _value(std::move(value))
  {
  }

  Node(const Node &) = delete;
  Node &operator=(const Node &) = delete;

  static NodePtr makeElement(std::string qualifiedName)
  {
    return std::make_unique<Node>(NodeKind::Element, std::move(qualifiedName));
  }

  static NodePtr makeText(std::string text)
  {
    return std::make_unique<Node>(NodeKind::Text, std::string{}, std::move(text));
  }

  NodeKind kind() const { return _kind; }
  bool isElement() const { return _kind == NodeKind::Element; }
  bool isText() const { return _kind == NodeKind::Text; }

  const std::string &name() const { return _name; }
  void setName(std::string name) { _name = std::move(name); }

  std::string_view prefix() const
  {
    std::size_t pos = _name.find(':');
    return pos == std::string::npos ? std::string_view{}
                                    : std::string_view(_name).substr(0, pos);
  }

  std::string_view localName() const
  {
    std::size_t pos = _name.find(':');
    return pos == std::string::npos ? std::string_view(_name)
                                    : std::string_view(_name).substr(pos + 1);
  }

  const std::string &value() const { return _value; }
  void setValue(std::string value) { _value = std::move(value); }

  /// \brief True when the element was written as <name/> in the source or
  /// was created programmatically; controls serialization when childless.
  bool selfClosing() const { return _selfClosing; }
  void setSelfClosing(bool selfClosing) { _selfClosing = selfClosing; }

  // ===== Attributes =====

  const std::vector<Attr> &attributes() const { return _attributes; }

  const std::string *findAttribute(std::string_view attrName) const
  {
    for (const auto &attr : _attributes)
    {
      if (attr.name == attrName)
      {
        return &attr.value;
      }
    }
    return nullptr;
  }

  bool hasAttribute(std::string_view attrName) const { return findAttribute(attrName) != nullptr; }

  /// \brief Attribute value or an empty string when absent.
  std::string getAttribute(std::string_view attrName) const
  {
    const std::string *v = findAttribute(attrName);
    return v ? *v : std::string{};
  }

  /// \brief Replaces an existing attribute in place or appends a new one.
  void setAttribute(std::string_view attrName, std::string value)
  {
    for (auto &attr : _attributes)
    {
      if (attr.name == attrName)
      {
        attr.value = std::move(value);
        return;
      }
    }
    _attributes.push_back(Attr{std::string(attrName), std::move(value)});
  }

  bool removeAttribute(std::string_view attrName)
  {
    auto it = std::find_if(_attributes.begin(), _attributes.end(),
                           [&](const Attr &a) { return a.name == attrName; });
    if (it == _attributes.end())
    {
      return false;
    }
    _attributes.erase(it);
    return true;
  }

  // ===== Tree =====

  Node *parent() const { return _parent; }
  const std::vector<NodePtr> &children() const { return _children; }
  std::size_t childCount() const { return _children.size(); }
  Node *child(std::size_t index) const { return _children.at(index).get(); }

  std::size_t indexOf(const Node *node) const
  {
    for (std::size_t i = 0; i < _children.size(); ++i)
    {
      if (_children[i].get() == node)
      {
        return i;
      }
    }
    return npos;
  }

  std::vector<Node *> elementChildren() const
  {
    std::vector<Node *> out;
    for (const auto &c : _children)
    {
      if (c->isElement())
      {
        out.push_back(c.get());
      }
    }
    return out;
  }

  bool hasElementChildren() const
  {
    return std::any_of(_children.begin(), _children.end(),
                       [](const NodePtr &c) { return c->isElement(); });
  }

  Node *appendChild(NodePtr node) { return insertChild(_children.size(), std::move(node)); }

  Node *insertChild(std::size_t index, NodePtr node)
  {
    if (index > _children.size())
    {
      index = _children.size();
    }
    node->_parent = this;
    Node *raw = node.get();
    _children.insert(_children.begin() + static_cast<std::ptrdiff_t>(index), std::move(node));
    return raw;
  }

  NodePtr detachChild(std::size_t index)
  {
    NodePtr node = std::move(_children.at(index));
    _children.erase(_children.begin() + static_cast<std::ptrdiff_t>(index));
    node->_parent = nullptr;
    return node;
  }

  /// \brief Detach a direct child; returns nullptr if \p node is not one.
  NodePtr detach(const Node *node)
  {
    std::size_t idx = indexOf(node);
    if (idx == npos)
    {
      return nullptr;
    }
    return detachChild(idx);
  }

  void clearChildren()
  {
    for (auto &c : _children)
    {
      c->_parent = nullptr;
    }
    _children.clear();
  }

  /// \brief Deep copy of this subtree; the copy has no parent.
  NodePtr clone() const
  {
    auto copy = std::make_unique<Node>(_kind, _name, _value);
    copy->_attributes = _attributes;
    copy->_selfClosing = _selfClosing;
    for (const auto &c : _children)
    {
      copy->appendChild(c->clone());
    }
    return copy;
  }

  // ===== Namespaces and content =====

  /// \brief Resolve a namespace prefix ("" for the default namespace)
  /// through the xmlns declarations in scope at this node.
  std::optional<std::string> lookupNamespace(std::string_view nsPrefix) const
  {
    if (nsPrefix == "xml")
    {
      return std::string("http://www.w3.org/XML/1998/namespace");
    }
    std::string attrName = nsPrefix.empty() ? std::string("xmlns") : "xmlns:" + std::string(nsPrefix);
    for (const Node *n = this; n; n = n->_parent)
    {
      if (!n->isElement())
      {
        continue;
      }
      if (const std::string *v = n->findAttribute(attrName))
      {
        if (v->empty())
        {
          return std::nullopt;
        }
        return *v;
      }
    }
    return std::nullopt;
  }

  /// \brief Namespace URI of this element, or empty when it has none.
  std::string namespaceUri() const
  {
    if (!isElement())
    {
      return {};
    }
    return lookupNamespace(prefix()).value_or(std::string{});
  }

  bool is(std::string_view nsUri, std::string_view local) const
  {
    return isElement() && localName() == local && namespaceUri() == nsUri;
  }

  /// \brief Concatenated Text and CData of all descendants.
  std::string textContent() const
  {
    std::string result;
    appendTextContent(result);
    return result;
  }

  /// \brief Descendant elements (excluding this node) in document order
  /// with the given namespace and local name.
  std::vector<Node *> descendants(std::string_view nsUri, std::string_view local) const
  {
    std::vector<Node *> out;
    collectDescendants(nsUri, local, out);
    return out;
  }

  /// \brief Direct child elements with the given namespace and local name.
  std::vector<Node *> childElements(std::string_view nsUri, std::string_view local) const
  {
    std::vector<Node *> out;
    for (const auto &c : _children)
    {
      if (c->is(nsUri, local))
      {
        out.push_back(c.get());
      }
    }
    return out;
  }

private:
  void appendTextContent(std::string &out) const
  {
    for (const auto &c : _children)
    {
      if (c->_kind == NodeKind::Text || c->_kind == NodeKind::CData)
      {
        out += c->_value;
      }
      else if (c->isElement())
      {
        c->appendTextContent(out);
      }
    }
  }

  void collectDescendants(std::string_view nsUri, std::string_view local,
                          std::vector<Node *> &out) const
  {
    for (const auto &c : _children)
    {
      if (!c->isElement())
      {
        continue;
      }
      if (c->is(nsUri, local))
      {
        out.push_back(c.get());
      }
      c->collectDescendants(nsUri, local, out);
    }
  }

  NodeKind _kind;
  std::string _name;
  std::string _value;
  std::vector<Attr> _attributes;
  std::vector<NodePtr> _children;
  Node *_parent{nullptr};
  bool _selfClosing{true};
};

/// \brief Writes nodes back to markup.
///
/// Text escapes '&' and '<' (and '>' after "]]"); attribute values escape
/// '&', '<' and '"'. An '&' that starts a reference to one of the
/// \p preserved entity names is written as-is.
class Serializer
{
public:
  explicit Serializer(const std::set<std::string> &preserved) : _preserved(preserved) {}

  void write(const Node &node, std::string &out) const
  {
    switch (node.kind())
    {
    case NodeKind::Document:
      for (const auto &c : node.children())
      {
        write(*c, out);
      }
      break;
    case NodeKind::Element:
      writeElement(node, out);
      break;
    case NodeKind::Text:
      escape(node.value(), false, out);
      break;
    case NodeKind::CData:
      out += "<![CDATA[";
      out += node.value();
      out += "]]>";
      break;
    case NodeKind::Comment:
    case NodeKind::ProcessingInstruction:
    case NodeKind::Declaration:
    case NodeKind::Doctype:
      out += node.value();
      break;
    }
  }

private:
  void writeElement(const Node &node, std::string &out) const
  {
    out.push_back('<');
    out += node.name();
    for (const auto &attr : node.attributes())
    {
      out.push_back(' ');
      out += attr.name;
      out += "=\"";
      escape(attr.value, true, out);
      out.push_back('"');
    }
    if (node.children().empty() && node.selfClosing())
    {
      out += "/>";
      return;
    }
    out.push_back('>');
    for (const auto &c : node.children())
    {
      write(*c, out);
    }
    out += "</";
    out += node.name();
    out.push_back('>');
  }

  void escape(std::string_view in, bool attribute, std::string &out) const
  {
    for (std::size_t i = 0; i < in.size(); ++i)
    {
      char ch = in[i];
      switch (ch)
      {
      case '&':
        if (startsPreservedEntity(in, i))
        {
          out.push_back('&');
        }
        else
        {
          out += "&amp;";
        }
        break;
      case '<':
        out += "&lt;";
        break;
      case '>':
        if (!attribute && i >= 2 && in[i - 1] == ']' && in[i - 2] == ']')
        {
          out += "&gt;";
        }
        else
        {
          out.push_back('>');
        }
        break;
      case '"':
        if (attribute)
        {
          out += "&quot;";
        }
        else
        {
          out.push_back('"');
        }
        break;
      default:
        out.push_back(ch);
      }
    }
  }

  bool startsPreservedEntity(std::string_view in, std::size_t amp) const
  {
    if (_preserved.empty())
    {
      return false;
    }
    std::size_t semi = in.find(';', amp + 1);
    if (semi == std::string_view::npos)
    {
      return false;
    }
    return _preserved.count(std::string(in.substr(amp + 1, semi - amp - 1))) != 0;
  }

  const std::set<std::string> &_preserved;
};

/// \brief A parsed document: prolog, root element and trailing misc, all as
/// children of a Document node.
class Document
{
public:
  Document() : _node(std::make_unique<Node>(NodeKind::Document)) {}

  Document(Document &&) = default;
  Document &operator=(Document &&) = default;

  /// \brief Parse a complete document. Returns std::nullopt on malformed
  /// input and fills \p errOut.
  static std::optional<Document> parse(std::string_view input, Error *errOut = nullptr,
                                       const Options &opt = Options{})
  {
    Document doc;
    if (input.size() >= 3 && input.compare(0, 3, "\xEF\xBB\xBF") == 0)
    {
      doc._byteOrderMark = true;
      input.remove_prefix(3);
    }
    Tokenizer tokenizer(input, opt);
    std::vector<Node *> stack{doc._node.get()};
    bool seenRoot = false;

    auto failAt = [&](const Token &t, const std::string &msg)
    {
      if (errOut)
      {
        *errOut = Error{t.offset, t.line, t.column, msg};
      }
      return std::nullopt;
    };
    auto decodeFailed = [&](const Token &t, const Error &tmp)
    {
      if (errOut)
      {
        *errOut = Error{t.offset + tmp.offset, t.line, t.column, tmp.message};
      }
      return std::nullopt;
    };

    while (tokenizer.next())
    {
      const Token &t = tokenizer.current();
      bool atTop = stack.size() == 1;
      switch (t.kind)
      {
      case TokenKind::StartElement:
      case TokenKind::EmptyElement:
      {
        if (atTop && seenRoot)
        {
          return failAt(t, "multiple root elements");
        }
        seenRoot = true;
        auto elem = Node::makeElement(std::string(t.name));
        for (const auto &a : t.attributes)
        {
          std::string v;
          Error tmp{};
          if (!Tokenizer::decodeEntities(a.value, v, &tmp, &doc._preservedEntities))
          {
            return decodeFailed(t, tmp);
          }
          elem->setAttribute(a.name, std::move(v));
        }
        elem->setSelfClosing(t.kind == TokenKind::EmptyElement);
        Node *raw = stack.back()->appendChild(std::move(elem));
        if (t.kind == TokenKind::StartElement)
        {
          stack.push_back(raw);
        }
        break;
      }
      case TokenKind::EndElement:
        stack.pop_back();
        break;
      case TokenKind::Text:
      {
        std::string v;
        Error tmp{};
        if (!Tokenizer::decodeEntities(t.text, v, &tmp, &doc._preservedEntities))
        {
          return decodeFailed(t, tmp);
        }
        if (atTop && v.find_first_not_of(" \t\r\n") != std::string::npos)
        {
          return failAt(t, "text outside the root element");
        }
        stack.back()->appendChild(Node::makeText(std::move(v)));
        break;
      }
      case TokenKind::CData:
        if (atTop)
        {
          return failAt(t, "CDATA outside the root element");
        }
        stack.back()->appendChild(
          std::make_unique<Node>(NodeKind::CData, std::string{}, std::string(t.text)));
        break;
      case TokenKind::Comment:
        stack.back()->appendChild(
          std::make_unique<Node>(NodeKind::Comment, std::string{}, std::string(t.raw)));
        break;
      case TokenKind::ProcessingInstruction:
        stack.back()->appendChild(std::make_unique<Node>(
          NodeKind::ProcessingInstruction, std::string(t.name), std::string(t.raw)));
        break;
      case TokenKind::XmlDecl:
        stack.back()->appendChild(
          std::make_unique<Node>(NodeKind::Declaration, std::string{}, std::string(t.raw)));
        break;
      case TokenKind::Doctype:
        if (!atTop || seenRoot)
        {
          return failAt(t, "DOCTYPE must precede the root element");
        }
        stack.back()->appendChild(
          std::make_unique<Node>(NodeKind::Doctype, std::string{}, std::string(t.raw)));
        break;
      case TokenKind::Eof:
      case TokenKind::Invalid:
      default:
        break;
      }
    }

    if (const Error *e = tokenizer.error())
    {
      if (errOut)
      {
        *errOut = *e;
      }
      return std::nullopt;
    }
    if (!seenRoot)
    {
      if (errOut)
      {
        *errOut = Error{input.size(), 0, 0, "no root element"};
      }
      return std::nullopt;
    }
    return std::optional<Document>(std::move(doc));
  }

  Node &node() { return *_node; }
  const Node &node() const { return *_node; }

  /// \brief The root element, or nullptr for an empty document.
  Node *root() const
  {
    for (const auto &c : _node->children())
    {
      if (c->isElement())
      {
        return c.get();
      }
    }
    return nullptr;
  }

  const std::set<std::string> &preservedEntities() const { return _preservedEntities; }

  Document clone() const
  {
    Document copy;
    copy._node = _node->clone();
    copy._preservedEntities = _preservedEntities;
    copy._byteOrderMark = _byteOrderMark;
    return copy;
  }

  std::string serialize() const
  {
    std::string out;
    if (_byteOrderMark)
    {
      out += "\xEF\xBB\xBF";
    }
    Serializer(_preservedEntities).write(*_node, out);
    return out;
  }

private:
  std::unique_ptr<Node> _node;
  std::set<std::string> _preservedEntities;
  bool _byteOrderMark{false};
};

} // namespace xml
} // namespace parsers
} // namespace svgtr
