// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of svgtr, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <svgtr/parsers/xml.hpp>

namespace svgtr
{
namespace translate
{

/// \brief Reasons a document cannot be brought into translatable shape.
enum class StructuralErrorCode
{
  NoDocElement,
  ContainsTref,
  CssTooComplex,
  CssHasIds,
  NestedTspansNotSupported,
  InvalidNodeId,
  TextContainsDollar,
  NoParentForText,
  NonTspanInsideText,
  SwitchChildNotText,
  SwitchTextContentOutsideText,
  MultipleLangInText,
  MultipleTextSameLang
};

inline const char *toString(StructuralErrorCode code)
{
  switch (code)
  {
  case StructuralErrorCode::NoDocElement:
    return "no-doc-element";
  case StructuralErrorCode::ContainsTref:
    return "contains-tref";
  case StructuralErrorCode::CssTooComplex:
    return "css-too-complex";
  case StructuralErrorCode::CssHasIds:
    return "css-has-ids";
  case StructuralErrorCode::NestedTspansNotSupported:
    return "nested-tspans-not-supported";
  case StructuralErrorCode::InvalidNodeId:
    return "invalid-node-id";
  case StructuralErrorCode::TextContainsDollar:
    return "text-contains-dollar";
  case StructuralErrorCode::NoParentForText:
    return "no-parent-for-text";
  case StructuralErrorCode::NonTspanInsideText:
    return "non-tspan-inside-text";
  case StructuralErrorCode::SwitchChildNotText:
    return "switch-child-not-text";
  case StructuralErrorCode::SwitchTextContentOutsideText:
    return "switch-text-content-outside-text";
  case StructuralErrorCode::MultipleLangInText:
    return "multiple-lang-in-text";
  case StructuralErrorCode::MultipleTextSameLang:
    return "multiple-text-same-lang";
  }
  return "unknown";
}

/// \brief Location of \p node as a slash separated element path with
/// 1-based sibling positions, e.g. "/svg[1]/g[2]/text[1]".
inline std::string nodePath(const parsers::xml::Node *node)
{
  std::vector<std::string> parts;
  for (const parsers::xml::Node *n = node; n && n->isElement(); n = n->parent())
  {
    std::size_t position = 1;
    if (const parsers::xml::Node *parent = n->parent())
    {
      for (const auto &sibling : parent->children())
      {
        if (sibling.get() == n)
        {
          break;
        }
        if (sibling->isElement() && sibling->name() == n->name())
        {
          ++position;
        }
      }
    }
    parts.push_back(n->name() + "[" + std::to_string(position) + "]");
  }
  std::string path;
  for (auto it = parts.rbegin(); it != parts.rend(); ++it)
  {
    path += "/";
    path += *it;
  }
  return path;
}

/// \brief A structural violation found while normalizing a document.
///
/// The offending node is recorded by path because normalization works on a
/// private copy that is discarded on failure.
class StructuralError
{
public:
  StructuralError(StructuralErrorCode code, const parsers::xml::Node *node,
                  std::vector<std::string> extra = {})
      : _code(code), _nodePath(nodePath(node)), _extra(std::move(extra))
  {
  }

  StructuralErrorCode code() const { return _code; }
  std::string codeString() const { return toString(_code); }
  const std::string &node() const { return _nodePath; }
  const std::vector<std::string> &extra() const { return _extra; }

  /// \brief "structure-error-<code>" followed by ": ['a', 'b']" when extra
  /// context is present.
  std::string message() const
  {
    std::string msg = "structure-error-" + codeString();
    if (!_extra.empty())
    {
      msg += ": [";
      for (std::size_t i = 0; i < _extra.size(); ++i)
      {
        if (i > 0)
        {
          msg += ", ";
        }
        msg += "'" + _extra[i] + "'";
      }
      msg += "]";
    }
    return msg;
  }

private:
  StructuralErrorCode _code;
  std::string _nodePath;
  std::vector<std::string> _extra;
};

/// \brief Value or structural error.
template <typename T> using Result = std::variant<T, StructuralError>;

template <typename T> bool isError(const Result<T> &r)
{
  return std::holds_alternative<StructuralError>(r);
}

} // namespace translate
} // namespace svgtr
