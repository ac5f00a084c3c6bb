// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of svgtr, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once
/// \file svg.hpp
/// \brief SVG vocabulary shared by the normalizer, extractor and injector.

#include <string>
#include <string_view>
#include <vector>

#include <svgtr/parsers/xml.hpp>
#include <svgtr/util/text.hpp>

namespace svgtr
{
namespace translate
{
namespace xml = parsers::xml;

constexpr std::string_view kSvgNamespace = "http://www.w3.org/2000/svg";
constexpr std::string_view kLanguageAttribute = "systemLanguage";

constexpr std::string_view kSwitch = "switch";
constexpr std::string_view kText = "text";
constexpr std::string_view kSpan = "tspan";
constexpr std::string_view kTref = "tref";
constexpr std::string_view kStyle = "style";

inline bool isSvgElement(const xml::Node *node, std::string_view local)
{
  return node && node->is(kSvgNamespace, local);
}

inline bool isSwitch(const xml::Node *node) { return isSvgElement(node, kSwitch); }
inline bool isTextBlock(const xml::Node *node) { return isSvgElement(node, kText); }
inline bool isSpan(const xml::Node *node) { return isSvgElement(node, kSpan); }

/// \brief Raw character data (text or CDATA) as opposed to markup.
inline bool isCharacterData(const xml::Node *node)
{
  return node->kind() == xml::NodeKind::Text || node->kind() == xml::NodeKind::CData;
}

inline bool isBlank(std::string_view s) { return util::trim(s).empty(); }

/// \brief The language tag of a TextBlock, empty for the fallback.
inline std::string languageOf(const xml::Node &text)
{
  return util::trim(text.getAttribute(kLanguageAttribute));
}

inline bool isFallback(const xml::Node &text) { return languageOf(text).empty(); }

/// \brief Build a qualified name for a new element that shares the
/// namespace prefix of \p sibling ("svg:text" -> "svg:tspan").
inline std::string qualifiedLike(const xml::Node &sibling, std::string_view local)
{
  std::string_view prefix = sibling.prefix();
  if (prefix.empty())
  {
    return std::string(local);
  }
  return std::string(prefix) + ":" + std::string(local);
}

/// \brief Direct TextBlock children of a Switch.
inline std::vector<xml::Node *> textBlocksOf(const xml::Node &sw)
{
  return sw.childElements(kSvgNamespace, kText);
}

/// \brief Direct Span children of a TextBlock.
inline std::vector<xml::Node *> spansOf(const xml::Node &text)
{
  return text.childElements(kSvgNamespace, kSpan);
}

/// \brief The untagged TextBlock of a Switch, or nullptr.
inline xml::Node *fallbackOf(const xml::Node &sw)
{
  for (xml::Node *text : textBlocksOf(sw))
  {
    if (isFallback(*text))
    {
      return text;
    }
  }
  return nullptr;
}

/// \brief Replace the character data of a Span with \p text.
inline void setSpanText(xml::Node &span, const std::string &text)
{
  span.clearChildren();
  span.appendChild(xml::Node::makeText(text));
}

} // namespace translate
} // namespace svgtr
