// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of svgtr, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once
/// \file normalizer.hpp
/// \brief Brings an SVG document into canonical translatable shape.
///
/// After a successful normalize():
///  - every <text> sits directly inside a <switch>
///  - every <text> holds only <tspan> children (plus whitespace)
///  - every <text> and <tspan> carries a unique id
///  - each <switch> has at most one untagged (fallback) <text>, every other
///    <text> carries exactly one distinct systemLanguage tag
///  - the <text> children of each <switch> are in deterministic order with
///    the fallback last
///
/// normalize() works on a copy of the input; a document that fails a check
/// is never partially modified.

#include <algorithm>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

#include <svgtr/core/logger.hpp>
#include <svgtr/parsers/xml.hpp>
#include <svgtr/translate/ids.hpp>
#include <svgtr/translate/lang.hpp>
#include <svgtr/translate/structure_error.hpp>
#include <svgtr/translate/svg.hpp>
#include <svgtr/util/text.hpp>

namespace svgtr
{
namespace translate
{

/// Sort position for TextBlocks without a reserved id number.
constexpr std::uint64_t kUnnumberedOrder = 1000000000ULL;

namespace detail
{
  using MaybeError = std::optional<StructuralError>;

  /// \brief True for values made only of entity references ("&ns_svg;").
  inline bool isEntityReferenceOnly(std::string_view value)
  {
    if (value.empty())
    {
      return false;
    }
    std::size_t pos = 0;
    while (pos < value.size())
    {
      if (value[pos] != '&')
      {
        return false;
      }
      std::size_t semi = value.find(';', pos + 1);
      if (semi == std::string_view::npos || semi == pos + 1)
      {
        return false;
      }
      pos = semi + 1;
    }
    return true;
  }

  /// \brief Matches stylesheets of the form "sel{decl}sel{decl}...tail":
  /// alternating non-empty selector runs and brace blocks, ending with a
  /// non-empty run that has no '{'.
  inline bool isSimpleCss(std::string_view css)
  {
    std::size_t pos = 0;
    for (;;)
    {
      std::size_t open = css.find('{', pos);
      if (open == std::string_view::npos)
      {
        return pos < css.size();
      }
      if (open == pos)
      {
        return false;
      }
      std::size_t close = css.find('}', open + 1);
      if (close == std::string_view::npos)
      {
        return false;
      }
      pos = close + 1;
    }
  }

  /// \brief The stylesheet with every "{...}" block removed, split at the
  /// blocks.
  inline std::vector<std::string_view> cssOutsideBlocks(std::string_view css)
  {
    std::vector<std::string_view> parts;
    std::size_t pos = 0;
    for (;;)
    {
      std::size_t open = css.find('{', pos);
      std::size_t close = open == std::string_view::npos ? open : css.find('}', open + 1);
      if (close == std::string_view::npos)
      {
        parts.push_back(css.substr(pos));
        return parts;
      }
      parts.push_back(css.substr(pos, open - pos));
      pos = close + 1;
    }
  }

  /// \brief "$" followed by a digit: a numbered placeholder owned by the
  /// template substitution step.
  inline bool hasDollarPlaceholder(std::string_view content)
  {
    for (std::size_t pos = content.find('$'); pos != std::string_view::npos;
         pos = content.find('$', pos + 1))
    {
      if (pos + 1 < content.size() && content[pos + 1] >= '0' && content[pos + 1] <= '9')
      {
        return true;
      }
    }
    return false;
  }

  inline MaybeError checkStyles(const xml::Node &root)
  {
    for (const xml::Node *style : root.descendants(kSvgNamespace, kStyle))
    {
      std::string css = style->textContent();
      if (css.find('#') == std::string::npos)
      {
        continue;
      }
      if (!isSimpleCss(css))
      {
        return StructuralError(StructuralErrorCode::CssTooComplex, style);
      }
      for (std::string_view selector : cssOutsideBlocks(css))
      {
        if (selector.find('#') != std::string_view::npos)
        {
          return StructuralError(StructuralErrorCode::CssHasIds, style);
        }
      }
    }
    return std::nullopt;
  }

  /// \brief Move every non-blank run of character data directly inside
  /// \p text into a new <tspan> at the same position.
  inline void wrapCharacterData(xml::Node &text)
  {
    for (std::size_t i = 0; i < text.childCount(); ++i)
    {
      xml::Node *child = text.child(i);
      if (!isCharacterData(child) || isBlank(child->value()))
      {
        continue;
      }
      auto span = xml::Node::makeElement(qualifiedLike(text, kSpan));
      span->appendChild(text.detachChild(i));
      text.insertChild(i, std::move(span));
    }
  }

  inline bool isEmptyTranslatable(const xml::Node &node)
  {
    return !node.hasElementChildren() && isBlank(node.textContent());
  }

  inline void pruneEmpty(std::vector<xml::Node *> nodes)
  {
    for (xml::Node *node : nodes)
    {
      if (isEmptyTranslatable(*node) && node->parent())
      {
        node->parent()->detach(node);
      }
    }
  }

  /// \brief Trim and validate the id of every Span and TextBlock, dropping
  /// purely numeric, empty and repeated ones.
  inline MaybeError cleanIds(const std::vector<xml::Node *> &nodes)
  {
    std::set<std::string> seen;
    for (xml::Node *node : nodes)
    {
      const std::string *raw = node->findAttribute("id");
      if (!raw)
      {
        continue;
      }
      std::string id = util::trim(*raw);
      if (id.find('|') != std::string::npos || id.find('/') != std::string::npos)
      {
        return StructuralError(StructuralErrorCode::InvalidNodeId, node, {id});
      }
      if (id.empty() || isNumericId(id) || !seen.insert(id).second)
      {
        node->removeAttribute("id");
        continue;
      }
      if (id != *raw)
      {
        node->setAttribute("id", id);
      }
    }
    return std::nullopt;
  }

  /// \brief Wrap \p text in a new <switch> at its current position.
  inline xml::Node *wrapInSwitch(xml::Node &text)
  {
    xml::Node *parent = text.parent();
    std::size_t index = parent->indexOf(&text);
    auto owned = parent->detachChild(index);
    xml::Node *sw = parent->insertChild(index, xml::Node::makeElement(qualifiedLike(text, kSwitch)));
    sw->setSelfClosing(false);
    sw->appendChild(std::move(owned));
    return sw;
  }

  inline MaybeError prepareTextBlock(xml::Node &text)
  {
    std::string content = text.textContent();
    if (hasDollarPlaceholder(content))
    {
      return StructuralError(StructuralErrorCode::TextContainsDollar, &text, {content});
    }

    if (const std::string *lang = text.findAttribute(kLanguageAttribute))
    {
      if (!isBlank(*lang))
      {
        std::string normalized = normalizeLanguageList(*lang);
        if (normalized.empty())
        {
          text.removeAttribute(kLanguageAttribute);
        }
        else
        {
          text.setAttribute(kLanguageAttribute, normalized);
        }
      }
    }

    xml::Node *parent = text.parent();
    if (!parent || !parent->isElement())
    {
      return StructuralError(StructuralErrorCode::NoParentForText, &text);
    }
    if (!isSwitch(parent))
    {
      parent = wrapInSwitch(text);
    }

    const std::string *style = text.findAttribute("style");
    if (style && !style->empty())
    {
      parent->setAttribute("style", *style);
    }

    for (const xml::Node *child : text.elementChildren())
    {
      if (!isSpan(child))
      {
        return StructuralError(StructuralErrorCode::NonTspanInsideText, child, {child->name()});
      }
    }
    return std::nullopt;
  }

  /// \brief Replace a TextBlock tagged with a language list by one copy
  /// per language, in place.
  inline MaybeError expandLanguageList(xml::Node &sw, xml::Node &text, IdAllocator &ids)
  {
    std::vector<std::string> langs = splitLanguageList(text.getAttribute(kLanguageAttribute));
    std::set<std::string> present;
    for (const auto &lang : langs)
    {
      if (!present.insert(lang).second)
      {
        return StructuralError(StructuralErrorCode::MultipleLangInText, &text, {lang});
      }
    }
    if (langs.size() < 2)
    {
      return std::nullopt;
    }

    std::size_t index = sw.indexOf(&text);
    for (const auto &lang : langs)
    {
      xml::Node *copy = sw.insertChild(index++, text.clone());
      copy->setAttribute(kLanguageAttribute, lang);
      std::string textId = copy->getAttribute("id");
      if (!textId.empty())
      {
        copy->setAttribute("id", ids.derive(textId, lang));
      }
      for (xml::Node *span : spansOf(*copy))
      {
        std::string spanId = span->getAttribute("id");
        if (!spanId.empty())
        {
          span->setAttribute("id", ids.derive(spanId, lang));
        }
      }
    }
    sw.detach(&text);
    return std::nullopt;
  }

  inline MaybeError checkSwitch(xml::Node &sw, IdAllocator &ids)
  {
    std::vector<xml::Node *> children;
    for (const auto &c : sw.children())
    {
      children.push_back(c.get());
    }
    for (xml::Node *child : children)
    {
      if (isCharacterData(child))
      {
        if (!isBlank(child->value()))
        {
          return StructuralError(StructuralErrorCode::SwitchTextContentOutsideText, &sw,
                                 {util::trim(child->value())});
        }
        continue;
      }
      if (!child->isElement())
      {
        continue;
      }
      if (!isTextBlock(child))
      {
        return StructuralError(StructuralErrorCode::SwitchChildNotText, child, {child->name()});
      }
      if (auto err = expandLanguageList(sw, *child, ids))
      {
        return err;
      }
    }

    std::set<std::string> langs;
    for (const xml::Node *text : textBlocksOf(sw))
    {
      std::string lang = languageOf(*text);
      if (lang.empty())
      {
        lang = "fallback";
      }
      if (!langs.insert(lang).second)
      {
        return StructuralError(StructuralErrorCode::MultipleTextSameLang, &sw, {lang});
      }
    }
    return std::nullopt;
  }

  inline std::tuple<int, std::uint64_t, std::string> orderKey(const xml::Node &text)
  {
    std::string lang = languageOf(text);
    return std::make_tuple(lang.empty() ? 1 : 0,
                           embeddedIdNumber(text.getAttribute("id")).value_or(kUnnumberedOrder),
                           lang);
  }
} // namespace detail

/// \brief Sort the TextBlocks of \p sw by (fallback last, reserved id
/// number, language). Other children keep their slots; TextBlocks are
/// permuted among the slots TextBlocks already occupy.
inline void reorderSwitch(xml::Node &sw)
{
  std::vector<std::size_t> slots;
  for (std::size_t i = 0; i < sw.childCount(); ++i)
  {
    if (isTextBlock(sw.child(i)))
    {
      slots.push_back(i);
    }
  }
  if (slots.size() < 2)
  {
    return;
  }
  std::vector<xml::Node::NodePtr> blocks(slots.size());
  for (std::size_t k = slots.size(); k-- > 0;)
  {
    blocks[k] = sw.detachChild(slots[k]);
  }
  std::stable_sort(blocks.begin(), blocks.end(),
                   [](const xml::Node::NodePtr &a, const xml::Node::NodePtr &b) {
                     return detail::orderKey(*a) < detail::orderKey(*b);
                   });
  for (std::size_t k = 0; k < slots.size(); ++k)
  {
    sw.insertChild(slots[k], std::move(blocks[k]));
  }
}

/// \brief reorderSwitch() for every <switch> under \p root.
inline void reorderSwitches(xml::Node &root)
{
  std::vector<xml::Node *> switches = root.descendants(kSvgNamespace, kSwitch);
  if (isSwitch(&root))
  {
    switches.insert(switches.begin(), &root);
  }
  for (xml::Node *sw : switches)
  {
    reorderSwitch(*sw);
  }
}

/// \brief Validate and rewrite \p input into canonical translatable shape.
///
/// Returns the normalized copy or the first structural violation found. A
/// document without any <text> is returned unchanged.
inline Result<xml::Document> normalize(const xml::Document &input)
{
  using detail::MaybeError;

  xml::Document doc = input.clone();
  xml::Node *root = doc.root();
  if (!root)
  {
    return StructuralError(StructuralErrorCode::NoDocElement, nullptr);
  }

  const std::string *xmlns = root->findAttribute("xmlns");
  if (!xmlns || detail::isEntityReferenceOnly(*xmlns))
  {
    root->setAttribute("xmlns", std::string(kSvgNamespace));
  }

  if (isTextBlock(root))
  {
    return StructuralError(StructuralErrorCode::NoParentForText, root);
  }
  std::vector<xml::Node *> texts = root->descendants(kSvgNamespace, kText);
  if (texts.empty())
  {
    SVGTR_LOG_WARN("Document has nothing to translate");
    return input.clone();
  }

  std::vector<xml::Node *> trefs = root->descendants(kSvgNamespace, kTref);
  if (!trefs.empty())
  {
    return StructuralError(StructuralErrorCode::ContainsTref, trefs.front());
  }

  if (MaybeError err = detail::checkStyles(*root))
  {
    return *err;
  }

  for (const xml::Node *span : root->descendants(kSvgNamespace, kSpan))
  {
    if (span->hasElementChildren())
    {
      return StructuralError(StructuralErrorCode::NestedTspansNotSupported, span,
                             {span->getAttribute("id")});
    }
  }

  for (xml::Node *text : texts)
  {
    detail::wrapCharacterData(*text);
  }

  detail::pruneEmpty(root->descendants(kSvgNamespace, kSpan));
  detail::pruneEmpty(root->descendants(kSvgNamespace, kText));

  std::vector<xml::Node *> translatable = root->descendants(kSvgNamespace, kSpan);
  texts = root->descendants(kSvgNamespace, kText);
  translatable.insert(translatable.end(), texts.begin(), texts.end());

  if (MaybeError err = detail::cleanIds(translatable))
  {
    return *err;
  }
  IdAllocator ids(*root);
  std::size_t assigned = 0;
  for (xml::Node *node : translatable)
  {
    if (!node->hasAttribute("id"))
    {
      node->setAttribute("id", ids.next());
      ++assigned;
    }
  }

  for (xml::Node *text : texts)
  {
    if (MaybeError err = detail::prepareTextBlock(*text))
    {
      return *err;
    }
  }

  std::vector<xml::Node *> switches = root->descendants(kSvgNamespace, kSwitch);
  for (xml::Node *sw : switches)
  {
    if (MaybeError err = detail::checkSwitch(*sw, ids))
    {
      return *err;
    }
  }

  reorderSwitches(*root);

  SVGTR_LOG_DEBUG("Normalized " << texts.size() << " text elements in " << switches.size()
                                << " switches, assigned " << assigned << " ids");
  return Result<xml::Document>(std::move(doc));
}

} // namespace translate
} // namespace svgtr
