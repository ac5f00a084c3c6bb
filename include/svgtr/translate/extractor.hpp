// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of svgtr, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cctype>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <svgtr/core/logger.hpp>
#include <svgtr/parsers/xml.hpp>
#include <svgtr/translate/lang.hpp>
#include <svgtr/translate/mapping.hpp>
#include <svgtr/translate/svg.hpp>
#include <svgtr/translate/titles.hpp>
#include <svgtr/util/text.hpp>

namespace svgtr
{
namespace translate
{

/// \brief Translations recovered from one document.
struct ExtractResult
{
  MappingBundle mapping;
  /// Switches that contributed at least one translation.
  std::size_t switchCount{0};
  std::set<std::string> languages;
};

namespace detail
{
  /// (id, text) pairs of a TextBlock: one per Span, or the block itself when
  /// it has no Spans.
  inline std::vector<std::pair<std::string, std::string>> translationUnits(const xml::Node &text)
  {
    std::vector<std::pair<std::string, std::string>> units;
    std::vector<xml::Node *> spans = spansOf(text);
    if (spans.empty())
    {
      units.emplace_back(util::trim(text.getAttribute("id")), text.textContent());
      return units;
    }
    for (const xml::Node *span : spans)
    {
      units.emplace_back(util::trim(span->getAttribute("id")), span->textContent());
    }
    return units;
  }

  inline std::string asciiLower(std::string s)
  {
    for (char &c : s)
    {
      c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
  }
} // namespace detail

/// \brief Build a translation mapping from the localized variants in \p doc.
///
/// Each Span of a tagged TextBlock is paired with the fallback Span whose id
/// is the part of its own id before the first '-' ("trsvg4-fr" pairs with
/// "trsvg4"). Keys are the whitespace-normalized fallback texts, case-folded
/// when \p caseInsensitive is set.
inline ExtractResult extract(const xml::Document &doc, bool caseInsensitive = true)
{
  ExtractResult result;
  const xml::Node *root = doc.root();
  if (!root)
  {
    return result;
  }

  std::vector<xml::Node *> switches = root->descendants(kSvgNamespace, kSwitch);
  SVGTR_LOG_DEBUG("Found " << switches.size() << " switch elements");

  for (const xml::Node *sw : switches)
  {
    std::vector<xml::Node *> texts = textBlocksOf(*sw);
    std::map<std::string, std::string> fallbackById;
    for (const xml::Node *text : texts)
    {
      if (isFallback(*text))
      {
        for (auto &[id, content] : detail::translationUnits(*text))
        {
          if (!id.empty())
          {
            fallbackById.emplace(id, util::trim(content));
          }
        }
      }
    }
    if (fallbackById.empty())
    {
      continue;
    }

    bool contributed = false;
    for (const xml::Node *text : texts)
    {
      if (isFallback(*text))
      {
        continue;
      }
      std::vector<std::string> langs;
      for (const auto &item : splitLanguageList(languageOf(*text)))
      {
        langs.push_back(normalizeLanguage(item));
      }
      for (const auto &[id, content] : detail::translationUnits(*text))
      {
        std::string baseId = util::trim(id.substr(0, id.find('-')));
        auto it = fallbackById.find(baseId);
        if (it == fallbackById.end())
        {
          it = fallbackById.find(detail::asciiLower(baseId));
        }
        if (it == fallbackById.end() || it->second.empty())
        {
          SVGTR_LOG_TRACE("No fallback span for '" << id << "'");
          continue;
        }
        std::string translation = util::normalizeText(content);
        if (translation.empty())
        {
          continue;
        }
        std::string key = util::normalizeText(it->second, caseInsensitive);
        for (const auto &lang : langs)
        {
          result.mapping.translations.assign(key, lang, translation);
          result.languages.insert(lang);
          contributed = true;
        }
      }
    }
    if (contributed)
    {
      ++result.switchCount;
    }
  }

  result.mapping.titles = makeTitleTranslations(result.mapping.translations);

  std::string langList;
  for (const auto &lang : result.languages)
  {
    langList += (langList.empty() ? "" : ", ") + lang;
  }
  SVGTR_LOG_DEBUG("Extracted translations for " << result.switchCount << " switches in "
                                                << result.languages.size()
                                                << " languages: " << langList);
  return result;
}

} // namespace translate
} // namespace svgtr
