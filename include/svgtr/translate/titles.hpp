// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of svgtr, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once
/// \file titles.hpp
/// \brief Year generalization of chart titles.
///
/// "Population 2020" -> {fr: "Population 2020"} is stored once as the title
/// "Population" -> {fr: "Population"} and re-expanded for any year:
/// "Population 1990" -> {fr: "Population 1990"}.

#include <string>
#include <string_view>
#include <vector>

#include <svgtr/translate/mapping.hpp>
#include <svgtr/util/text.hpp>

namespace svgtr
{
namespace translate
{

/// \brief Lift the year out of every entry whose key and translations all
/// end in the same four digit year.
inline TitleMapping makeTitleTranslations(const TranslationMapping &mapping)
{
  TitleMapping titles;
  for (const auto &[key, langs] : mapping)
  {
    std::string_view year = util::yearSuffix(key);
    if (year.empty() || key == year || langs.empty())
    {
      continue;
    }
    bool allSameYear = true;
    for (const auto &entry : langs)
    {
      if (util::yearSuffix(entry.second) != year)
      {
        allSameYear = false;
        break;
      }
    }
    if (!allSameYear)
    {
      continue;
    }
    std::string titleKey = util::trim(util::stripYear(key));
    for (const auto &[lang, text] : langs)
    {
      titles.set(titleKey, lang, util::trim(util::stripYear(text)));
    }
  }
  return titles;
}

/// \brief Translations for the year-suffixed \p candidates that have a
/// title entry, keyed by the full candidate text.
inline TranslationMapping getTitlesTranslations(const TitleMapping &titles,
                                                const std::vector<std::string> &candidates)
{
  TranslationMapping out;
  for (const auto &text : candidates)
  {
    std::string_view year = util::yearSuffix(text);
    if (year.empty())
    {
      continue;
    }
    std::string_view prefix = util::stripYear(text);
    const TranslationMapping::LanguageMap *langs = titles.find(prefix);
    if (!langs)
    {
      langs = titles.find(util::trim(prefix));
    }
    if (!langs)
    {
      continue;
    }
    for (const auto &[lang, value] : *langs)
    {
      out.assign(text, lang, value + " " + std::string(year));
    }
  }
  return out;
}

} // namespace translate
} // namespace svgtr
