// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of svgtr, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <map>
#include <set>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <svgtr/core/logger.hpp>
#include <svgtr/parsers/json.hpp>
#include <svgtr/parsers/xml.hpp>
#include <svgtr/translate/ids.hpp>
#include <svgtr/translate/lang.hpp>
#include <svgtr/translate/mapping.hpp>
#include <svgtr/translate/normalizer.hpp>
#include <svgtr/translate/structure_error.hpp>
#include <svgtr/translate/svg.hpp>
#include <svgtr/translate/titles.hpp>
#include <svgtr/util/text.hpp>

namespace svgtr
{
namespace translate
{

struct InjectOptions
{
  /// Replace the text of variants that already exist.
  bool overwrite{false};
  /// Match fallback texts against mapping keys ignoring case.
  bool caseInsensitive{true};
};

/// \brief Counters for one or more injection runs.
struct InjectionStats
{
  std::size_t processedSwitches{0};
  std::size_t inserted{0};
  std::size_t updated{0};
  std::size_t skipped{0};
  std::size_t newLanguages{0};
  std::size_t structuralErrors{0};

  InjectionStats &operator+=(const InjectionStats &other)
  {
    processedSwitches += other.processedSwitches;
    inserted += other.inserted;
    updated += other.updated;
    skipped += other.skipped;
    newLanguages += other.newLanguages;
    structuralErrors += other.structuralErrors;
    return *this;
  }

  bool operator==(const InjectionStats &other) const
  {
    return processedSwitches == other.processedSwitches && inserted == other.inserted &&
           updated == other.updated && skipped == other.skipped &&
           newLanguages == other.newLanguages && structuralErrors == other.structuralErrors;
  }

  parsers::Json toJson() const
  {
    parsers::Json out = parsers::Json::object();
    out["processed_switches"] = processedSwitches;
    out["inserted_translations"] = inserted;
    out["updated_translations"] = updated;
    out["skipped_translations"] = skipped;
    out["new_languages"] = newLanguages;
    out["structural_errors"] = structuralErrors;
    return out;
  }
};

struct InjectResult
{
  xml::Document document;
  InjectionStats stats;
};

namespace detail
{
  /// \brief Mapping lookups, optionally through a case-folded index.
  class TranslationLookup
  {
  public:
    TranslationLookup(const MappingBundle &bundle, bool caseInsensitive)
        : _bundle(bundle), _caseInsensitive(caseInsensitive)
    {
      if (!_caseInsensitive)
      {
        return;
      }
      // First key wins when two keys fold to the same text.
      for (const auto &[key, langs] : bundle.translations)
      {
        for (const auto &[lang, text] : langs)
        {
          _folded.set(util::foldCase(key), lang, text);
        }
      }
      for (const auto &[key, langs] : bundle.titles)
      {
        for (const auto &[lang, text] : langs)
        {
          _foldedTitles.set(util::foldCase(key), lang, text);
        }
      }
    }

    /// \brief {lang -> translation} for a fallback text, with languages
    /// canonicalized. Empty when nothing matches.
    std::map<std::string, std::string> resolve(const std::string &fallbackText) const
    {
      std::string key = util::normalizeText(fallbackText, _caseInsensitive);
      const TranslationMapping &primary = _caseInsensitive ? _folded : _bundle.translations;
      const TitleMapping &titles = _caseInsensitive ? _foldedTitles : _bundle.titles;

      std::map<std::string, std::string> out;
      const TranslationMapping::LanguageMap *langs = primary.find(key);
      TranslationMapping expanded;
      if (!langs)
      {
        expanded = getTitlesTranslations(titles, {key});
        langs = expanded.find(key);
      }
      if (!langs)
      {
        return out;
      }
      for (const auto &[lang, text] : *langs)
      {
        std::string canonical = normalizeLanguage(util::trim(lang));
        if (!canonical.empty() && !text.empty())
        {
          out.emplace(canonical, text);
        }
      }
      return out;
    }

  private:
    const MappingBundle &_bundle;
    bool _caseInsensitive;
    TranslationMapping _folded;
    TitleMapping _foldedTitles;
  };

  inline xml::Node *findVariant(const xml::Node &sw, const std::string &lang)
  {
    for (xml::Node *text : textBlocksOf(sw))
    {
      if (languageOf(*text) == lang)
      {
        return text;
      }
    }
    return nullptr;
  }

  /// \brief Add a copy of \p fallback tagged \p lang, with derived ids and
  /// the given Span texts, just before the fallback.
  inline void insertVariant(xml::Node &sw, const xml::Node &fallback, const std::string &lang,
                            const std::vector<std::string> &spanTexts, IdAllocator &ids)
  {
    // Inserted before span lookup: namespace resolution walks the parents.
    xml::Node *variant = sw.insertChild(sw.indexOf(&fallback), fallback.clone());
    variant->setAttribute(kLanguageAttribute, lang);
    variant->setAttribute("id", ids.derive(fallback.getAttribute("id"), lang));
    std::vector<xml::Node *> spans = spansOf(*variant);
    for (std::size_t i = 0; i < spans.size(); ++i)
    {
      spans[i]->setAttribute("id", ids.derive(spans[i]->getAttribute("id"), lang));
      setSpanText(*spans[i], spanTexts.at(i));
    }
  }
} // namespace detail

/// \brief Merge \p bundle into \p doc.
///
/// The document is normalized first; structural problems are returned as
/// errors. For each switch whose fallback texts all have translations, a
/// tagged copy of the fallback is added per language, or an existing
/// variant is skipped or rewritten depending on \p options.overwrite.
inline Result<InjectResult> inject(const xml::Document &doc, const MappingBundle &bundle,
                                   const InjectOptions &options = InjectOptions{})
{
  Result<xml::Document> normalized = normalize(doc);
  if (auto *err = std::get_if<StructuralError>(&normalized))
  {
    return *err;
  }
  InjectResult result{std::move(std::get<xml::Document>(normalized)), InjectionStats{}};
  xml::Node *root = result.document.root();
  if (!root)
  {
    return Result<InjectResult>(std::move(result));
  }

  detail::TranslationLookup lookup(bundle, options.caseInsensitive);
  IdAllocator ids(*root);

  std::set<std::string> documentLanguages;
  for (const xml::Node *text : root->descendants(kSvgNamespace, kText))
  {
    std::string lang = languageOf(*text);
    if (!lang.empty())
    {
      documentLanguages.insert(lang);
    }
  }

  std::set<std::string> addedLanguages;
  for (xml::Node *sw : root->descendants(kSvgNamespace, kSwitch))
  {
    xml::Node *fallback = fallbackOf(*sw);
    if (!fallback)
    {
      continue;
    }
    std::vector<xml::Node *> fallbackSpans = spansOf(*fallback);
    if (fallbackSpans.empty())
    {
      continue;
    }

    // Per span translations; only languages every span has are usable.
    std::vector<std::map<std::string, std::string>> perSpan;
    for (const xml::Node *span : fallbackSpans)
    {
      perSpan.push_back(lookup.resolve(span->textContent()));
    }
    std::vector<std::string> languages;
    for (const auto &entry : perSpan.front())
    {
      bool everywhere = true;
      for (std::size_t i = 1; i < perSpan.size() && everywhere; ++i)
      {
        everywhere = perSpan[i].count(entry.first) != 0;
      }
      if (everywhere)
      {
        languages.push_back(entry.first);
      }
    }
    if (languages.empty())
    {
      continue;
    }
    ++result.stats.processedSwitches;

    for (const auto &lang : languages)
    {
      std::vector<std::string> spanTexts;
      for (const auto &translations : perSpan)
      {
        spanTexts.push_back(translations.at(lang));
      }

      if (xml::Node *existing = detail::findVariant(*sw, lang))
      {
        if (!options.overwrite)
        {
          ++result.stats.skipped;
          continue;
        }
        std::vector<xml::Node *> spans = spansOf(*existing);
        for (std::size_t i = 0; i < spans.size() && i < spanTexts.size(); ++i)
        {
          setSpanText(*spans[i], spanTexts[i]);
        }
        ++result.stats.updated;
        continue;
      }

      detail::insertVariant(*sw, *fallback, lang, spanTexts, ids);
      ++result.stats.inserted;
      if (documentLanguages.count(lang) == 0)
      {
        addedLanguages.insert(lang);
      }
    }
    reorderSwitch(*sw);
  }
  result.stats.newLanguages = addedLanguages.size();

  SVGTR_LOG_DEBUG("Injection: " << result.stats.processedSwitches << " switches, "
                                << result.stats.inserted << " inserted, " << result.stats.updated
                                << " updated, " << result.stats.skipped << " skipped");
  return Result<InjectResult>(std::move(result));
}

} // namespace translate
} // namespace svgtr
