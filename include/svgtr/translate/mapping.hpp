// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of svgtr, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once
/// \file mapping.hpp
/// \brief Translation mappings and their JSON representation.
///
/// On disk a mapping bundle is a JSON object:
/// \code
/// {
///   "new":   { "population 2020": { "fr": "population 2020" } },
///   "title": { "population": { "fr": "population" } }
/// }
/// \endcode
/// A bare `{ text: { lang: translation } }` object is accepted as "new".

#include <filesystem>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <svgtr/core/logger.hpp>
#include <svgtr/parsers/json.hpp>
#include <svgtr/util/filesystem.hpp>

namespace svgtr
{
namespace translate
{

/// \brief What happens when two sources translate the same text into the
/// same language.
enum class MergePolicy
{
  FirstWins,
  Overwrite
};

/// \brief { defaultText -> { lang -> translatedText } }
class TranslationMapping
{
public:
  using LanguageMap = std::map<std::string, std::string>;
  using Map = std::map<std::string, LanguageMap, std::less<>>;

  /// \brief Store \p text unless \p key already has a \p lang entry.
  /// Returns true when stored.
  bool set(const std::string &key, const std::string &lang, const std::string &text)
  {
    return _entries[key].emplace(lang, text).second;
  }

  /// \brief Store \p text, replacing any existing entry.
  void assign(const std::string &key, const std::string &lang, const std::string &text)
  {
    _entries[key][lang] = text;
  }

  void merge(const TranslationMapping &other, MergePolicy policy = MergePolicy::FirstWins)
  {
    for (const auto &[key, langs] : other._entries)
    {
      auto &target = _entries[key];
      for (const auto &[lang, text] : langs)
      {
        if (policy == MergePolicy::Overwrite)
        {
          target[lang] = text;
        }
        else
        {
          target.emplace(lang, text);
        }
      }
    }
  }

  const LanguageMap *find(std::string_view key) const
  {
    auto it = _entries.find(key);
    return it == _entries.end() ? nullptr : &it->second;
  }

  bool contains(std::string_view key) const { return find(key) != nullptr; }
  bool empty() const { return _entries.empty(); }
  std::size_t size() const { return _entries.size(); }

  Map::const_iterator begin() const { return _entries.begin(); }
  Map::const_iterator end() const { return _entries.end(); }

  /// \brief Every language that appears under any key.
  std::set<std::string> languages() const
  {
    std::set<std::string> out;
    for (const auto &entry : _entries)
    {
      for (const auto &lang : entry.second)
      {
        out.insert(lang.first);
      }
    }
    return out;
  }

  bool operator==(const TranslationMapping &other) const { return _entries == other._entries; }
  bool operator!=(const TranslationMapping &other) const { return !(*this == other); }

private:
  Map _entries;
};

/// Same shape as TranslationMapping, keyed by text with its trailing year
/// removed.
using TitleMapping = TranslationMapping;

/// \brief The "new" and "title" halves of a mapping file.
struct MappingBundle
{
  TranslationMapping translations;
  TitleMapping titles;

  bool empty() const { return translations.empty() && titles.empty(); }

  void merge(const MappingBundle &other, MergePolicy policy = MergePolicy::FirstWins)
  {
    translations.merge(other.translations, policy);
    titles.merge(other.titles, policy);
  }
};

/// Bookkeeping key written by older extraction tools; never a translation.
constexpr std::string_view kLegacySpanIndexKey = "default_tspans_by_id";

inline parsers::Json toJson(const TranslationMapping &mapping)
{
  parsers::Json out = parsers::Json::object();
  for (const auto &[key, langs] : mapping)
  {
    parsers::Json entry = parsers::Json::object();
    for (const auto &[lang, text] : langs)
    {
      entry[lang] = text;
    }
    out[key] = std::move(entry);
  }
  return out;
}

inline parsers::Json toJson(const MappingBundle &bundle)
{
  parsers::Json out = parsers::Json::object();
  out["new"] = toJson(bundle.translations);
  out["title"] = toJson(bundle.titles);
  return out;
}

/// \brief Read a `{ text: { lang: translation } }` object. Entries that do
/// not have that shape are skipped.
inline TranslationMapping translationsFromJson(const parsers::Json &json)
{
  TranslationMapping mapping;
  if (!json.isObject())
  {
    return mapping;
  }
  for (const auto &[key, langs] : json.getObject())
  {
    if (key == kLegacySpanIndexKey || !langs.isObject())
    {
      continue;
    }
    for (const auto &[lang, text] : langs.getObject())
    {
      if (text.isString())
      {
        mapping.set(key, lang, text.getString());
      }
    }
  }
  return mapping;
}

inline MappingBundle bundleFromJson(const parsers::Json &json)
{
  MappingBundle bundle;
  const parsers::Json *translations = json.find("new");
  const parsers::Json *titles = json.find("title");
  bool structured = (translations && translations->isObject()) || (titles && titles->isObject());
  if (!structured)
  {
    bundle.translations = translationsFromJson(json);
    return bundle;
  }
  if (translations)
  {
    bundle.translations = translationsFromJson(*translations);
  }
  if (titles)
  {
    bundle.titles = translationsFromJson(*titles);
  }
  return bundle;
}

/// \brief Load one mapping file. A missing or malformed file is logged and
/// yields an empty bundle.
inline MappingBundle loadMappingFile(const std::filesystem::path &path)
{
  auto content = util::readFile(path);
  if (!content)
  {
    SVGTR_LOG_WARN("Mapping file not found: " << path.string());
    return {};
  }
  auto parsed = parsers::Json::parse(*content);
  if (!parsed.ok)
  {
    SVGTR_LOG_WARN("Ignoring malformed mapping file " << path.string() << ": "
                                                       << parsed.error.toString());
    return {};
  }
  if (!parsed.value.isObject())
  {
    SVGTR_LOG_WARN("Ignoring mapping file " << path.string() << ": top level is not an object");
    return {};
  }
  MappingBundle bundle = bundleFromJson(parsed.value);
  SVGTR_LOG_DEBUG("Loaded " << bundle.translations.size() << " translations and "
                            << bundle.titles.size() << " titles from " << path.string());
  return bundle;
}

/// \brief Load and merge several mapping files in order.
inline MappingBundle loadMappingFiles(const std::vector<std::filesystem::path> &paths,
                                      MergePolicy policy = MergePolicy::FirstWins)
{
  MappingBundle bundle;
  for (const auto &path : paths)
  {
    bundle.merge(loadMappingFile(path), policy);
  }
  return bundle;
}

inline bool saveMappingFile(const std::filesystem::path &path, const MappingBundle &bundle)
{
  parsers::SerializeOptions options;
  options.pretty = true;
  return util::writeFileAtomic(path, toJson(bundle).dump(options) + "\n");
}

} // namespace translate
} // namespace svgtr
