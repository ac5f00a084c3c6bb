// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of svgtr, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace svgtr
{
namespace translate
{

/// \brief Canonicalize a language tag into a simple IETF-like form.
///
/// The tag is trimmed and split on runs of '_', '-' and whitespace. The
/// primary subtag is lowercased; two-letter subtags are uppercased, others
/// title-cased. "en_us" -> "en-US", "sr_latn_rs" -> "sr-Latn-RS",
/// "EN" -> "en". Not a BCP-47 validator. Empty input is returned as is.
inline std::string normalizeLanguage(std::string_view lang)
{
  auto isSeparator = [](char c) { return c == '_' || c == '-' || std::isspace(static_cast<unsigned char>(c)); };

  std::vector<std::string> pieces;
  std::string current;
  for (char c : lang)
  {
    if (isSeparator(c))
    {
      if (!current.empty())
      {
        pieces.push_back(std::move(current));
        current.clear();
      }
    }
    else
    {
      current.push_back(c);
    }
  }
  if (!current.empty())
  {
    pieces.push_back(std::move(current));
  }
  if (pieces.empty())
  {
    return std::string(lang);
  }

  std::string result;
  for (std::size_t i = 0; i < pieces.size(); ++i)
  {
    std::string &p = pieces[i];
    if (i == 0)
    {
      for (char &c : p)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
      result = p;
      continue;
    }
    if (p.size() == 2)
    {
      for (char &c : p)
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    else
    {
      bool first = true;
      for (char &c : p)
      {
        c = static_cast<char>(first ? std::toupper(static_cast<unsigned char>(c))
                                    : std::tolower(static_cast<unsigned char>(c)));
        first = false;
      }
    }
    result += '-';
    result += p;
  }
  return result;
}

/// \brief Split a comma separated systemLanguage value ("en, fr,de")
/// into its items, dropping empty ones.
inline std::vector<std::string> splitLanguageList(std::string_view value)
{
  std::vector<std::string> items;
  std::size_t start = 0;
  while (start <= value.size())
  {
    std::size_t comma = value.find(',', start);
    std::string_view item =
      value.substr(start, comma == std::string_view::npos ? std::string_view::npos : comma - start);
    std::size_t b = item.find_first_not_of(" \t\r\n");
    if (b != std::string_view::npos)
    {
      std::size_t e = item.find_last_not_of(" \t\r\n");
      items.emplace_back(item.substr(b, e - b + 1));
    }
    if (comma == std::string_view::npos)
    {
      break;
    }
    start = comma + 1;
  }
  return items;
}

/// \brief Canonicalize every item of a systemLanguage list, keeping the
/// list shape ("en_us, FR" -> "en-US,fr").
inline std::string normalizeLanguageList(std::string_view value)
{
  std::string out;
  for (const auto &item : splitLanguageList(value))
  {
    std::string tag = normalizeLanguage(item);
    if (tag.empty())
    {
      continue;
    }
    if (!out.empty())
    {
      out += ',';
    }
    out += tag;
  }
  return out;
}

} // namespace translate
} // namespace svgtr
