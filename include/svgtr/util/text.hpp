// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of svgtr, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once
/// \file text.hpp
/// \brief UTF-8 aware whitespace and case helpers used to build mapping
/// keys.

#include <unicode/uchar.h>
#include <unicode/utf8.h>

#include <cstdint>
#include <string>
#include <string_view>

namespace svgtr
{
namespace util
{

namespace detail
{
  /// \brief Decode the code point at \p pos and advance past it. Ill-formed
  /// sequences yield a negative value and are skipped as a unit.
  inline UChar32 nextCodePoint(std::string_view s, std::int32_t &pos)
  {
    const auto *bytes = reinterpret_cast<const std::uint8_t *>(s.data());
    const auto length = static_cast<std::int32_t>(s.size());
    UChar32 cp = 0;
    U8_NEXT(bytes, pos, length, cp);
    return cp;
  }

  inline void appendCodePoint(UChar32 cp, std::string &out)
  {
    std::uint8_t buffer[U8_MAX_LENGTH];
    std::int32_t len = 0;
    U8_APPEND_UNSAFE(buffer, len, cp);
    out.append(reinterpret_cast<const char *>(buffer), static_cast<std::size_t>(len));
  }

  /// \brief Unicode White_Space plus the ASCII information separators.
  inline bool isSpace(UChar32 cp)
  {
    return cp >= 0 && (u_isUWhiteSpace(cp) || (cp >= 0x1C && cp <= 0x1F));
  }
} // namespace detail

/// \brief Strip leading and trailing whitespace (Unicode aware).
inline std::string trim(std::string_view text)
{
  std::size_t begin = 0;
  std::size_t end = 0;
  bool seen = false;
  for (std::int32_t pos = 0; pos < static_cast<std::int32_t>(text.size());)
  {
    std::int32_t start = pos;
    UChar32 cp = detail::nextCodePoint(text, pos);
    if (!detail::isSpace(cp))
    {
      if (!seen)
      {
        begin = static_cast<std::size_t>(start);
        seen = true;
      }
      end = static_cast<std::size_t>(pos);
    }
  }
  return seen ? std::string(text.substr(begin, end - begin)) : std::string{};
}

/// \brief Lowercase \p text with the ICU simple case mapping, code point by
/// code point.
inline std::string foldCase(std::string_view text)
{
  std::string out;
  out.reserve(text.size());
  for (std::int32_t pos = 0; pos < static_cast<std::int32_t>(text.size());)
  {
    std::int32_t start = pos;
    UChar32 cp = detail::nextCodePoint(text, pos);
    if (cp < 0)
    {
      out.append(text.data() + start, static_cast<std::size_t>(pos - start)); // copied through
    }
    else
    {
      detail::appendCodePoint(u_tolower(cp), out);
    }
  }
  return out;
}

/// \brief Collapse every whitespace run to one space and trim the ends,
/// optionally folding case.
inline std::string normalizeText(std::string_view text, bool caseInsensitive = false)
{
  std::string out;
  out.reserve(text.size());
  bool pendingSpace = false;
  for (std::int32_t pos = 0; pos < static_cast<std::int32_t>(text.size());)
  {
    std::int32_t start = pos;
    UChar32 cp = detail::nextCodePoint(text, pos);
    if (detail::isSpace(cp))
    {
      pendingSpace = !out.empty();
    }
    else
    {
      if (pendingSpace)
      {
        out.push_back(' ');
        pendingSpace = false;
      }
      out.append(text.data() + start, static_cast<std::size_t>(pos - start));
    }
  }
  return caseInsensitive ? foldCase(out) : out;
}

/// \brief True when the last four characters are ASCII digits.
inline bool endsWithYear(std::string_view text)
{
  if (text.size() < 4)
  {
    return false;
  }
  for (std::size_t i = text.size() - 4; i < text.size(); ++i)
  {
    if (text[i] < '0' || text[i] > '9')
    {
      return false;
    }
  }
  return true;
}

/// \brief The trailing four-digit year, or an empty view.
inline std::string_view yearSuffix(std::string_view text)
{
  return endsWithYear(text) ? text.substr(text.size() - 4) : std::string_view{};
}

inline std::string_view stripYear(std::string_view text)
{
  return endsWithYear(text) ? text.substr(0, text.size() - 4) : text;
}

} // namespace util
} // namespace svgtr
