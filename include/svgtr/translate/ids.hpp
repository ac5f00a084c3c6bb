// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of svgtr, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once
/// \file ids.hpp
/// \brief Reserved "trsvg<N>" ids and per-document id allocation.

#include <cstdint>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <string_view>

#include <svgtr/parsers/xml.hpp>

namespace svgtr
{
namespace translate
{

constexpr std::string_view kReservedIdPrefix = "trsvg";

/// Numbers longer than this are treated as custom ids.
constexpr std::size_t kMaxReservedDigits = 15;

namespace detail
{
  inline std::optional<std::uint64_t> parseDigits(std::string_view s)
  {
    if (s.empty() || s.size() > kMaxReservedDigits)
    {
      return std::nullopt;
    }
    std::uint64_t n = 0;
    for (char c : s)
    {
      if (c < '0' || c > '9')
      {
        return std::nullopt;
      }
      n = n * 10 + static_cast<std::uint64_t>(c - '0');
    }
    return n;
  }
} // namespace detail

/// \brief N when \p id is exactly "trsvg<N>".
inline std::optional<std::uint64_t> reservedIdNumber(std::string_view id)
{
  if (id.substr(0, kReservedIdPrefix.size()) != kReservedIdPrefix)
  {
    return std::nullopt;
  }
  return detail::parseDigits(id.substr(kReservedIdPrefix.size()));
}

/// \brief The first "trsvg<digits>" run found anywhere in \p id
/// ("trsvg12-fr" -> 12).
inline std::optional<std::uint64_t> embeddedIdNumber(std::string_view id)
{
  std::size_t pos = id.find(kReservedIdPrefix);
  while (pos != std::string_view::npos)
  {
    std::size_t start = pos + kReservedIdPrefix.size();
    std::size_t end = start;
    while (end < id.size() && id[end] >= '0' && id[end] <= '9')
    {
      ++end;
    }
    if (end > start)
    {
      return detail::parseDigits(id.substr(start, end - start));
    }
    pos = id.find(kReservedIdPrefix, pos + 1);
  }
  return std::nullopt;
}

inline bool isNumericId(std::string_view id)
{
  if (id.empty())
  {
    return false;
  }
  for (char c : id)
  {
    if (c < '0' || c > '9')
    {
      return false;
    }
  }
  return true;
}

/// \brief "<base>-<lang>", then "<base>-<lang>-2", "-3", ... until the id is
/// not in \p idsInUse.
inline std::string generateUniqueId(std::string_view base, std::string_view lang,
                                    const std::set<std::string, std::less<>> &idsInUse)
{
  std::string candidate = std::string(base) + "-" + std::string(lang);
  if (idsInUse.find(candidate) == idsInUse.end())
  {
    return candidate;
  }
  for (std::uint64_t n = 2;; ++n)
  {
    std::string next = candidate + "-" + std::to_string(n);
    if (idsInUse.find(next) == idsInUse.end())
    {
      return next;
    }
  }
}

/// \brief Id bookkeeping for one document pass.
///
/// Tracks every id present in the tree and the highest reserved number, and
/// hands out fresh "trsvg<N>" ids above it.
class IdAllocator
{
public:
  using IdSet = std::set<std::string, std::less<>>;

  IdAllocator() = default;

  /// \brief Seed from every element id in the subtree rooted at \p root.
  explicit IdAllocator(const parsers::xml::Node &root) { scan(root); }

  void scan(const parsers::xml::Node &node)
  {
    if (node.isElement())
    {
      if (const std::string *id = node.findAttribute("id"))
      {
        reserve(*id);
      }
    }
    for (const auto &c : node.children())
    {
      scan(*c);
    }
  }

  void reserve(const std::string &id)
  {
    _ids.insert(id);
    if (auto n = reservedIdNumber(id))
    {
      if (*n > _max)
      {
        _max = *n;
      }
    }
  }

  bool contains(std::string_view id) const { return _ids.find(id) != _ids.end(); }

  /// \brief Allocate and reserve the next "trsvg<N>".
  std::string next()
  {
    std::string id;
    do
    {
      ++_max;
      id = std::string(kReservedIdPrefix) + std::to_string(_max);
    } while (contains(id));
    _ids.insert(id);
    return id;
  }

  /// \brief Allocate and reserve a "<base>-<lang>" style id.
  std::string derive(std::string_view base, std::string_view lang)
  {
    std::string id = generateUniqueId(base, lang, _ids);
    _ids.insert(id);
    return id;
  }

  const IdSet &ids() const { return _ids; }
  std::uint64_t maxReserved() const { return _max; }

private:
  IdSet _ids;
  std::uint64_t _max{0};
};

} // namespace translate
} // namespace svgtr
