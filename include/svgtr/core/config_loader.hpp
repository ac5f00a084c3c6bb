// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of svgtr, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <svgtr/parsers/minimal_toml.hpp>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace svgtr
{
namespace core
{
/// \brief Loads a TOML configuration file and exposes typed lookups by
/// dotted key (e.g. "svgtr.batch.workers").
class ConfigLoader
{
public:
  /// \brief Constructs and loads a TOML configuration file.
  /// \throws std::runtime_error if the file is missing or malformed.
  explicit ConfigLoader(const std::string &filename) : _filename(filename) { load(); }

  /// \brief Reloads the configuration from disk. On failure the table is
  /// cleared and the reason is available from lastError().
  bool reload()
  {
    try
    {
      _table = parsers::toml::parse_file(_filename);
      _lastError.clear();
      return true;
    }
    catch (const std::exception &ex)
    {
      _table = parsers::toml::table{};
      _lastError = ex.what();
      return false;
    }
  }

  const parsers::toml::table &load()
  {
    if (!reload())
    {
      throw std::runtime_error("Failed to load configuration file: " + _filename + " (" +
                               _lastError + ")");
    }
    return _table;
  }

  const parsers::toml::table &table() const { return _table; }
  const std::string &filename() const { return _filename; }
  const std::string &lastError() const { return _lastError; }

  /// \brief Gets a typed value from the configuration.
  /// \tparam T One of int64_t, double, bool, std::string.
  template <typename T> std::optional<T> get(const std::string &dottedKey) const
  {
    return _table.get<T>(dottedKey);
  }

  std::optional<int64_t> getInt(const std::string &key) const { return get<int64_t>(key); }

  std::optional<bool> getBool(const std::string &key) const { return get<bool>(key); }

  std::optional<std::string> getString(const std::string &key) const
  {
    return get<std::string>(key);
  }

  /// \brief Gets an array of strings. A single string value is accepted as
  /// a one-element array.
  /// \throws std::runtime_error if the key is an array with a non-string
  /// element.
  std::optional<std::vector<std::string>> getStringArray(const std::string &key) const
  {
    const parsers::toml::value *node = _table.find(key);
    if (!node)
    {
      return std::nullopt;
    }
    if (auto *single = std::get_if<std::string>(node))
    {
      return std::vector<std::string>{*single};
    }
    auto *arr = std::get_if<parsers::toml::array>(node);
    if (!arr)
    {
      return std::nullopt;
    }
    std::vector<std::string> result;
    for (const auto &elem : *arr)
    {
      if (auto *strVal = std::get_if<std::string>(&elem))
      {
        result.push_back(*strVal);
      }
      else
      {
        throw std::runtime_error("ConfigLoader: Array element at '" + key + "' is not a string");
      }
    }
    return result;
  }

private:
  std::string _filename;
  std::string _lastError;
  parsers::toml::table _table;
};

} // namespace core
} // namespace svgtr
