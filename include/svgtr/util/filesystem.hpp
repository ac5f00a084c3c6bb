// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of svgtr, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <atomic>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>
#include <unistd.h> // for getpid

#include <svgtr/core/logger.hpp>

namespace svgtr
{
namespace util
{

/// \brief Read a whole file into memory. std::nullopt if it cannot be opened.
inline std::optional<std::string> readFile(const std::filesystem::path &path)
{
  std::ifstream file(path, std::ios::binary);
  if (!file)
  {
    return std::nullopt;
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  if (file.bad())
  {
    return std::nullopt;
  }
  return buffer.str();
}

/// \brief Create the parent directory of \p path if it does not exist.
inline bool ensureParentDirectory(const std::filesystem::path &path)
{
  auto parent = path.parent_path();
  if (parent.empty())
  {
    return true;
  }
  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  if (ec)
  {
    SVGTR_LOG_ERROR("Failed to create directory " << parent.string() << ": " << ec.message());
    return false;
  }
  return true;
}

/// \brief Replace \p path with \p data as a whole: the bytes go to a sibling
/// temporary file which is then renamed over the target. Readers never see
/// a partially written file.
inline bool writeFileAtomic(const std::filesystem::path &path, const std::string &data)
{
  static std::atomic<unsigned> counter{0};
  if (!ensureParentDirectory(path))
  {
    return false;
  }
  std::filesystem::path tmp = path;
  tmp += ".tmp." + std::to_string(::getpid()) + "." + std::to_string(counter.fetch_add(1));
  {
    std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
    if (!file)
    {
      SVGTR_LOG_ERROR("Failed to open " << tmp.string() << " for writing");
      return false;
    }
    file.write(data.data(), static_cast<std::streamsize>(data.size()));
    file.flush();
    if (!file)
    {
      SVGTR_LOG_ERROR("Failed to write " << tmp.string());
      std::error_code ignored;
      std::filesystem::remove(tmp, ignored);
      return false;
    }
  }
  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if (ec)
  {
    SVGTR_LOG_ERROR("Failed to move " << tmp.string() << " to " << path.string() << ": "
                                      << ec.message());
    std::error_code ignored;
    std::filesystem::remove(tmp, ignored);
    return false;
  }
  SVGTR_LOG_DEBUG("Wrote " << data.size() << " bytes to " << path.string());
  return true;
}

/// \brief Where a processed document is written: the explicit output file
/// if given, else the output directory joined with the source file name,
/// else next to the source. The parent directory is created.
inline std::filesystem::path resolveOutputPath(const std::filesystem::path &source,
                                               const std::filesystem::path &outputFile = {},
                                               const std::filesystem::path &outputDir = {})
{
  std::filesystem::path target;
  if (!outputFile.empty())
  {
    target = outputFile;
  }
  else if (!outputDir.empty())
  {
    target = outputDir / source.filename();
  }
  else
  {
    target = source.parent_path() / source.filename();
  }
  if (!ensureParentDirectory(target))
  {
    SVGTR_LOG_WARN("Output directory for " << target.string() << " is not available");
  }
  return target;
}

} // namespace util
} // namespace svgtr
