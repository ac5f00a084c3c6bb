// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of svgtr, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once
/// \file batch.hpp
/// \brief Inject one mapping into many documents and aggregate the results.

#include <algorithm>
#include <atomic>
#include <exception>
#include <filesystem>
#include <future>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <svgtr/core/logger.hpp>
#include <svgtr/core/thread_pool.hpp>
#include <svgtr/parsers/json.hpp>
#include <svgtr/translate/injector.hpp>
#include <svgtr/translate/mapping.hpp>
#include <svgtr/translate/structure_error.hpp>
#include <svgtr/translate/workflow.hpp>

namespace svgtr
{
namespace translate
{

struct BatchOptions
{
  /// Explicit output file; honored only when the batch has one document.
  std::filesystem::path outputFile;
  /// Output directory; documents keep their file names.
  std::filesystem::path outputDir;
  InjectOptions inject;
  /// Number of documents processed concurrently; 1 runs inline.
  std::size_t workers{1};
  /// When set and true, no further documents are started.
  const std::atomic<bool> *cancel{nullptr};
};

/// \brief What happened to one document of a batch.
struct FileRecord
{
  std::filesystem::path path;
  InjectionStats stats;
  std::optional<std::string> error;
  bool changed{false};
  std::optional<std::filesystem::path> savedTo;
};

class BatchResult
{
public:
  std::size_t saved{0};
  /// Documents that failed (parse, structure or write errors).
  std::size_t notSaved{0};
  /// Failures caused by nested <tspan> elements; also counted in notSaved.
  std::size_t nestedErrors{0};
  /// Documents left as they were; nothing is written for them.
  std::size_t noChanges{0};
  /// Documents never started because the batch was cancelled.
  std::size_t cancelled{0};
  /// Per document records keyed by file name, or by full path when two
  /// documents share a file name.
  std::map<std::string, FileRecord> files;
  InjectionStats totals;

  /// \brief Fold the outcome of one document into the result.
  void record(const std::filesystem::path &path, const InjectOutcome &outcome)
  {
    FileRecord rec;
    rec.path = path;
    rec.stats = outcome.stats;
    rec.error = outcome.error;
    rec.changed = outcome.changed;
    rec.savedTo = outcome.savedTo;

    if (outcome.error)
    {
      ++notSaved;
      if (*outcome.error == toString(StructuralErrorCode::NestedTspansNotSupported))
      {
        ++nestedErrors;
      }
    }
    else if (outcome.savedTo)
    {
      ++saved;
    }
    else
    {
      ++noChanges;
    }
    totals += outcome.stats;
    insert(std::move(rec));
  }

  BatchResult &operator+=(const BatchResult &other)
  {
    saved += other.saved;
    notSaved += other.notSaved;
    nestedErrors += other.nestedErrors;
    noChanges += other.noChanges;
    cancelled += other.cancelled;
    totals += other.totals;
    for (const auto &entry : other.files)
    {
      insert(entry.second);
    }
    return *this;
  }

  bool hasFailures() const { return notSaved > 0; }

  parsers::Json toJson() const
  {
    parsers::Json out = parsers::Json::object();
    out["saved"] = saved;
    out["not_saved"] = notSaved;
    out["nested_errors"] = nestedErrors;
    out["no_changes"] = noChanges;
    out["cancelled"] = cancelled;
    out["totals"] = totals.toJson();
    parsers::Json filesJson = parsers::Json::object();
    for (const auto &[name, rec] : files)
    {
      parsers::Json entry = rec.stats.toJson();
      entry["path"] = rec.path.string();
      if (rec.error)
      {
        entry["error"] = *rec.error;
      }
      if (rec.savedTo)
      {
        entry["saved_to"] = rec.savedTo->string();
      }
      filesJson[name] = std::move(entry);
    }
    out["files"] = std::move(filesJson);
    return out;
  }

private:
  void insert(FileRecord rec)
  {
    std::string key = rec.path.filename().string();
    auto it = files.find(key);
    if (it != files.end() && it->second.path != rec.path)
    {
      key = rec.path.string();
    }
    files[key] = std::move(rec);
  }
};

namespace detail
{
  inline void logOutcome(const std::filesystem::path &path, const InjectOutcome &outcome)
  {
    if (outcome.error)
    {
      SVGTR_LOG_WARN(path.filename().string() << ": not saved (" << *outcome.error << ")");
      return;
    }
    SVGTR_LOG_INFO(path.filename().string()
                   << ": " << outcome.stats.inserted << " inserted, " << outcome.stats.updated
                   << " updated, " << outcome.stats.skipped << " skipped"
                   << (outcome.savedTo ? ", saved to " + outcome.savedTo->string()
                                       : std::string(", no changes")));
  }

  inline bool isCancelled(const BatchOptions &options)
  {
    return options.cancel && options.cancel->load();
  }
} // namespace detail

/// \brief Inject \p bundle into every file of \p files.
///
/// Failures of one document never stop the batch. Documents are written
/// (atomically) only when their content changed.
inline BatchResult runBatch(const std::vector<std::filesystem::path> &files,
                            const MappingBundle &bundle, const BatchOptions &options = BatchOptions{})
{
  BatchResult result;
  if (bundle.empty())
  {
    SVGTR_LOG_WARN("No translations to inject");
  }

  OutputTarget target;
  target.directory = options.outputDir;
  if (!options.outputFile.empty())
  {
    if (files.size() == 1)
    {
      target.file = options.outputFile;
    }
    else
    {
      SVGTR_LOG_WARN("Ignoring output file " << options.outputFile.string() << " for a batch of "
                                             << files.size() << " documents");
    }
  }

  auto processOne = [&bundle, &options, &target](const std::filesystem::path &file)
    -> std::optional<InjectOutcome>
  {
    if (detail::isCancelled(options))
    {
      return std::nullopt;
    }
    return injectFile(file, bundle, options.inject, target);
  };

  auto fold = [&result](const std::filesystem::path &file, const std::optional<InjectOutcome> &outcome)
  {
    if (!outcome)
    {
      ++result.cancelled;
      return;
    }
    detail::logOutcome(file, *outcome);
    result.record(file, *outcome);
  };

  if (options.workers <= 1 || files.size() <= 1)
  {
    for (const auto &file : files)
    {
      fold(file, processOne(file));
    }
  }
  else
  {
    core::ThreadPool pool(std::min(options.workers, files.size()));
    std::vector<std::future<std::optional<InjectOutcome>>> pending;
    pending.reserve(files.size());
    for (const auto &file : files)
    {
      pending.push_back(pool.enqueueWithResult(processOne, file));
    }
    for (std::size_t i = 0; i < files.size(); ++i)
    {
      try
      {
        fold(files[i], pending[i].get());
      }
      catch (const std::exception &e)
      {
        SVGTR_LOG_ERROR(files[i].string() << ": " << e.what());
        InjectOutcome failed;
        failed.error = std::string("internal-error");
        result.record(files[i], failed);
      }
    }
  }

  SVGTR_LOG_INFO("Saved " << result.saved << ", not saved " << result.notSaved
                          << " (nested tspans " << result.nestedErrors << "), no changes "
                          << result.noChanges
                          << (result.cancelled ? ", cancelled " + std::to_string(result.cancelled)
                                               : std::string()));
  return result;
}

} // namespace translate
} // namespace svgtr
