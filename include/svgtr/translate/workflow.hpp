// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of svgtr, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once
/// \file workflow.hpp
/// \brief File level operations: prepare, extract and inject single
/// documents.

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <variant>

#include <svgtr/core/logger.hpp>
#include <svgtr/parsers/xml.hpp>
#include <svgtr/translate/extractor.hpp>
#include <svgtr/translate/injector.hpp>
#include <svgtr/translate/mapping.hpp>
#include <svgtr/translate/normalizer.hpp>
#include <svgtr/translate/structure_error.hpp>
#include <svgtr/util/filesystem.hpp>

namespace svgtr
{
namespace translate
{

/// Error codes reported for documents that could not be processed, besides
/// the structural codes.
constexpr const char *kParseError = "parse-error";
constexpr const char *kFileNotFound = "file-not-found";
constexpr const char *kNoMappings = "no-mappings";
constexpr const char *kWriteFailed = "write-failed";

/// \brief Where a processed document goes. Both empty means next to the
/// source, overwriting it.
struct OutputTarget
{
  std::filesystem::path file;
  std::filesystem::path directory;
};

/// \brief Outcome of processing one document.
struct InjectOutcome
{
  InjectionStats stats;
  /// Serialized result; empty on error.
  std::string output;
  /// The output differs from the input.
  bool changed{false};
  std::optional<std::string> error;
  std::optional<std::filesystem::path> savedTo;

  bool ok() const { return !error.has_value(); }
};

namespace detail
{
  inline std::optional<xml::Document> parseDocument(std::string_view source, std::string_view name)
  {
    xml::Error err;
    auto doc = xml::Document::parse(source, &err);
    if (!doc)
    {
      SVGTR_LOG_ERROR("Failed to parse " << name << ": " << err.toString());
    }
    return doc;
  }

  inline void failWith(InjectOutcome &outcome, const StructuralError &err, std::string_view name)
  {
    SVGTR_LOG_WARN(name << ": " << err.message() << " at " << err.node());
    outcome.error = err.codeString();
    outcome.stats.structuralErrors = 1;
  }

  inline void persist(InjectOutcome &outcome, const std::filesystem::path &source,
                      const std::optional<OutputTarget> &target)
  {
    if (!target || !outcome.changed)
    {
      return;
    }
    std::filesystem::path path = util::resolveOutputPath(source, target->file, target->directory);
    if (!util::writeFileAtomic(path, outcome.output))
    {
      outcome.error = kWriteFailed;
      return;
    }
    outcome.savedTo = path;
  }
} // namespace detail

/// \brief Parse, normalize and inject \p source text.
inline InjectOutcome injectDocument(std::string_view source, const MappingBundle &bundle,
                                    const InjectOptions &options = InjectOptions{},
                                    std::string_view name = "<document>")
{
  InjectOutcome outcome;
  if (bundle.empty())
  {
    outcome.error = kNoMappings;
    return outcome;
  }
  auto doc = detail::parseDocument(source, name);
  if (!doc)
  {
    outcome.error = kParseError;
    return outcome;
  }
  Result<InjectResult> injected = inject(*doc, bundle, options);
  if (auto *err = std::get_if<StructuralError>(&injected))
  {
    detail::failWith(outcome, *err, name);
    return outcome;
  }
  InjectResult &result = std::get<InjectResult>(injected);
  outcome.stats = result.stats;
  outcome.output = result.document.serialize();
  outcome.changed = outcome.output != source;
  return outcome;
}

/// \brief injectDocument() on a file, saving the result to \p target when
/// given and the content changed.
inline InjectOutcome injectFile(const std::filesystem::path &file, const MappingBundle &bundle,
                                const InjectOptions &options = InjectOptions{},
                                const std::optional<OutputTarget> &target = std::nullopt)
{
  auto source = util::readFile(file);
  if (!source)
  {
    SVGTR_LOG_ERROR("SVG file not found: " << file.string());
    InjectOutcome outcome;
    outcome.error = kFileNotFound;
    return outcome;
  }
  InjectOutcome outcome = injectDocument(*source, bundle, options, file.string());
  if (outcome.ok())
  {
    detail::persist(outcome, file, target);
  }
  return outcome;
}

/// \brief Normalize a file without injecting anything.
inline InjectOutcome prepareFile(const std::filesystem::path &file,
                                 const std::optional<OutputTarget> &target = std::nullopt)
{
  InjectOutcome outcome;
  auto source = util::readFile(file);
  if (!source)
  {
    SVGTR_LOG_ERROR("SVG file not found: " << file.string());
    outcome.error = kFileNotFound;
    return outcome;
  }
  auto doc = detail::parseDocument(*source, file.string());
  if (!doc)
  {
    outcome.error = kParseError;
    return outcome;
  }
  Result<xml::Document> normalized = normalize(*doc);
  if (auto *err = std::get_if<StructuralError>(&normalized))
  {
    detail::failWith(outcome, *err, file.string());
    return outcome;
  }
  outcome.output = std::get<xml::Document>(normalized).serialize();
  outcome.changed = outcome.output != *source;
  detail::persist(outcome, file, target);
  return outcome;
}

/// \brief Extract the translations of a file. std::nullopt when it cannot be
/// read or parsed.
inline std::optional<ExtractResult> extractFile(const std::filesystem::path &file,
                                                bool caseInsensitive = true)
{
  auto source = util::readFile(file);
  if (!source)
  {
    SVGTR_LOG_ERROR("SVG file not found: " << file.string());
    return std::nullopt;
  }
  SVGTR_LOG_DEBUG("Extracting translations from " << file.string());
  auto doc = detail::parseDocument(*source, file.string());
  if (!doc)
  {
    return std::nullopt;
  }
  return extract(*doc, caseInsensitive);
}

/// \brief Copy the translations of \p source into \p target.
///
/// The extracted mapping is written to \p mappingOutput when given.
inline InjectOutcome extractAndInject(const std::filesystem::path &source,
                                      const std::filesystem::path &target,
                                      const std::optional<OutputTarget> &output = std::nullopt,
                                      const std::optional<std::filesystem::path> &mappingOutput = std::nullopt,
                                      const InjectOptions &options = InjectOptions{})
{
  auto extracted = extractFile(source, options.caseInsensitive);
  if (!extracted)
  {
    InjectOutcome outcome;
    std::error_code ec;
    outcome.error = std::filesystem::exists(source, ec) ? kParseError : kFileNotFound;
    return outcome;
  }
  if (mappingOutput && !saveMappingFile(*mappingOutput, extracted->mapping))
  {
    SVGTR_LOG_WARN("Could not save extracted mapping to " << mappingOutput->string());
  }
  SVGTR_LOG_INFO("Extracted " << extracted->mapping.translations.size() << " translations from "
                              << source.string());
  return injectFile(target, extracted->mapping, options, output);
}

} // namespace translate
} // namespace svgtr
