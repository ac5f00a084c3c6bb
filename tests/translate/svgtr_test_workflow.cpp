// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of svgtr, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <atomic>
#include <filesystem>
#include <string>
#include <vector>

namespace tr = svgtr::translate;
using svgtr::test::bundleOf;
using svgtr::test::readAll;
using svgtr::test::TempDirManager;

namespace
{
  const std::string kPlain = "<svg><text>Hello</text></svg>";
  const std::string kTranslated =
    "<svg xmlns=\"http://www.w3.org/2000/svg\"><switch>"
    "<text id=\"trsvg2-fr\" systemLanguage=\"fr\"><tspan id=\"trsvg1-fr\">Bonjour</tspan></text>"
    "<text id=\"trsvg2\"><tspan id=\"trsvg1\">Hello</tspan></text></switch></svg>";
  const std::string kNested = "<svg><text><tspan><tspan>Hello</tspan></tspan></text></svg>";
  const std::string kNoText = "<svg><rect/></svg>";

  tr::MappingBundle helloBundle() { return bundleOf(R"({"Hello": {"fr": "Bonjour"}})"); }
} // namespace

TEST_CASE("injectDocument outcomes", "[workflow]")
{
  SECTION("Translated output")
  {
    auto outcome = tr::injectDocument(kPlain, helloBundle());
    REQUIRE(outcome.ok());
    REQUIRE(outcome.changed);
    REQUIRE(outcome.output == kTranslated);
    REQUIRE(outcome.stats.inserted == 1);
  }

  SECTION("Already translated documents are unchanged")
  {
    auto outcome = tr::injectDocument(kTranslated, helloBundle());
    REQUIRE(outcome.ok());
    REQUIRE_FALSE(outcome.changed);
    REQUIRE(outcome.stats.skipped == 1);
  }

  SECTION("Errors")
  {
    REQUIRE(tr::injectDocument(kPlain, tr::MappingBundle{}).error == std::string(tr::kNoMappings));
    REQUIRE(tr::injectDocument("<svg>", helloBundle()).error == std::string(tr::kParseError));

    auto nested = tr::injectDocument(kNested, helloBundle());
    REQUIRE(nested.error == std::string("nested-tspans-not-supported"));
    REQUIRE(nested.stats.structuralErrors == 1);
    REQUIRE(nested.output.empty());
  }
}

TEST_CASE("injectFile writes only changed documents", "[workflow][files]")
{
  TempDirManager dir;
  auto file = dir.write("chart.svg", kPlain);

  SECTION("Without a target nothing is written")
  {
    auto outcome = tr::injectFile(file, helloBundle());
    REQUIRE(outcome.changed);
    REQUIRE_FALSE(outcome.savedTo.has_value());
    REQUIRE(readAll(file) == kPlain);
  }

  SECTION("Default target overwrites the source")
  {
    auto outcome = tr::injectFile(file, helloBundle(), {}, tr::OutputTarget{});
    REQUIRE(outcome.savedTo == file);
    REQUIRE(readAll(file) == kTranslated);

    auto again = tr::injectFile(file, helloBundle(), {}, tr::OutputTarget{});
    REQUIRE(again.ok());
    REQUIRE_FALSE(again.changed);
    REQUIRE_FALSE(again.savedTo.has_value());
  }

  SECTION("Output directory")
  {
    tr::OutputTarget target;
    target.directory = dir.filePath("out");
    auto outcome = tr::injectFile(file, helloBundle(), {}, target);
    REQUIRE(outcome.savedTo == dir.filePath("out/chart.svg"));
    REQUIRE(readAll(dir.filePath("out/chart.svg")) == kTranslated);
    REQUIRE(readAll(file) == kPlain);
  }

  SECTION("Missing file")
  {
    auto outcome = tr::injectFile(dir.filePath("absent.svg"), helloBundle());
    REQUIRE(outcome.error == std::string(tr::kFileNotFound));
  }
}

TEST_CASE("prepareFile normalizes in place", "[workflow][files]")
{
  TempDirManager dir;
  auto file = dir.write("chart.svg", kPlain);

  auto outcome = tr::prepareFile(file, tr::OutputTarget{});
  REQUIRE(outcome.ok());
  REQUIRE(outcome.savedTo == file);
  REQUIRE(readAll(file) ==
          "<svg xmlns=\"http://www.w3.org/2000/svg\"><switch><text id=\"trsvg2\">"
          "<tspan id=\"trsvg1\">Hello</tspan></text></switch></svg>");

  auto again = tr::prepareFile(file, tr::OutputTarget{});
  REQUIRE_FALSE(again.changed);
  REQUIRE_FALSE(again.savedTo.has_value());

  auto broken = dir.write("broken.svg", kNested);
  REQUIRE(tr::prepareFile(broken, tr::OutputTarget{}).error ==
          std::string("nested-tspans-not-supported"));
  REQUIRE(readAll(broken) == kNested);
}

TEST_CASE("extractAndInject copies translations between documents", "[workflow][files]")
{
  TempDirManager dir;
  auto source = dir.write("source.svg", kTranslated);
  auto target = dir.write("target.svg", kPlain);
  auto mappingFile = dir.filePath("mapping/out.json");

  auto extracted = tr::extractFile(source);
  REQUIRE(extracted.has_value());
  REQUIRE(extracted->mapping.translations.find("hello")->at("fr") == "Bonjour");

  auto outcome = tr::extractAndInject(source, target, tr::OutputTarget{}, mappingFile);
  REQUIRE(outcome.ok());
  REQUIRE(readAll(target) == kTranslated);
  REQUIRE(tr::loadMappingFile(mappingFile).translations == extracted->mapping.translations);

  SECTION("Unreadable sources")
  {
    REQUIRE_FALSE(tr::extractFile(dir.filePath("absent.svg")).has_value());
    REQUIRE(tr::extractAndInject(dir.filePath("absent.svg"), target).error ==
            std::string(tr::kFileNotFound));
    auto bad = dir.write("bad.svg", "<svg");
    REQUIRE(tr::extractAndInject(bad, target).error == std::string(tr::kParseError));
  }
}

TEST_CASE("Batches aggregate per document outcomes", "[workflow][batch]")
{
  TempDirManager dir;
  std::vector<std::filesystem::path> files = {
    dir.write("good.svg", kPlain),
    dir.write("nested.svg", kNested),
    dir.write("plain.svg", kNoText),
    dir.filePath("missing.svg"),
  };

  for (std::size_t workers : {std::size_t{1}, std::size_t{3}})
  {
    DYNAMIC_SECTION("workers = " << workers)
    {
      tr::BatchOptions options;
      options.outputDir = dir.filePath("out");
      options.workers = workers;
      auto result = tr::runBatch(files, helloBundle(), options);

      REQUIRE(result.saved == 1);
      REQUIRE(result.notSaved == 2);
      REQUIRE(result.nestedErrors == 1);
      REQUIRE(result.noChanges == 1);
      REQUIRE(result.cancelled == 0);
      REQUIRE(result.hasFailures());
      REQUIRE(result.totals.inserted == 1);
      REQUIRE(result.totals.structuralErrors == 1);
      REQUIRE(result.files.size() == 4);
      REQUIRE(result.files.at("missing.svg").error == std::string(tr::kFileNotFound));
      REQUIRE(readAll(dir.filePath("out/good.svg")) == kTranslated);
      REQUIRE_FALSE(std::filesystem::exists(dir.filePath("out/plain.svg")));

      auto json = result.toJson();
      REQUIRE(json.find("saved")->getInt() == 1);
      REQUIRE(json.find("files")->find("nested.svg")->find("error")->getString() ==
              "nested-tspans-not-supported");
      REQUIRE(json.find("totals")->find("inserted_translations")->getInt() == 1);
    }
  }
}

TEST_CASE("Batch output file and name collisions", "[workflow][batch]")
{
  TempDirManager dir;
  auto first = dir.write("a/doc.svg", kPlain);
  auto second = dir.write("b/doc.svg", kPlain);

  SECTION("An output file applies to a single document")
  {
    tr::BatchOptions options;
    options.outputFile = dir.filePath("single.svg");
    auto result = tr::runBatch({first}, helloBundle(), options);
    REQUIRE(result.saved == 1);
    REQUIRE(result.files.at("doc.svg").savedTo == dir.filePath("single.svg"));
    REQUIRE(readAll(first) == kPlain);
  }

  SECTION("Documents sharing a file name are kept apart")
  {
    tr::BatchOptions options;
    options.outputFile = dir.filePath("ignored.svg");
    auto result = tr::runBatch({first, second}, helloBundle(), options);
    REQUIRE(result.saved == 2);
    REQUIRE_FALSE(std::filesystem::exists(dir.filePath("ignored.svg")));
    REQUIRE(result.files.count("doc.svg") == 1);
    REQUIRE(result.files.count(second.string()) == 1);
    REQUIRE(readAll(second) == kTranslated);
  }
}

TEST_CASE("Cancelled batches start no documents", "[workflow][batch]")
{
  TempDirManager dir;
  std::vector<std::filesystem::path> files = {dir.write("one.svg", kPlain),
                                              dir.write("two.svg", kPlain)};
  std::atomic<bool> cancel{true};
  tr::BatchOptions options;
  options.cancel = &cancel;
  options.workers = 2;

  auto result = tr::runBatch(files, helloBundle(), options);
  REQUIRE(result.cancelled == 2);
  REQUIRE(result.saved == 0);
  REQUIRE(result.files.empty());
  REQUIRE_FALSE(result.hasFailures());
  REQUIRE(readAll(files[0]) == kPlain);
}

TEST_CASE("Batch results combine", "[workflow][batch]")
{
  tr::BatchResult a;
  tr::InjectOutcome saved;
  saved.savedTo = std::filesystem::path("/tmp/x.svg");
  saved.stats.inserted = 2;
  a.record("x.svg", saved);

  tr::BatchResult b;
  tr::InjectOutcome failed;
  failed.error = std::string("contains-tref");
  b.record("y.svg", failed);

  a += b;
  REQUIRE(a.saved == 1);
  REQUIRE(a.notSaved == 1);
  REQUIRE(a.nestedErrors == 0);
  REQUIRE(a.files.size() == 2);
  REQUIRE(a.totals.inserted == 2);
}
