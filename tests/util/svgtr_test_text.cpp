// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of svgtr, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <filesystem>
#include <string>

using namespace svgtr::util;

TEST_CASE("trim strips Unicode whitespace", "[util][text]")
{
  REQUIRE(trim("  hello world \t\n") == "hello world");
  REQUIRE(trim("\xC2\xA0no-break\xE3\x80\x80") == "no-break");
  REQUIRE(trim(" \n\t ") == "");
  REQUIRE(trim("") == "");
  REQUIRE(trim("\xC3\xA9t\xC3\xA9") == "\xC3\xA9t\xC3\xA9");
}

TEST_CASE("foldCase lowers beyond ASCII", "[util][text]")
{
  REQUIRE(foldCase("Hello WORLD") == "hello world");
  REQUIRE(foldCase("\xC3\x89T\xC3\x89") == "\xC3\xA9t\xC3\xA9");           // ÉTÉ
  REQUIRE(foldCase("\xD0\x9F\xD0\xA0\xD0\x98") == "\xD0\xBF\xD1\x80\xD0\xB8"); // ПРИ
  REQUIRE(foldCase("\xCE\xA3") == "\xCF\x83");                             // Σ
  REQUIRE(foldCase("\xE4\xB8\xAD") == "\xE4\xB8\xAD");
  REQUIRE(foldCase("\xD4\xB1") == "\xD5\xA1");         // Armenian Ա
  REQUIRE(foldCase("\xE1\x82\xA0") == "\xE2\xB4\x80"); // Georgian Ⴀ
  REQUIRE(foldCase("\xC7\x84") == "\xC7\x86");         // Ǆ
  REQUIRE(foldCase("\xEF\xBC\xA1") == "\xEF\xBD\x81"); // full-width Ａ
  REQUIRE(foldCase("bad\xFF"
                   "byte") == "bad\xFF"
                              "byte");
}

TEST_CASE("normalizeText collapses whitespace runs", "[util][text]")
{
  REQUIRE(normalizeText("  Population\n   in\t2020  ") == "Population in 2020");
  REQUIRE(normalizeText("a\xC2\xA0\xC2\xA0"
                        "b") == "a b");
  REQUIRE(normalizeText("Hello World", true) == "hello world");
  REQUIRE(normalizeText("Hello World", false) == "Hello World");
  REQUIRE(normalizeText("   ") == "");
}

TEST_CASE("Year suffix helpers", "[util][text][titles]")
{
  REQUIRE(endsWithYear("COVID-19 cases 2020"));
  REQUIRE(endsWithYear("2020"));
  REQUIRE_FALSE(endsWithYear("COVID-19"));
  REQUIRE_FALSE(endsWithYear("202"));
  REQUIRE(yearSuffix("Population 1990") == "1990");
  REQUIRE(yearSuffix("Population").empty());
  REQUIRE(stripYear("Population 1990") == "Population ");
  REQUIRE(stripYear("Population") == "Population");
}

TEST_CASE("readFile and writeFileAtomic", "[util][filesystem]")
{
  svgtr::test::TempDirManager dir;

  SECTION("Missing file")
  {
    REQUIRE_FALSE(readFile(dir.filePath("absent.svg")).has_value());
  }

  SECTION("Write creates parent directories and replaces content")
  {
    auto target = dir.filePath("nested/deeper/out.svg");
    REQUIRE(writeFileAtomic(target, "<svg/>"));
    REQUIRE(readFile(target) == std::string("<svg/>"));

    REQUIRE(writeFileAtomic(target, "<svg></svg>"));
    REQUIRE(readFile(target) == std::string("<svg></svg>"));

    std::size_t entries = 0;
    for (const auto &entry : std::filesystem::directory_iterator(target.parent_path()))
    {
      (void)entry;
      ++entries;
    }
    REQUIRE(entries == 1);
  }

  SECTION("Binary content survives")
  {
    std::string data("a\0b\r\n", 5);
    auto target = dir.filePath("bin.dat");
    REQUIRE(writeFileAtomic(target, data));
    REQUIRE(readFile(target) == data);
  }
}

TEST_CASE("resolveOutputPath precedence", "[util][filesystem]")
{
  svgtr::test::TempDirManager dir;
  auto source = dir.filePath("src/chart.svg");

  REQUIRE(resolveOutputPath(source) == source);
  REQUIRE(resolveOutputPath(source, {}, dir.filePath("out")) == dir.filePath("out/chart.svg"));
  REQUIRE(std::filesystem::is_directory(dir.filePath("out")));
  REQUIRE(resolveOutputPath(source, dir.filePath("x/explicit.svg"), dir.filePath("out")) ==
          dir.filePath("x/explicit.svg"));
}
