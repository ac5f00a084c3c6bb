// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of svgtr, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace toml = svgtr::parsers::toml;
using svgtr::core::ConfigLoader;

TEST_CASE("TOML tables flatten to dotted keys", "[toml]")
{
  auto table = toml::parse(R"(
# svgtr configuration
[svgtr.log]
level = "debug"   # inline comment
file = '/var/log/svgtr.log'

[svgtr.batch]
workers = 4
ratio = 0.5
enabled = true
)");

  REQUIRE(table.size() == 5);
  REQUIRE(table.hasTable("svgtr.log"));
  REQUIRE(table.hasTable("svgtr"));
  REQUIRE_FALSE(table.hasTable("svgtr.lo"));
  REQUIRE(table.get<std::string>("svgtr.log.level") == std::string("debug"));
  REQUIRE(table.get<std::string>("svgtr.log.file") == std::string("/var/log/svgtr.log"));
  REQUIRE(table.get<int64_t>("svgtr.batch.workers") == int64_t{4});
  REQUIRE(table.get<double>("svgtr.batch.ratio") == Approx(0.5));
  REQUIRE(table.get<bool>("svgtr.batch.enabled") == true);

  SECTION("Integers widen to double, other mismatches are absent")
  {
    REQUIRE(table.get<double>("svgtr.batch.workers") == Approx(4.0));
    REQUIRE_FALSE(table.get<int64_t>("svgtr.log.level").has_value());
    REQUIRE_FALSE(table.get<std::string>("svgtr.missing").has_value());
  }
}

TEST_CASE("TOML arrays and escapes", "[toml]")
{
  auto table = toml::parse("files = [\n  \"a.json\",\n  'b.json', # second\n]\n"
                           "quoted = \"tab\\there\"\n"
                           "big = 1_000\n");

  const toml::value *files = table.find("files");
  REQUIRE(files != nullptr);
  const auto &arr = std::get<toml::array>(*files);
  REQUIRE(arr.size() == 2);
  REQUIRE(std::get<std::string>(arr[1]) == "b.json");
  REQUIRE(table.get<std::string>("quoted") == std::string("tab\there"));
  REQUIRE(table.get<int64_t>("big") == int64_t{1000});
}

TEST_CASE("TOML errors report their line", "[toml][errors]")
{
  SECTION("Invalid value")
  {
    try
    {
      toml::parse("a = 1\nb = 2\nc = ?\n");
      FAIL("expected a parse error");
    }
    catch (const toml::parse_error &e)
    {
      REQUIRE(e.line() == 3);
    }
  }

  SECTION("Duplicate keys")
  {
    REQUIRE_THROWS_AS(toml::parse("[svgtr]\nworkers = 1\nworkers = 2\n"), toml::parse_error);
    REQUIRE_THROWS_AS(toml::parse("svgtr.workers = 1\n[svgtr]\nworkers = 2\n"),
                      toml::parse_error);
  }

  SECTION("Unsupported constructs")
  {
    REQUIRE_THROWS_AS(toml::parse("[[svgtr]]\n"), toml::parse_error);
    REQUIRE_THROWS_AS(toml::parse("a = \"unterminated\n"), toml::parse_error);
    REQUIRE_THROWS_AS(toml::parse("a = 1 2\n"), toml::parse_error);
  }
}

TEST_CASE("ConfigLoader reads typed settings", "[config]")
{
  svgtr::test::TempDirManager dir;
  auto path = dir.write("svgtr.toml", R"(
[svgtr.mapping]
files = ["one.json", "two.json"]
caseInsensitive = false

[svgtr.batch]
workers = 3
outputDir = "out"
)");

  ConfigLoader loader(path.string());
  REQUIRE(loader.filename() == path.string());
  REQUIRE(loader.getInt("svgtr.batch.workers") == int64_t{3});
  REQUIRE(loader.getBool("svgtr.mapping.caseInsensitive") == false);
  REQUIRE(loader.getString("svgtr.batch.outputDir") == std::string("out"));
  REQUIRE(loader.getStringArray("svgtr.mapping.files") ==
          std::vector<std::string>{"one.json", "two.json"});
  REQUIRE_FALSE(loader.getString("svgtr.log.level").has_value());

  SECTION("A single string is a one-element array")
  {
    REQUIRE(loader.getStringArray("svgtr.batch.outputDir") == std::vector<std::string>{"out"});
  }

  SECTION("Non-string array elements are rejected")
  {
    dir.write("svgtr.toml", "[svgtr.mapping]\nfiles = [\"a.json\", 2]\n");
    REQUIRE(loader.reload());
    REQUIRE_THROWS_AS(loader.getStringArray("svgtr.mapping.files"), std::runtime_error);
  }

  SECTION("A failed reload clears the table and keeps the reason")
  {
    dir.write("svgtr.toml", "workers = \n");
    REQUIRE_FALSE(loader.reload());
    REQUIRE(loader.table().empty());
    REQUIRE_FALSE(loader.lastError().empty());
    REQUIRE_THROWS_AS(loader.load(), std::runtime_error);
  }
}

TEST_CASE("ConfigLoader rejects a missing file", "[config][errors]")
{
  svgtr::test::TempDirManager dir;
  REQUIRE_THROWS_AS(ConfigLoader(dir.filePath("absent.toml").string()), std::runtime_error);
}
