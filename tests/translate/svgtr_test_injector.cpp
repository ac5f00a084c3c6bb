// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of svgtr, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <set>
#include <string>
#include <variant>

namespace tr = svgtr::translate;
using svgtr::test::bundleOf;
using svgtr::test::parseXml;

namespace
{
  const std::string kSvg = "<svg xmlns=\"http://www.w3.org/2000/svg\">";

  tr::InjectResult injectOk(const std::string &svg, const tr::MappingBundle &bundle,
                            const tr::InjectOptions &options = tr::InjectOptions{})
  {
    auto result = tr::inject(parseXml(svg), bundle, options);
    REQUIRE_FALSE(tr::isError(result));
    return std::move(std::get<tr::InjectResult>(result));
  }
} // namespace

TEST_CASE("A translation is added before the fallback", "[injector]")
{
  auto result = injectOk("<svg><switch><text>lang none</text></switch></svg>",
                         bundleOf(R"({"new": {"lang none": {"la": "lang la"}}})"));

  REQUIRE(result.document.serialize() ==
          kSvg +
            "<switch><text id=\"trsvg2-la\" systemLanguage=\"la\"><tspan id=\"trsvg1-la\">lang la</tspan></text>"
            "<text id=\"trsvg2\"><tspan id=\"trsvg1\">lang none</tspan></text></switch></svg>");
  REQUIRE(result.stats.processedSwitches == 1);
  REQUIRE(result.stats.inserted == 1);
  REQUIRE(result.stats.newLanguages == 1);
  REQUIRE(result.stats.updated == 0);
  REQUIRE(result.stats.skipped == 0);
}

TEST_CASE("Existing translations are skipped or overwritten", "[injector]")
{
  const std::string input = "<svg><switch><text systemLanguage=\"la\"><tspan>lang la</tspan></text>"
                            "<text>lang none</text></switch></svg>";
  auto bundle = bundleOf(R"json({"new": {"lang none": {"la": "lang la (new)"}}})json");

  SECTION("Skipped by default")
  {
    auto result = injectOk(input, bundle);
    REQUIRE(result.stats.skipped == 1);
    REQUIRE(result.stats.inserted == 0);
    REQUIRE(result.stats.newLanguages == 0);
    REQUIRE(result.document.serialize().find("lang la (new)") == std::string::npos);
  }

  SECTION("Rewritten with overwrite")
  {
    tr::InjectOptions options;
    options.overwrite = true;
    auto result = injectOk(input, bundle, options);
    REQUIRE(result.stats.updated == 1);
    REQUIRE(result.document.serialize() ==
            kSvg +
              "<switch><text systemLanguage=\"la\" id=\"trsvg3\"><tspan id=\"trsvg1\">lang la (new)</tspan></text>"
              "<text id=\"trsvg4\"><tspan id=\"trsvg2\">lang none</tspan></text></switch></svg>");
  }
}

TEST_CASE("Matching honors the case option", "[injector]")
{
  const std::string input = "<svg><text>hello   WORLD</text></svg>";
  auto bundle = bundleOf(R"({"Hello World": {"fr": "Bonjour le monde"}})");

  SECTION("Case-insensitive by default")
  {
    auto result = injectOk(input, bundle);
    REQUIRE(result.stats.inserted == 1);
    REQUIRE(result.document.serialize().find(">Bonjour le monde</tspan>") != std::string::npos);
  }

  SECTION("Case-sensitive")
  {
    tr::InjectOptions options;
    options.caseInsensitive = false;
    auto result = injectOk(input, bundle, options);
    REQUIRE(result.stats == tr::InjectionStats{});
  }
}

TEST_CASE("Case-insensitive matching covers every script", "[injector]")
{
  // Armenian capital Ա in the document, small ա in the mapping.
  auto result = injectOk("<svg><text>\xD4\xB1\xD5\xA2</text></svg>",
                         bundleOf("{\"\xD5\xA1\xD5\xA2\": {\"hy\": \"ok\"}}"));
  REQUIRE(result.stats.inserted == 1);
}

TEST_CASE("Derived ids avoid ids already in the document", "[injector][ids]")
{
  auto result = injectOk("<svg><g id=\"trsvg1-fr\"/><text>Hello</text></svg>",
                         bundleOf(R"({"Hello": {"fr": "Bonjour"}})"));
  std::string out = result.document.serialize();
  REQUIRE(out.find("<g id=\"trsvg1-fr\"/>") != std::string::npos);
  REQUIRE(out.find("<text id=\"trsvg2-fr\" systemLanguage=\"fr\"><tspan id=\"trsvg1-fr-2\">Bonjour</tspan>") !=
          std::string::npos);
  REQUIRE(svgtr::test::duplicateIds(*result.document.root()).empty());
}

TEST_CASE("Injected documents keep every id unique", "[injector][ids]")
{
  auto result = injectOk("<svg><text systemLanguage=\"fr, de\"><tspan>Un</tspan> <tspan>deux</tspan></text>"
                         "<switch><text><tspan>One</tspan> <tspan>two</tspan></text></switch>"
                         "<text>Three</text></svg>",
                         bundleOf(R"({"One": {"es": "Uno", "it": "Uno"}, "two": {"es": "dos", "it": "due"},
                                      "Three": {"es": "Tres"}})"));
  REQUIRE(result.stats.inserted == 3);
  REQUIRE(svgtr::test::duplicateIds(*result.document.root()).empty());

  std::string out = result.document.serialize();
  REQUIRE(out.find(">Uno</tspan> <tspan") != std::string::npos);
  REQUIRE(out.find(">due</tspan>") != std::string::npos);
  REQUIRE(out.find(">Tres</tspan>") != std::string::npos);
}

TEST_CASE("Every span of a text needs a translation", "[injector]")
{
  auto result = injectOk("<svg><text><tspan>Deaths</tspan> <tspan>per day</tspan></text></svg>",
                         bundleOf(R"({"Deaths": {"fr": "Décès", "de": "Tote"},
                                      "per day": {"fr": "par jour"}})"));
  REQUIRE(result.stats.inserted == 1);
  std::string out = result.document.serialize();
  REQUIRE(out.find("systemLanguage=\"fr\"") != std::string::npos);
  REQUIRE(out.find("systemLanguage=\"de\"") == std::string::npos);
  REQUIRE(out.find(">D\xC3\xA9" "c\xC3\xA8s</tspan> <tspan id=\"trsvg2-fr\">par jour<") !=
          std::string::npos);
}

TEST_CASE("Titles translate any year", "[injector][titles]")
{
  auto result = injectOk("<svg><text>Population 1990</text></svg>",
                         bundleOf(R"({"title": {"Population": {"fr": "Population", "de": "Bevölkerung"}}})"));
  REQUIRE(result.stats.inserted == 2);
  std::string out = result.document.serialize();
  REQUIRE(out.find(">Bev\xC3\xB6lkerung 1990</tspan>") != std::string::npos);
  REQUIRE(out.find("systemLanguage=\"fr\"><tspan id=\"trsvg1-fr\">Population 1990<") !=
          std::string::npos);
}

TEST_CASE("Language tags from the mapping are canonicalized", "[injector]")
{
  auto result = injectOk("<svg><text>Hi</text></svg>", bundleOf(R"({"Hi": {"pt_br": "Oi"}})"));
  REQUIRE(result.document.serialize().find("systemLanguage=\"pt-BR\"") != std::string::npos);
}

TEST_CASE("New languages count only languages the document lacked", "[injector]")
{
  auto result = injectOk("<svg><switch><text systemLanguage=\"de\">Eins</text><text>One</text></switch>"
                         "<text>Two</text></svg>",
                         bundleOf(R"({"One": {"de": "Eins"}, "Two": {"de": "Zwei", "es": "Dos"}})"));
  REQUIRE(result.stats.skipped == 1);
  REQUIRE(result.stats.inserted == 2);
  REQUIRE(result.stats.newLanguages == 1);
  REQUIRE(result.stats.processedSwitches == 2);
}

TEST_CASE("Injection keeps the switch ordered", "[injector]")
{
  auto result = injectOk("<svg><switch><text systemLanguage=\"fr\">Un</text><text>One</text></switch></svg>",
                         bundleOf(R"({"One": {"ar": "Wahid"}})"));
  auto sw = result.document.root()->descendants(tr::kSvgNamespace, tr::kSwitch).front();
  auto texts = tr::textBlocksOf(*sw);
  REQUIRE(texts.size() == 3);
  REQUIRE(tr::languageOf(*texts[0]) == "fr");
  REQUIRE(tr::languageOf(*texts[1]) == "ar");
  REQUIRE(tr::isFallback(*texts[2]));
}

TEST_CASE("Injection reports structural errors", "[injector][errors]")
{
  auto result = tr::inject(parseXml("<svg><text>Cost $1</text></svg>"),
                           bundleOf(R"({"Cost $1": {"fr": "Prix 1 $"}})"));
  REQUIRE(tr::isError(result));
  REQUIRE(std::get<tr::StructuralError>(result).code() ==
          tr::StructuralErrorCode::TextContainsDollar);
}

TEST_CASE("Injection stats", "[injector][stats]")
{
  tr::InjectionStats a;
  a.inserted = 2;
  a.processedSwitches = 1;
  tr::InjectionStats b;
  b.inserted = 1;
  b.skipped = 3;
  a += b;
  REQUIRE(a.inserted == 3);
  REQUIRE(a.skipped == 3);
  REQUIRE(a.toJson().dump() ==
          R"({"inserted_translations":3,"new_languages":0,"processed_switches":1,)"
          R"("skipped_translations":3,"structural_errors":0,"updated_translations":0})");
}

TEST_CASE("Unique id generation", "[injector][ids]")
{
  std::set<std::string, std::less<>> used;
  REQUIRE(tr::generateUniqueId("", "ar", used) == "-ar");
  REQUIRE(tr::generateUniqueId("id", "ar", used) == "id-ar");

  used.insert("id-ar");
  for (int n = 2; n < 100; ++n)
  {
    used.insert("id-ar-" + std::to_string(n));
  }
  REQUIRE(tr::generateUniqueId("id", "ar", used) == "id-ar-100");

  SECTION("Allocator")
  {
    auto doc = parseXml("<svg><g id=\"trsvg4\"/><g id=\"trsvg5\"/><g id=\"x-fr\"/></svg>");
    tr::IdAllocator ids(*doc.root());
    REQUIRE(ids.maxReserved() == 5);
    REQUIRE(ids.next() == "trsvg6");
    REQUIRE(ids.derive("x", "fr") == "x-fr-2");
    REQUIRE(ids.contains("x-fr-2"));
    REQUIRE(tr::reservedIdNumber("trsvg12") == std::uint64_t{12});
    REQUIRE_FALSE(tr::reservedIdNumber("trsvg12-fr").has_value());
    REQUIRE(tr::embeddedIdNumber("trsvg12-fr") == std::uint64_t{12});
    REQUIRE_FALSE(tr::reservedIdNumber("trsvg1234567890123456").has_value());
  }
}
