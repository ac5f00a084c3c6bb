// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of svgtr, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <string>
#include <vector>

namespace xml = svgtr::parsers::xml;

TEST_CASE("Tokenizer reports every token in order", "[xml][tokenizer]")
{
  const std::string input = "<?xml version=\"1.0\"?>\n<svg a='1'><!-- c --><g/>x &amp; y</svg>";
  xml::Tokenizer t(input);

  std::vector<xml::TokenKind> kinds;
  while (t.next())
  {
    kinds.push_back(t.current().kind);
  }
  REQUIRE(t.error() == nullptr);
  REQUIRE(kinds == std::vector<xml::TokenKind>{xml::TokenKind::XmlDecl, xml::TokenKind::Text,
                                               xml::TokenKind::StartElement,
                                               xml::TokenKind::Comment,
                                               xml::TokenKind::EmptyElement, xml::TokenKind::Text,
                                               xml::TokenKind::EndElement});
}

TEST_CASE("Tokenizer start element attributes and position", "[xml][tokenizer]")
{
  xml::Tokenizer t("\n  <text x=\"10\" y='20'/>");
  REQUIRE(t.next());
  REQUIRE(t.current().kind == xml::TokenKind::Text);
  REQUIRE(t.next());
  const auto &tok = t.current();
  REQUIRE(tok.kind == xml::TokenKind::EmptyElement);
  REQUIRE(tok.name == "text");
  REQUIRE(tok.line == 2);
  REQUIRE(tok.column == 3);
  REQUIRE(tok.attributes.size() == 2);
  REQUIRE(tok.attributes[1].name == "y");
  REQUIRE(tok.attributes[1].value == "20");
}

TEST_CASE("Tokenizer errors", "[xml][tokenizer][errors]")
{
  auto errorOf = [](const std::string &input)
  {
    xml::Tokenizer t(input);
    while (t.next())
    {
    }
    return t.error() ? t.error()->message : std::string{};
  };

  REQUIRE(errorOf("<a></b>").find("mismatched end tag") != std::string::npos);
  REQUIRE(errorOf("<a x='1' x='2'/>") == "duplicate attribute");
  REQUIRE(errorOf("<a><!-- open") == "unterminated comment");
  REQUIRE(errorOf("<a>").find("unclosed elements") != std::string::npos);
  REQUIRE(errorOf("<a/><?xml version='1.0'?>").find("XML declaration") != std::string::npos);
  REQUIRE(errorOf("<a x=1/>").find("attribute value") != std::string::npos);
}

TEST_CASE("Entity decoding", "[xml][entities]")
{
  std::string out;
  REQUIRE(xml::Tokenizer::decodeEntities("a &lt;b&gt; &amp; &quot;c&apos; &#65;&#x42;", out));
  REQUIRE(out == "a <b> & \"c' AB");

  std::set<std::string> unknown;
  REQUIRE(xml::Tokenizer::decodeEntities("&ns_svg; &#x263A;", out, nullptr, &unknown));
  REQUIRE(out == "&ns_svg; \xE2\x98\xBA");
  REQUIRE(unknown.count("ns_svg") == 1);

  xml::Error err;
  REQUIRE_FALSE(xml::Tokenizer::decodeEntities("a & b", out, &err));
  REQUIRE_FALSE(xml::Tokenizer::decodeEntities("&#0;", out, &err));
  REQUIRE(err.message == "invalid character reference");
}

TEST_CASE("Document builds a mutable tree", "[xml][dom]")
{
  auto doc = svgtr::test::parseXml(
    "<svg xmlns=\"http://www.w3.org/2000/svg\" xmlns:x=\"urn:x\">"
    "<switch><text systemLanguage=\"fr\">Bonjour <tspan>le</tspan> monde</text>"
    "<x:text>other</x:text></switch></svg>");

  xml::Node *root = doc.root();
  REQUIRE(root != nullptr);
  REQUIRE(root->name() == "svg");
  REQUIRE(root->namespaceUri() == "http://www.w3.org/2000/svg");

  auto texts = root->descendants("http://www.w3.org/2000/svg", "text");
  REQUIRE(texts.size() == 1);
  REQUIRE(texts[0]->getAttribute("systemLanguage") == "fr");
  REQUIRE(texts[0]->textContent() == "Bonjour le monde");
  REQUIRE(texts[0]->childCount() == 3);
  REQUIRE(texts[0]->parent()->localName() == "switch");

  auto other = root->descendants("urn:x", "text");
  REQUIRE(other.size() == 1);
  REQUIRE(other[0]->prefix() == "x");
  REQUIRE(other[0]->localName() == "text");

  SECTION("Attribute edits keep their position")
  {
    xml::Node *text = texts[0];
    text->setAttribute("id", "t1");
    text->setAttribute("systemLanguage", "de");
    REQUIRE(text->attributes().size() == 2);
    REQUIRE(text->attributes()[0].name == "systemLanguage");
    REQUIRE(text->attributes()[0].value == "de");
    REQUIRE(text->removeAttribute("id"));
    REQUIRE_FALSE(text->removeAttribute("id"));
    REQUIRE(text->findAttribute("id") == nullptr);
  }

  SECTION("Insert, detach and clone")
  {
    xml::Node *sw = texts[0]->parent();
    auto copy = texts[0]->clone();
    REQUIRE(copy->parent() == nullptr);
    copy->setAttribute("systemLanguage", "es");
    xml::Node *inserted = sw->insertChild(0, std::move(copy));
    REQUIRE(sw->indexOf(inserted) == 0);
    REQUIRE(sw->elementChildren().size() == 3);

    auto detached = sw->detach(texts[0]);
    REQUIRE(detached != nullptr);
    REQUIRE(detached->parent() == nullptr);
    REQUIRE(sw->indexOf(texts[0]) == xml::Node::npos);
    REQUIRE(sw->detach(texts[0]) == nullptr);
  }
}

TEST_CASE("Serialization round trips markup", "[xml][serialize]")
{
  const std::string input =
    "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
    "<!DOCTYPE svg PUBLIC \"-//W3C//DTD SVG 1.1//EN\" [ <!ENTITY ns_svg \"http://www.w3.org/2000/svg\"> ]>\n"
    "<!-- generator -->\n"
    "<svg xmlns=\"&ns_svg;\" width='10'>\n"
    "  <g><text>a &lt; b &amp; c</text><rect/><path></path></g>\n"
    "  <style><![CDATA[.a{fill:red}]]></style>\n"
    "  <?pi data?>\n"
    "</svg>\n";

  auto doc = svgtr::test::parseXml(input);
  REQUIRE(doc.preservedEntities().count("ns_svg") == 1);

  std::string out = doc.serialize();
  REQUIRE(out == std::string("<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
                             "<!DOCTYPE svg PUBLIC \"-//W3C//DTD SVG 1.1//EN\" [ <!ENTITY ns_svg "
                             "\"http://www.w3.org/2000/svg\"> ]>\n"
                             "<!-- generator -->\n"
                             "<svg xmlns=\"&ns_svg;\" width=\"10\">\n"
                             "  <g><text>a &lt; b &amp; c</text><rect/><path></path></g>\n"
                             "  <style><![CDATA[.a{fill:red}]]></style>\n"
                             "  <?pi data?>\n"
                             "</svg>\n"));

  SECTION("Serializing a clone gives the same markup")
  {
    REQUIRE(doc.clone().serialize() == out);
  }
}

TEST_CASE("Byte order mark is kept", "[xml][serialize]")
{
  const std::string input = "\xEF\xBB\xBF<?xml version=\"1.0\"?><svg/>";
  auto doc = svgtr::test::parseXml(input);
  REQUIRE(doc.serialize() == input);
}

TEST_CASE("Attribute values are escaped", "[xml][serialize]")
{
  auto doc = svgtr::test::parseXml("<svg/>");
  doc.root()->setAttribute("title", "say \"hi\" & <go>");
  doc.root()->appendChild(xml::Node::makeText("1 < 2 && ]]>"));
  REQUIRE(doc.serialize() ==
          "<svg title=\"say &quot;hi&quot; &amp; &lt;go>\">1 &lt; 2 &amp;&amp; ]]&gt;</svg>");
}

TEST_CASE("Document parse errors", "[xml][errors]")
{
  auto failure = [](const std::string &input)
  {
    xml::Error err;
    auto doc = xml::Document::parse(input, &err);
    REQUIRE_FALSE(doc.has_value());
    return err.message;
  };

  REQUIRE(failure("") == "no root element");
  REQUIRE(failure("<!-- only -->") == "no root element");
  REQUIRE(failure("<a/><b/>") == "multiple root elements");
  REQUIRE(failure("junk<a/>") == "text outside the root element");
  REQUIRE(failure("<a>&bogus</a>") == "unterminated entity");
  REQUIRE(failure("<a><b></a>").find("mismatched") != std::string::npos);

  SECTION("Depth limit")
  {
    xml::Options opt;
    opt.maxDepth = 2;
    xml::Error err;
    REQUIRE_FALSE(xml::Document::parse("<a><b><c/></b></a>", &err, opt).has_value());
    REQUIRE(err.message == "maximum element depth exceeded");
  }
}
