#include "../xml/FragmentScanner.hpp"
#include "TestSupport.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace crj_fix::xml;

namespace {

std::vector<Token::Kind> Kinds(std::string_view text) {
  auto scanner = FragmentScanner{text};
  auto out = std::vector<Token::Kind>{};
  while (auto tok = scanner.Next())
    out.push_back(tok->kind);
  return out;
} // Kinds

} // local

TEST(FragmentScanner, ClassifiesEveryTokenKind)
{
  const auto text = std::string_view{
    "<?xml version=\"1.0\"?><!DOCTYPE x [<!ENTITY a \"b\">]>"
    "<!-- c --><a x=\"1\">t<![CDATA[<no>]]><b/></a>"};
  using K = Token::Kind;
  auto expected = std::vector<K>{
    K::ProcessingInstruction, K::DocType, K::Comment, K::StartTag, K::Text,
    K::CData, K::EmptyTag, K::EndTag};
  ASSERT_EQ(Kinds(text), expected);
}

TEST(FragmentScanner, ReportsTagNamesAndOffsets)
{
  auto scanner = FragmentScanner{"<Component ID=\"A\">\n</Component >"};
  auto start = scanner.Next();
  ASSERT_TRUE(start);
  ASSERT_EQ(start->kind, Token::Kind::StartTag);
  ASSERT_EQ(start->name, "Component");
  ASSERT_EQ(start->begin, 0u);
  ASSERT_EQ(start->end, 18u);
  ASSERT_TRUE(scanner.Next());  // newline
  auto end = scanner.Next();
  ASSERT_TRUE(end);
  ASSERT_EQ(end->kind, Token::Kind::EndTag);
  ASSERT_EQ(end->name, "Component");
  ASSERT_FALSE(scanner.Next());
}

TEST(FragmentScanner, AttributeValuesMayContainMarkupCharacters)
{
  auto scanner = FragmentScanner{"<a expr=\"(L:X) 1 > if{ 2 }\" path='a/'>"};
  auto tok = scanner.Next();
  ASSERT_TRUE(tok);
  ASSERT_EQ(tok->kind, Token::Kind::StartTag);
  ASSERT_EQ(tok->end, scanner.text().size());
}

TEST(FragmentScanner, AdvancesToBothSiblingRoots)
{
  auto scanner = FragmentScanner{crj_fix::test::InteriorXml};
  auto info = scanner.AdvanceTo("ModelInfo");
  ASSERT_TRUE(info);
  ASSERT_EQ(info->markup, crj_fix::test::InteriorHeader);
  ASSERT_EQ(info->begin, 0u);

  auto behaviors = scanner.AdvanceTo("ModelBehaviors");
  ASSERT_TRUE(behaviors);
  ASSERT_TRUE(behaviors->markup.starts_with("<ModelBehaviors>"));
  ASSERT_TRUE(behaviors->markup.ends_with("</ModelBehaviors>"));
  ASSERT_FALSE(scanner.AdvanceTo("Anything"));
}

TEST(FragmentScanner, SkipsByteOrderMarkAndProlog)
{
  auto text = std::string{"\xEF\xBB\xBF<?xml version=\"1.0\"?>\r\n<A/>"};
  auto scanner = FragmentScanner{text};
  auto a = scanner.AdvanceTo("A");
  ASSERT_TRUE(a);
  ASSERT_EQ(a->markup, "<A/>");
}

TEST(FragmentScanner, IgnoresMatchingNamesBelowTheCurrentLevel)
{
  auto scanner = FragmentScanner{"<X><Target id=\"inner\"/></X><Target id=\"outer\"/>"};
  auto t = scanner.AdvanceTo("Target");
  ASSERT_TRUE(t);
  ASSERT_EQ(t->markup, "<Target id=\"outer\"/>");
}

TEST(FragmentScanner, StopsAtEnclosingEndTagWithoutConsumingIt)
{
  auto text = std::string_view{"<a/></outer><b/>"};
  auto scanner = FragmentScanner{text};
  ASSERT_FALSE(scanner.AdvanceTo("b"));
  ASSERT_EQ(scanner.position(), text.find("</outer>"));
}

TEST(FragmentScanner, ReturnsNothingWhenElementIsAbsent)
{
  auto scanner = FragmentScanner{"<ModelInfo/>\r\n<!-- end -->\r\n"};
  ASSERT_TRUE(scanner.AdvanceTo("ModelInfo"));
  ASSERT_FALSE(scanner.AdvanceTo("ModelBehaviors"));
}

TEST(FragmentScanner, ThrowsOnMismatchedEndTag)
{
  auto scanner = FragmentScanner{"<a>\n<b>\n</a>\n</b>"};
  try {
    scanner.AdvanceTo("a");
    FAIL() << "expected ScanError";
  }
  catch (const ScanError& x) {
    ASSERT_NE(std::string{x.what()}.find("line 3"), std::string::npos);
  }
}

TEST(FragmentScanner, ThrowsOnUnterminatedElement)
{
  auto scanner = FragmentScanner{"<ModelBehaviors><Component>"};
  ASSERT_THROW(scanner.AdvanceTo("ModelBehaviors"), ScanError);
}

TEST(FragmentScanner, ThrowsOnUnterminatedComment)
{
  auto scanner = FragmentScanner{"<!-- never closed <a/>"};
  ASSERT_THROW(scanner.Next(), ScanError);
}

TEST(FragmentScanner, ThrowsOnUnterminatedStartTag)
{
  auto scanner = FragmentScanner{"<a href=\"x>"};
  ASSERT_THROW(scanner.Next(), ScanError);
}

TEST(LineOf, CountsNewlinesBeforeOffset)
{
  const auto text = std::string_view{"a\nb\r\nc"};
  ASSERT_EQ(LineOf(text, 0), 1u);
  ASSERT_EQ(LineOf(text, 2), 2u);
  ASSERT_EQ(LineOf(text, text.size()), 3u);
}
