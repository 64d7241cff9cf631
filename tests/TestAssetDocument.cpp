#include "../AssetDocument.hpp"
#include "../Errors.hpp"
#include "TestSupport.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace crj_fix;

namespace {

std::string Formatted(std::string_view text) {
  auto doc = ParseAssetDocument(text, "fixture.xml");
  return FormatAssetDocument(doc);
} // Formatted

} // local

TEST(ParseAssetDocument, KeepsModelInfoVerbatim)
{
  auto doc = ParseAssetDocument(test::InteriorXml, "fixture.xml");
  ASSERT_EQ(doc.header, test::InteriorHeader);
  ASSERT_STREQ(doc.behaviors().name(), "ModelBehaviors");
}

TEST(ParseAssetDocument, KeepsComments)
{
  auto doc = ParseAssetDocument(test::InteriorXml, "fixture.xml");
  auto pedestal = doc.behaviors().find_child_by_attribute("Component", "ID",
                                                          "PEDESTAL");
  ASSERT_FALSE(pedestal.empty());
  ASSERT_EQ(pedestal.first_child().type(), pugi::node_comment);
}

TEST(ParseAssetDocument, MissingModelBehaviorsIsMalformed)
{
  auto text = std::string{test::InteriorHeader} + "\r\n";
  try {
    ParseAssetDocument(text, "only_info.xml");
    FAIL() << "expected MalformedSourceDocument";
  }
  catch (const MalformedSourceDocument& x) {
    ASSERT_EQ(x.path().string(), "only_info.xml");
    ASSERT_NE(std::string{x.what()}.find("ModelBehaviors"), std::string::npos);
  }
}

TEST(ParseAssetDocument, MissingModelInfoIsMalformed)
{
  ASSERT_THROW(ParseAssetDocument("<ModelBehaviors/>", "x.xml"),
               MalformedSourceDocument);
}

TEST(ParseAssetDocument, BrokenMarkupIsMalformed)
{
  auto text = std::string{test::InteriorHeader}
            + "\r\n<ModelBehaviors>\r\n\t<Component ID=\"A\">\r\n"
              "</ModelBehaviors>\r\n";
  ASSERT_THROW(ParseAssetDocument(text, "x.xml"), MalformedSourceDocument);
}

TEST(ParseAssetDocument, BadAttributeInBodyReportsLine)
{
  auto text = std::string{"<ModelInfo/>\r\n<ModelBehaviors>\r\n"
                          "\t<A flag></A>\r\n</ModelBehaviors>"};
  try {
    ParseAssetDocument(text, "x.xml");
    FAIL() << "expected MalformedSourceDocument";
  }
  catch (const MalformedSourceDocument& x) {
    ASSERT_NE(std::string{x.what()}.find("line 3"), std::string::npos)
      << x.what();
  }
}

TEST(ReadAssetDocument, MissingFileIsIoFailure)
{
  auto dir = test::TempDir{};
  ASSERT_THROW(ReadAssetDocument(dir.path() / "CRJ700_Interior.xml"),
               IoFailure);
}

TEST(FormatAssetDocument, LeadingBlankLineThenHeaderThenBody)
{
  auto out = Formatted(test::InteriorXml);
  auto expectedStart = "\r\n" + std::string{test::InteriorHeader}
                     + "\r\n<ModelBehaviors>\r\n";
  ASSERT_TRUE(out.starts_with(expectedStart)) << out;
  ASSERT_TRUE(out.ends_with("</ModelBehaviors>\r\n")) << out;
}

TEST(FormatAssetDocument, NoDeclarationAndNoByteOrderMark)
{
  auto out = Formatted(test::InteriorXml);
  ASSERT_EQ(out.find("<?xml"), std::string::npos);
  ASSERT_EQ(out.find("\xEF\xBB\xBF"), std::string::npos);
}

TEST(FormatAssetDocument, EveryLineEndsWithCrLf)
{
  auto out = Formatted(test::InteriorXml);
  for (auto i = std::size_t{0}; i != out.size(); ++i) {
    if (out[i] == '\n') {
      ASSERT_GT(i, 0u);
      ASSERT_EQ(out[i-1], '\r') << "at offset " << i;
    }
  }
}

TEST(FormatAssetDocument, IndentsWithOneTabPerLevel)
{
  auto out = Formatted(test::InteriorXml);
  const auto include =
    "\r\n\t<Include ModelBehaviorFile=\"ASCRJ_Templates.xml\" />\r\n";
  ASSERT_NE(out.find(include), std::string::npos) << out;
  ASSERT_NE(out.find("\r\n\t\t\t\t<NODE_ID>btn1</NODE_ID>\r\n"),
            std::string::npos) << out;
}

TEST(FormatAssetDocument, CustomWriterSettings)
{
  auto doc = ParseAssetDocument(test::InteriorXml, "fixture.xml");
  auto out = FormatAssetDocument(doc, WriterSettings{"  ", "\n"});
  ASSERT_EQ(out.find('\r', out.find("<ModelBehaviors>")), std::string::npos);
  ASSERT_NE(out.find("\n  <Include"), std::string::npos);
}

TEST(FormatAssetDocument, OutputParsesBackToTheSameDocument)
{
  auto once = Formatted(test::InteriorXml);
  auto twice = Formatted(once);
  ASSERT_EQ(once, twice);
  auto doc = ParseAssetDocument(once, "again.xml");
  ASSERT_EQ(doc.header, test::InteriorHeader);
}

TEST(WriteAssetDocument, WritesFormattedBytes)
{
  auto dir = test::TempDir{};
  auto doc = ParseAssetDocument(test::InteriorXml, "fixture.xml");
  WriteAssetDocument(dir.path() / "out.xml", doc);
  ASSERT_EQ(test::Slurp(dir.path() / "out.xml"), FormatAssetDocument(doc));
}
