#include "../xml/NodeQuery.hpp"
#include "../Errors.hpp"

#include <gtest/gtest.h>
#include <pugixml.hpp>

#include <string>

using namespace crj_fix;

namespace {

constexpr char Tree[] =
  "<ModelBehaviors>"
  "<Component ID=\"A\">"
  "<!-- first -->"
  "<UseTemplate Name=\"T\"/>"
  "<Component ID=\"B\"><Component ID=\"C\"/></Component>"
  "</Component>"
  "<Component ID=\"C\"/>"
  "<Animation ID=\"B\"/>"
  "</ModelBehaviors>";

class NodeQuery : public ::testing::Test {
protected:
  pugi::xml_document doc;
  void SetUp() override {
    auto res = doc.load_string(Tree, pugi::parse_default | pugi::parse_comments);
    ASSERT_TRUE(res) << res.description();
  }
  pugi::xml_node root() const { return doc.document_element(); }
}; // NodeQuery

} // local

TEST_F(NodeQuery, FindsNestedMatchesInDocumentOrder)
{
  auto found = xml::FindByAttribute(root(), "ID", "C");
  ASSERT_EQ(found.size(), 2u);
  ASSERT_STREQ(found[0].parent().attribute("ID").value(), "B");
  ASSERT_TRUE(found[1].parent() == root());
}

TEST_F(NodeQuery, ElementNameNarrowsTheSearch)
{
  ASSERT_EQ(xml::FindByAttribute(root(), "ID", "B").size(), 2u);
  auto found = xml::FindByAttribute(root(), "ID", "B", "Component");
  ASSERT_EQ(found.size(), 1u);
  ASSERT_STREQ(found[0].name(), "Component");
}

TEST_F(NodeQuery, DoesNotMatchTheRootItself)
{
  root().append_attribute("ID") = "ROOT";
  ASSERT_TRUE(xml::FindByAttribute(root(), "ID", "ROOT").empty());
}

TEST_F(NodeQuery, RequireUniqueReturnsTheOnlyMatch)
{
  auto a = xml::RequireUnique(root(), "ID", "A", "Component");
  ASSERT_STREQ(a.attribute("ID").value(), "A");
}

TEST_F(NodeQuery, RequireUniqueThrowsNodeNotFound)
{
  try {
    xml::RequireUnique(root(), "ID", "MISSING", "Component");
    FAIL() << "expected NodeNotFound";
  }
  catch (const NodeNotFound& x) {
    ASSERT_EQ(x.id(), "MISSING");
    ASSERT_NE(std::string{x.what()}.find("MISSING"), std::string::npos);
  }
}

TEST_F(NodeQuery, RequireUniqueThrowsAmbiguousNode)
{
  try {
    xml::RequireUnique(root(), "ID", "C", "Component");
    FAIL() << "expected AmbiguousNode";
  }
  catch (const AmbiguousNode& x) {
    ASSERT_EQ(x.id(), "C");
    ASSERT_EQ(x.count(), 2u);
  }
}

TEST_F(NodeQuery, FirstChildElementSkipsComments)
{
  auto a = xml::RequireUnique(root(), "ID", "A");
  auto first = xml::FirstChildElement(a);
  ASSERT_STREQ(first.name(), "UseTemplate");
  ASSERT_TRUE(xml::FirstChildElement(first).empty());
}

TEST_F(NodeQuery, CountElementsIncludesTheNodeAndIgnoresComments)
{
  ASSERT_EQ(xml::CountElements(root()), 7u);
  ASSERT_EQ(xml::CountElements(xml::RequireUnique(root(), "ID", "A")), 4u);
}
