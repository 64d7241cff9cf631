#include "NodeQuery.hpp"
#include "../Errors.hpp"

#include <gsl-lite/gsl-lite.hpp>

#include <format>
#include <string>

namespace crj_fix::xml {

namespace {

void Collect(pugi::xml_node node, const char* attrName,
             std::string_view value, std::string_view element,
             std::vector<pugi::xml_node>& out)
{
  for (auto child: node.children()) {
    if (child.type() != pugi::node_element)
      continue;
    if (element.empty() || element == child.name()) {
      auto a = child.attribute(attrName);
      if (a && value == a.value())
        out.push_back(child);
    }
    Collect(child, attrName, value, element, out);
  }
} // Collect

std::string Describe(std::string_view attrName, std::string_view value,
                     std::string_view element)
{
  return std::format("<{} {}=\"{}\">",
                     element.empty() ? "*" : element, attrName, value);
} // Describe

} // local

std::vector<pugi::xml_node>
FindByAttribute(pugi::xml_node tree, std::string_view attrName,
                std::string_view value, std::string_view element)
{
  gsl_Expects(!tree.empty());
  gsl_Expects(!attrName.empty());
  const auto key = std::string{attrName};
  auto out = std::vector<pugi::xml_node>{};
  Collect(tree, key.c_str(), value, element, out);
  return out;
} // FindByAttribute

pugi::xml_node
RequireUnique(pugi::xml_node tree, std::string_view attrName,
              std::string_view value, std::string_view element)
{
  auto found = FindByAttribute(tree, attrName, value, element);
  if (found.empty()) {
    throw NodeNotFound{value, std::format("no {} found",
                                          Describe(attrName, value, element))};
  }
  if (found.size() > 1) {
    auto msg = std::format("{} matches {} nodes",
                           Describe(attrName, value, element), found.size());
    throw AmbiguousNode{value, msg, found.size()};
  }
  return found.front();
} // RequireUnique

pugi::xml_node FirstChildElement(pugi::xml_node node) {
  for (auto child: node.children()) {
    if (child.type() == pugi::node_element)
      return child;
  }
  return {};
} // FirstChildElement

std::size_t CountElements(pugi::xml_node node) {
  if (node.type() != pugi::node_element)
    return 0;
  auto n = std::size_t{1};
  for (auto child: node.children())
    n += CountElements(child);
  return n;
} // CountElements

} // crj_fix::xml
