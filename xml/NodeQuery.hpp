/// @file
/// @brief Recursive attribute lookups over a pugixml tree.
#pragma once

#include <pugixml.hpp>

#include <string_view>
#include <vector>
#include <cstddef>

namespace crj_fix::xml {

/// Every element below @p tree (not @p tree itself) whose attribute
/// @p attrName equals @p value, in document order. An empty @p element
/// matches any element name.
std::vector<pugi::xml_node>
FindByAttribute(pugi::xml_node tree, std::string_view attrName,
                std::string_view value, std::string_view element={});

/// The single element FindByAttribute() yields.
/// @throws NodeNotFound if there is none, AmbiguousNode if there are several.
pugi::xml_node
RequireUnique(pugi::xml_node tree, std::string_view attrName,
              std::string_view value, std::string_view element={});

/// First child that is an element (comments and text are skipped).
pugi::xml_node FirstChildElement(pugi::xml_node node);

/// Number of elements in the subtree rooted at @p node, @p node included.
std::size_t CountElements(pugi::xml_node node);

} // crj_fix::xml
