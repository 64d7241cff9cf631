/// @file
/// @brief Read and write model behavior files (e.g. CRJ700_Interior.xml).
///
/// The file holds two sibling roots:
///   <ModelInfo ...> ... </ModelInfo>
///   <ModelBehaviors> ... </ModelBehaviors>
/// <ModelInfo> is kept as raw text and written back unchanged.
/// <ModelBehaviors> is parsed with pugixml so it can be edited, and is
/// re-indented on output.
#pragma once

#include "Settings.hpp"

#include <pugixml.hpp>

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace crj_fix {

constexpr char ModelInfoTag[]      = "ModelInfo";
constexpr char ModelBehaviorsTag[] = "ModelBehaviors";

struct AssetDocument {
  std::string header;                        // <ModelInfo> outer markup
  std::unique_ptr<pugi::xml_document> body;  // owns <ModelBehaviors>

  pugi::xml_node behaviors() const { return body->document_element(); }
}; // AssetDocument

/// @param origin names the source in error messages.
/// @throws MalformedSourceDocument if either root is missing or broken.
AssetDocument ParseAssetDocument(std::string_view text,
                                 const std::filesystem::path& origin);

/// @throws IoFailure if @p path cannot be read.
AssetDocument ReadAssetDocument(const std::filesystem::path& path);

/// Leading line break, header verbatim, line break, then the body indented
/// with settings.indent per level and settings.newline line endings. No XML
/// declaration, no BOM.
std::string FormatAssetDocument(const AssetDocument& doc,
                                const WriterSettings& settings={});

void WriteAssetDocument(const std::filesystem::path& path,
                        const AssetDocument& doc,
                        const WriterSettings& settings={});

} // crj_fix
