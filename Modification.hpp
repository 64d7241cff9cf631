/// @file
/// @brief Modification records: which button component to delete and which
///        knob component to switch to the infinite-push template.
#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace crj_fix {

struct Modification {
  std::string buttonId;       // ButtonId: Component removed from the model
  std::string knobId;         // KnobId: Component whose template is replaced
  std::string knobAnimName;   // KnobAnimName   -> <KNOB_ANIM_NAME>
  std::string knobChangeName; // KnobChangeName -> <KNOB_CHANGE_NAME>
  std::string pushAnimName;   // PushAnimName   -> <PUSH_ANIM_NAME>
  std::string pushName;       // PushName       -> <PUSH_NAME>
  bool operator==(const Modification&) const = default;
}; // Modification

/// Applied in order; records are independent of each other.
using Catalog = std::vector<Modification>;

/// Parse {"Modifications": [{ "ButtonId": ..., ... }, ...]}.
/// @throws CatalogError on malformed JSON or a missing/non-string field.
Catalog ParseCatalog(std::string_view text,
                     std::string_view origin="catalog");

/// @throws IoFailure if the file cannot be read, CatalogError otherwise.
Catalog LoadCatalog(const std::filesystem::path& path);

} // crj_fix
