/// @file
/// @brief Switch knob components from the stock one-shot push template to
///        the infinite-push template.
///
/// For each Modification:
///   - the button <Component ID=buttonId> is removed with its subtree,
///   - the first child element of <Component ID=knobId> (the template
///     reference, e.g. <UseTemplate Name="...">) is renamed to the
///     infinite-push template and its content replaced by
///       <KNOB_ANIM_NAME/> <KNOB_CHANGE_NAME/> <PUSH_ANIM_NAME/> <PUSH_NAME/>
///     in that order.
#pragma once

#include "Errors.hpp"
#include "Modification.hpp"
#include "Settings.hpp"

#include <pugixml.hpp>

#include <vector>

namespace crj_fix {

/// Parameter elements written under the template reference, in order.
constexpr const char* TemplateParameters[] = {
  "KNOB_ANIM_NAME", "KNOB_CHANGE_NAME", "PUSH_ANIM_NAME", "PUSH_NAME"
};

/// Both components are resolved before anything is changed, so a record
/// that throws leaves @p behaviors untouched.
/// @throws NodeNotFound, AmbiguousNode, OverlappingNodes if the button is
///         the knob or encloses it.
void ApplyModification(pugi::xml_node behaviors, const Modification& mod,
                       const PatchSettings& settings={});

/// Applies every record, in order. Records that fail are skipped and
/// reported; the caller must not write a document with failures.
std::vector<PatchFailure>
ApplyCatalog(pugi::xml_node behaviors, const Catalog& catalog,
             const PatchSettings& settings={});

} // crj_fix
