#include "Patcher.hpp"
#include "xml/NodeQuery.hpp"

#include <gsl-lite/gsl-lite.hpp>

#include <array>
#include <format>
#include <string>

namespace crj_fix {

void ApplyModification(pugi::xml_node behaviors, const Modification& mod,
                       const PatchSettings& settings)
{
  gsl_Expects(!behaviors.empty());

  auto button = xml::RequireUnique(behaviors, settings.idAttribute,
                                   mod.buttonId, settings.componentElement);
  auto knob = xml::RequireUnique(behaviors, settings.idAttribute,
                                 mod.knobId, settings.componentElement);
  auto ref = xml::FirstChildElement(knob);
  if (!ref) {
    auto msg = std::format("<{} {}=\"{}\"> has no template reference element",
                           settings.componentElement, settings.idAttribute,
                           mod.knobId);
    throw NodeNotFound{mod.knobId, msg};
  }

  for (auto n = knob; n; n = n.parent()) {
    if (n == button) {
      auto msg = std::format("button <{0} {1}=\"{2}\"> contains knob"
                             " <{0} {1}=\"{3}\">",
                             settings.componentElement, settings.idAttribute,
                             mod.buttonId, mod.knobId);
      throw OverlappingNodes{mod.buttonId, msg};
    }
  }

  if (!button.parent().remove_child(button)) {
    throw NodeNotFound{mod.buttonId,
                       "failed to detach button component " + mod.buttonId};
  }

  ref.remove_children();
  ref.remove_attributes();
  ref.append_attribute(settings.nameAttribute.c_str())
     .set_value(settings.templateName.c_str());

  const auto values = std::array<const std::string*, 4>{
    &mod.knobAnimName, &mod.knobChangeName, &mod.pushAnimName, &mod.pushName
  };
  for (auto i = std::size_t{0}; i != values.size(); ++i)
    ref.append_child(TemplateParameters[i]).text().set(values[i]->c_str());
} // ApplyModification

std::vector<PatchFailure>
ApplyCatalog(pugi::xml_node behaviors, const Catalog& catalog,
             const PatchSettings& settings)
{
  auto failures = std::vector<PatchFailure>{};
  for (auto i = std::size_t{0}; i != catalog.size(); ++i) {
    try {
      ApplyModification(behaviors, catalog[i], settings);
    }
    catch (const NodeLookupError& x) {
      failures.push_back(PatchFailure{i, x.id(), x.what()});
    }
  }
  return failures;
} // ApplyCatalog

} // crj_fix
