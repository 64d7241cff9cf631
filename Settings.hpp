/// @file
/// @brief Process-wide constants, grouped so tests can substitute them.
#pragma once

#include <string>
#include <vector>

namespace crj_fix {

namespace defaults {

constexpr char ComponentElement[] = "Component";
constexpr char IdAttribute[]      = "ID";
constexpr char NameAttribute[]    = "Name";

/// Must match the <Template Name="..."> in the appended template fragment.
constexpr char InfinitePushTemplate[] = "ASCRJ_Knob_Infinite_Push_Template";

constexpr char OriginalPackage[]  = "aerosoft-crj";
constexpr char PatchPackage[]     = "aerosoft-crj-interaction-fix";
constexpr char RequiredVersion[]  = "1.0.6";
constexpr char PatchVersion[]     = "1.0.0";
constexpr char PatchTitle[]       = "Aerosoft CRJ Cockpit Interaction Fix";
constexpr char ContentType[]      = "CORE";
constexpr char TemplatesFile[]    = "ModelBehaviorDefs/ASCRJ_Templates.xml";

} // defaults

struct PatchSettings {
  std::string componentElement = defaults::ComponentElement;
  std::string idAttribute      = defaults::IdAttribute;
  std::string nameAttribute    = defaults::NameAttribute;
  std::string templateName     = defaults::InfinitePushTemplate;
}; // PatchSettings

struct WriterSettings {
  std::string indent  = "\t";
  std::string newline = "\r\n";
}; // WriterSettings

/// One aircraft variant under SimObjects/Airplanes.
struct Variant {
  std::string airplaneId;   // e.g. Aerosoft_CRJ_700
  std::string behaviorFile; // e.g. CRJ700_Interior.xml
}; // Variant

struct Settings {
  std::string originalPackage = defaults::OriginalPackage;
  std::string patchPackage    = defaults::PatchPackage;
  std::string requiredVersion = defaults::RequiredVersion;
  std::string patchVersion    = defaults::PatchVersion;
  std::string patchTitle      = defaults::PatchTitle;
  std::string contentType     = defaults::ContentType;
  std::string templatesFile   = defaults::TemplatesFile;
  std::vector<Variant> variants = {
    {"Aerosoft_CRJ_550", "CRJ550_Interior.xml"},
    {"Aerosoft_CRJ_700", "CRJ700_Interior.xml"},
  };
  PatchSettings  patch;
  WriterSettings writer;
}; // Settings

} // crj_fix
