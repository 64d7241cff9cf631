#include "Package.hpp"
#include "Errors.hpp"
#include "FileOps.hpp"
#include "Manifest.hpp"
#include "ModelBatch.hpp"

#include <cstdlib>
#include <format>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <system_error>

namespace crj_fix {

namespace {

constexpr std::string_view InstalledPackagesKey = "InstalledPackagesPath";

constexpr char StoreUserCfg[] =
  "Packages/Microsoft.FlightSimulator_8wekyb3d8bbwe/LocalCache/UserCfg.opt";
constexpr char SteamUserCfg[] = "Microsoft Flight Simulator/UserCfg.opt";

std::string_view Trim(std::string_view s, std::string_view chars) {
  auto b = s.find_first_not_of(chars);
  if (b == std::string_view::npos)
    return {};
  auto e = s.find_last_not_of(chars);
  return s.substr(b, e - b + 1);
} // Trim

std::optional<std::string> Env(const char* name) {
  const auto* v = std::getenv(name);
  if (v == nullptr || v[0] == '\0')
    return std::nullopt;
  return std::string{v};
} // Env

} // local

std::optional<std::string> ParseInstalledPackagesPath(std::string_view cfg) {
  auto lines = std::istringstream{std::string{cfg}};
  auto line = std::string{};
  while (std::getline(lines, line)) {
    auto view = std::string_view{line};
    if (!view.starts_with(InstalledPackagesKey))
      continue;
    auto q = view.find('"');
    if (q == std::string_view::npos)
      continue;
    auto value = Trim(view.substr(q), " \t\r\"");
    if (!value.empty())
      return std::string{value};
  }
  return std::nullopt;
} // ParseInstalledPackagesPath

fs::path ReadInstalledPackagesPath(const fs::path& userCfg) {
  auto value = ParseInstalledPackagesPath(ReadTextFile(userCfg));
  if (!value) {
    throw PackageError{std::format("failed to find '{}' in '{}'",
                                   InstalledPackagesKey, userCfg.string())};
  }
  return fs::path{*value};
} // ReadInstalledPackagesPath

std::vector<fs::path> UserCfgCandidates() {
  auto out = std::vector<fs::path>{};
  if (auto local = Env("LOCALAPPDATA"))
    out.push_back(fs::path{*local} / StoreUserCfg);
  if (auto roaming = Env("APPDATA"))
    out.push_back(fs::path{*roaming} / SteamUserCfg);
  return out;
} // UserCfgCandidates

fs::path FindPackagesPath(const std::vector<fs::path>& candidates) {
  for (const auto& cfg: candidates) {
    auto ec = std::error_code{};
    if (fs::is_regular_file(cfg, ec))
      return ReadInstalledPackagesPath(cfg);
  }
  throw PackageError{"failed to locate UserCfg.opt;"
                     " use --community or --user-cfg"};
} // FindPackagesPath

fs::path CommunityFolder(const fs::path& packagesPath)
  { return packagesPath / "Community"; }

fs::path PackagePath(const fs::path& packagesPath, PackageSource source,
                     const std::string& name)
{
  switch (source) {
    case PackageSource::Community:
      return CommunityFolder(packagesPath) / name;
    case PackageSource::Official:
      return packagesPath / "Official" / "OneStore" / name;
  }
  throw PackageError{"invalid package source"};
} // PackagePath

std::string WelcomeMessage(const Settings& settings) {
  return std::format(
    "{0} installer\n"
    "\n"
    "Replaces the momentary push on the cockpit knobs of '{1}' with an\n"
    "infinite push. The original package is not modified; the patched files\n"
    "are written to a separate package, '{0}'.\n"
    "\n"
    "Requires '{1}' version {2}.\n"
    "\n",
    settings.patchPackage, settings.originalPackage, settings.requiredVersion);
} // WelcomeMessage

BuildReport BuildPatchPackage(const fs::path& community,
                              const Catalog& catalog,
                              std::string_view templateFragment,
                              const Settings& settings, std::ostream& log)
{
  const auto originalPackage = community / settings.originalPackage;
  auto ec = std::error_code{};
  if (!fs::is_directory(originalPackage, ec)) {
    throw PackageError{std::format(
        "the directory '{}' does not exist; install '{}' before running this"
        " application", originalPackage.string(), settings.originalPackage)};
  }

  log << "Checking package dependencies\n";
  const auto originalManifestPath = originalPackage / "manifest.json";
  if (!fs::is_regular_file(originalManifestPath, ec)) {
    throw PackageError{std::format("unable to locate the {} manifest at '{}'",
                                   settings.originalPackage,
                                   originalManifestPath.string())};
  }
  const auto originalManifest = LoadManifest(originalManifestPath);
  if (originalManifest.packageVersion != settings.requiredVersion) {
    throw PackageError{std::format(
        "'{}' must be version {}; version {} is installed",
        settings.originalPackage, settings.requiredVersion,
        originalManifest.packageVersion)};
  }

  const auto templateRef = std::format("{}=\"{}\"",
                                       settings.patch.nameAttribute,
                                       settings.patch.templateName);
  if (templateFragment.find(templateRef) == std::string_view::npos) {
    throw PackageError{std::format("template fragment does not define {}",
                                   templateRef)};
  }

  const auto patchPackage = community / settings.patchPackage;
  if (fs::exists(patchPackage, ec)) {
    log << std::format("Removing existing instance of package '{}'\n",
                       settings.patchPackage);
    RemoveDirectory(patchPackage, log);
  }
  CreateDirectory(patchPackage, log);

  log << "Processing Model Behavior Defs\n";
  const auto templatesFile = fs::path{settings.templatesFile};
  CreateDirectory((patchPackage / templatesFile).parent_path(), log);
  CopyFile(originalPackage / templatesFile, patchPackage / templatesFile, log);
  log << std::format("Applying patch to '{}'\n",
                     (patchPackage / templatesFile).string());
  AppendTextFile(patchPackage / templatesFile, templateFragment);

  auto report = BuildReport{patchPackage, 0};
  for (const auto& variant: settings.variants) {
    log << std::format("Processing '{}' files\n", variant.behaviorFile);
    report.models += ProcessModelBehaviors(originalPackage, patchPackage,
                                           variant, catalog, settings, log);
  }

  GenerateLayout(patchPackage, log);

  auto manifest = Manifest{};
  manifest.dependencies.push_back(Dependency{settings.originalPackage,
                                             settings.requiredVersion});
  manifest.contentType        = settings.contentType;
  manifest.title              = settings.patchTitle;
  manifest.packageVersion     = settings.patchVersion;
  manifest.minimumGameVersion = originalManifest.minimumGameVersion;
  GenerateManifest(patchPackage, manifest, log);
  return report;
} // BuildPatchPackage

} // crj_fix
