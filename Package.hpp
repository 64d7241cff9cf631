/// @file
/// @brief Locate MSFS packages and build the interaction-fix package.
#pragma once

#include "Modification.hpp"
#include "Settings.hpp"

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <cstddef>

namespace crj_fix {

enum class PackageSource { Community, Official };

/// Value of the InstalledPackagesPath line of a UserCfg.opt, if any.
std::optional<std::string> ParseInstalledPackagesPath(std::string_view cfg);

/// @throws IoFailure, PackageError
std::filesystem::path ReadInstalledPackagesPath(const std::filesystem::path&
                                                userCfg);

/// Where the Microsoft Store and Steam builds keep UserCfg.opt, from the
/// LOCALAPPDATA and APPDATA environment variables. Unset ones are skipped.
std::vector<std::filesystem::path> UserCfgCandidates();

/// Installed packages root from the first existing candidate.
/// @throws PackageError if none exists.
std::filesystem::path FindPackagesPath(
    const std::vector<std::filesystem::path>& candidates);

/// <packagesPath>/Community
std::filesystem::path CommunityFolder(const std::filesystem::path&
                                      packagesPath);

std::filesystem::path PackagePath(const std::filesystem::path& packagesPath,
                                  PackageSource source,
                                  const std::string& name);

std::string WelcomeMessage(const Settings& settings);

struct BuildReport {
  std::filesystem::path patchPackage;
  std::size_t models = 0;
}; // BuildReport

/// Rebuild <community>/<patchPackage> from <community>/<originalPackage>:
/// templates file plus @p templateFragment, every variant's model behavior
/// files patched with @p catalog, then layout.json and manifest.json.
/// Any existing patch package is removed first.
/// @throws PackageError, IoFailure, MalformedSourceDocument, PatchError
BuildReport BuildPatchPackage(const std::filesystem::path& community,
                              const Catalog& catalog,
                              std::string_view templateFragment,
                              const Settings& settings, std::ostream& log);

} // crj_fix
