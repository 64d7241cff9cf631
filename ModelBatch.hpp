/// @file
/// @brief Patch the interior behavior file of every model of one aircraft.
#pragma once

#include "Modification.hpp"
#include "Settings.hpp"

#include <filesystem>
#include <iosfwd>
#include <vector>
#include <cstddef>

namespace crj_fix {

/// <package>/SimObjects/Airplanes/<airplaneId>
std::filesystem::path AirplanePath(const std::filesystem::path& package,
                                   const std::string& airplaneId);

/// Subdirectories of @p airplaneDir named model* (any case), sorted.
/// @throws IoFailure if @p airplaneDir is missing or unreadable.
std::vector<std::filesystem::path>
FindModelDirectories(const std::filesystem::path& airplaneDir);

/// Read @p source, apply @p catalog, write the result to @p target.
/// Nothing is written unless every record applied.
/// @throws MalformedSourceDocument, PatchError, IoFailure
void PatchModelFile(const std::filesystem::path& source,
                    const std::filesystem::path& target,
                    const Catalog& catalog, const Settings& settings,
                    std::ostream& log);

/// Mirror every model directory of @p variant from @p originalPackage into
/// @p patchPackage with its behavior file patched.
/// @return number of model files written.
std::size_t ProcessModelBehaviors(const std::filesystem::path& originalPackage,
                                  const std::filesystem::path& patchPackage,
                                  const Variant& variant,
                                  const Catalog& catalog,
                                  const Settings& settings,
                                  std::ostream& log);

} // crj_fix
