#include "ModelBatch.hpp"
#include "AssetDocument.hpp"
#include "Errors.hpp"
#include "FileOps.hpp"
#include "Patcher.hpp"

#include <algorithm>
#include <format>
#include <ostream>
#include <string>
#include <system_error>
#include <utility>
#include <cctype>

namespace crj_fix {

namespace {

constexpr std::string_view ModelPrefix = "model";

bool IsModelDirName(const std::string& name) {
  if (name.size() < ModelPrefix.size())
    return false;
  return std::equal(ModelPrefix.begin(), ModelPrefix.end(), name.begin(),
      [](char a, char b) {
        return a == std::tolower(static_cast<unsigned char>(b));
      });
} // IsModelDirName

} // local

fs::path AirplanePath(const fs::path& package, const std::string& airplaneId)
  { return package / "SimObjects" / "Airplanes" / airplaneId; }

std::vector<fs::path> FindModelDirectories(const fs::path& airplaneDir) {
  auto ec = std::error_code{};
  auto it = fs::directory_iterator{airplaneDir, ec};
  if (ec) {
    throw IoFailure{airplaneDir,
                    std::format("cannot list directory ({})", ec.message())};
  }
  auto out = std::vector<fs::path>{};
  for (; it != fs::directory_iterator{}; it.increment(ec)) {
    if (ec)
      break;
    auto typeEc = std::error_code{};
    auto name = it->path().filename().string();
    if (it->is_directory(typeEc) && IsModelDirName(name))
      out.push_back(it->path());
  }
  if (ec) {
    throw IoFailure{airplaneDir,
                    std::format("cannot list directory ({})", ec.message())};
  }
  std::ranges::sort(out);
  return out;
} // FindModelDirectories

void PatchModelFile(const fs::path& source, const fs::path& target,
                    const Catalog& catalog, const Settings& settings,
                    std::ostream& log)
{
  auto doc = ReadAssetDocument(source);
  auto failures = ApplyCatalog(doc.behaviors(), catalog, settings.patch);
  if (!failures.empty())
    throw PatchError{source, std::move(failures)};
  WriteFile(target, FormatAssetDocument(doc, settings.writer), log);
} // PatchModelFile

std::size_t ProcessModelBehaviors(const fs::path& originalPackage,
                                  const fs::path& patchPackage,
                                  const Variant& variant,
                                  const Catalog& catalog,
                                  const Settings& settings,
                                  std::ostream& log)
{
  const auto sourceDir = AirplanePath(originalPackage, variant.airplaneId);
  const auto targetDir = AirplanePath(patchPackage, variant.airplaneId);

  auto count = std::size_t{0};
  for (const auto& modelDir: FindModelDirectories(sourceDir)) {
    const auto modelName = modelDir.filename();
    log << std::format("Processing model '{}'\n", modelName.string());

    CreateDirectory(targetDir / modelName, log);
    PatchModelFile(modelDir / variant.behaviorFile,
                   targetDir / modelName / variant.behaviorFile,
                   catalog, settings, log);
    ++count;
  }
  return count;
} // ProcessModelBehaviors

} // crj_fix
