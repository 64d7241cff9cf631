#include "Manifest.hpp"
#include "Errors.hpp"
#include "FileOps.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <format>
#include <ostream>
#include <ratio>
#include <system_error>
#include <utility>

namespace crj_fix {

using json = nlohmann::json;
using ordered_json = nlohmann::ordered_json;

namespace {

constexpr char ManifestFile[] = "manifest.json";
constexpr char LayoutFile[]   = "layout.json";

/// 1601-01-01 to 1970-01-01 in 100 ns ticks.
constexpr auto FileTimeEpochDelta = std::int64_t{116'444'736'000'000'000};

using FileTimeTicks = std::chrono::duration<std::int64_t,
                                            std::ratio<1, 10'000'000>>;

std::int64_t ToFileTime(fs::file_time_type t) {
  auto sys = std::chrono::file_clock::to_sys(t);
  auto since1970 = sys.time_since_epoch();
  return std::chrono::duration_cast<FileTimeTicks>(since1970).count()
       + FileTimeEpochDelta;
} // ToFileTime

std::string AsString(const json& v, const char* key) {
  auto it = v.find(key);
  return (it != v.end() && it->is_string()) ? it->get<std::string>()
                                            : std::string{};
} // AsString

std::string Serialize(const ordered_json& root)
  { return root.dump(2) + "\n"; }

} // local

Manifest ParseManifest(std::string_view text, std::string_view origin) {
  auto root = json{};
  try {
    root = json::parse(text.begin(), text.end());
  }
  catch (const json::parse_error& x) {
    throw PackageError{std::format("{}: JSON parse error: {}", origin,
                                   x.what())};
  }
  if (!root.is_object())
    throw PackageError{std::format("{}: top level is not an object", origin)};

  auto out = Manifest{};
  auto deps = root.find("dependencies");
  if (deps != root.end() && deps->is_array()) {
    for (const auto& dep: *deps) {
      out.dependencies.push_back(Dependency{AsString(dep, "name"),
                                            AsString(dep, "package_version")});
    }
  }
  out.contentType        = AsString(root, "content_type");
  out.title              = AsString(root, "title");
  out.manufacturer       = AsString(root, "manufacturer");
  out.creator            = AsString(root, "creator");
  out.packageVersion     = AsString(root, "package_version");
  out.minimumGameVersion = AsString(root, "minimum_game_version");
  return out;
} // ParseManifest

Manifest LoadManifest(const fs::path& path) {
  auto text = ReadTextFile(path);
  return ParseManifest(text, path.string());
} // LoadManifest

std::string FormatManifest(const Manifest& manifest) {
  auto deps = ordered_json::array();
  for (const auto& d: manifest.dependencies)
    deps.push_back(ordered_json{{"name", d.name},
                                {"package_version", d.packageVersion}});

  auto root = ordered_json::object();
  root["dependencies"]         = deps;
  root["content_type"]         = manifest.contentType;
  root["title"]                = manifest.title;
  root["manufacturer"]         = manifest.manufacturer;
  root["creator"]              = manifest.creator;
  root["package_version"]      = manifest.packageVersion;
  root["minimum_game_version"] = manifest.minimumGameVersion;
  root["release_notes"]["neutral"]["LastUpdate"]   = "";
  root["release_notes"]["neutral"]["OlderHistory"] = "";
  return Serialize(root);
} // FormatManifest

std::vector<LayoutEntry> ScanLayout(const fs::path& packageRoot) {
  auto ec = std::error_code{};
  auto it = fs::recursive_directory_iterator{packageRoot, ec};
  if (ec) {
    throw IoFailure{packageRoot,
                    std::format("cannot list directory ({})", ec.message())};
  }

  auto out = std::vector<LayoutEntry>{};
  for (; it != fs::recursive_directory_iterator{}; it.increment(ec)) {
    if (ec)
      break;
    const auto& entry = *it;
    auto typeEc = std::error_code{};
    if (!entry.is_regular_file(typeEc))
      continue;
    auto rel = fs::relative(entry.path(), packageRoot).generic_string();
    if (rel == LayoutFile || rel == ManifestFile)
      continue;
    auto statEc = std::error_code{};
    auto size = entry.file_size(statEc);
    auto time = fs::file_time_type{};
    if (!statEc)
      time = entry.last_write_time(statEc);
    if (statEc) {
      throw IoFailure{entry.path(),
                      std::format("cannot stat file ({})", statEc.message())};
    }
    out.push_back(LayoutEntry{std::move(rel), size, ToFileTime(time)});
  }
  if (ec) {
    throw IoFailure{packageRoot,
                    std::format("cannot list directory ({})", ec.message())};
  }
  std::ranges::sort(out, {}, &LayoutEntry::path);
  return out;
} // ScanLayout

std::string FormatLayout(const std::vector<LayoutEntry>& entries) {
  auto content = ordered_json::array();
  for (const auto& e: entries) {
    content.push_back(ordered_json{{"path", e.path}, {"size", e.size},
                                   {"date", e.date}});
  }
  return Serialize(ordered_json{{"content", content}});
} // FormatLayout

void GenerateLayout(const fs::path& packageRoot, std::ostream& log) {
  log << "Creating package layout\n";
  auto text = FormatLayout(ScanLayout(packageRoot));
  WriteFile(packageRoot / LayoutFile, text, log);
} // GenerateLayout

void GenerateManifest(const fs::path& packageRoot, const Manifest& manifest,
                      std::ostream& log)
{
  log << "Creating package manifest\n";
  WriteFile(packageRoot / ManifestFile, FormatManifest(manifest), log);
} // GenerateManifest

} // crj_fix
