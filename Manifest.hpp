/// @file
/// @brief MSFS package descriptors: manifest.json and layout.json.
#pragma once

#include <filesystem>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>
#include <cstdint>

namespace crj_fix {

struct Dependency {
  std::string name;
  std::string packageVersion;
}; // Dependency

struct Manifest {
  std::vector<Dependency> dependencies;
  std::string contentType;
  std::string title;
  std::string manufacturer;
  std::string creator;
  std::string packageVersion;
  std::string minimumGameVersion;
}; // Manifest

/// Reads the fields above; absent fields stay empty.
/// @throws PackageError on malformed JSON.
Manifest ParseManifest(std::string_view text, std::string_view origin);

/// @throws IoFailure, PackageError
Manifest LoadManifest(const std::filesystem::path& path);

std::string FormatManifest(const Manifest& manifest);

struct LayoutEntry {
  std::string path;   // relative to the package root, '/' separated
  std::uintmax_t size = 0;
  std::int64_t date = 0; // FILETIME: 100 ns ticks since 1601-01-01 UTC
}; // LayoutEntry

/// Every regular file below @p packageRoot except the descriptors
/// themselves, sorted by path.
std::vector<LayoutEntry> ScanLayout(const std::filesystem::path& packageRoot);

std::string FormatLayout(const std::vector<LayoutEntry>& entries);

/// Scan @p packageRoot and write <packageRoot>/layout.json.
void GenerateLayout(const std::filesystem::path& packageRoot,
                    std::ostream& log);

/// Write <packageRoot>/manifest.json.
void GenerateManifest(const std::filesystem::path& packageRoot,
                      const Manifest& manifest, std::ostream& log);

} // crj_fix
