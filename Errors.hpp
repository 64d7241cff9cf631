/// @file
/// @brief Exception types thrown by the patcher. Everything derives from
///        crj_fix::Error so the front end can report with one handler.
#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <cstddef>

namespace crj_fix {

namespace fs = std::filesystem;

class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
}; // Error

/// A required root element is missing, or the markup is broken.
class MalformedSourceDocument : public Error {
  fs::path _path;
public:
  MalformedSourceDocument(const fs::path& path, std::string_view what)
    : Error{"malformed model behavior file '" + path.string() + "': "
            + std::string{what}}
    , _path{path}
    { }
  const fs::path& path() const noexcept { return _path; }
}; // MalformedSourceDocument

/// An ID did not resolve to exactly one node.
class NodeLookupError : public Error {
  std::string _id;
public:
  NodeLookupError(std::string_view id, const std::string& what)
    : Error{what}, _id{id} { }
  const std::string& id() const noexcept { return _id; }
}; // NodeLookupError

class NodeNotFound : public NodeLookupError {
public:
  using NodeLookupError::NodeLookupError;
}; // NodeNotFound

class AmbiguousNode : public NodeLookupError {
  std::size_t _count;
public:
  AmbiguousNode(std::string_view id, const std::string& what,
                std::size_t count)
    : NodeLookupError{id, what}, _count{count} { }
  std::size_t count() const noexcept { return _count; }
}; // AmbiguousNode

/// The button to delete is the knob or one of its ancestors.
class OverlappingNodes : public NodeLookupError {
public:
  using NodeLookupError::NodeLookupError;
}; // OverlappingNodes

class IoFailure : public Error {
  fs::path _path;
public:
  IoFailure(const fs::path& path, std::string_view what)
    : Error{std::string{what} + ": '" + path.string() + "'"}
    , _path{path}
    { }
  const fs::path& path() const noexcept { return _path; }
}; // IoFailure

class CatalogError : public Error {
public:
  using Error::Error;
}; // CatalogError

class PackageError : public Error {
public:
  using Error::Error;
}; // PackageError

/// One modification record that could not be applied to one document.
struct PatchFailure {
  std::size_t record = 0;  // index into the catalog
  std::string id;          // offending ButtonId/KnobId
  std::string message;
}; // PatchFailure

/// A model's catalog did not apply cleanly; nothing was written for it.
class PatchError : public Error {
  fs::path _path;
  std::vector<PatchFailure> _failures;
  static std::string Describe(const fs::path& path,
                              const std::vector<PatchFailure>& failures);
public:
  PatchError(const fs::path& path, std::vector<PatchFailure> failures)
    : Error{Describe(path, failures)}
    , _path{path}
    , _failures{std::move(failures)}
    { }
  const fs::path& path() const noexcept { return _path; }
  const std::vector<PatchFailure>& failures() const noexcept
    { return _failures; }
}; // PatchError

inline std::string
PatchError::Describe(const fs::path& path,
                     const std::vector<PatchFailure>& failures)
{
  auto what = std::string{"failed to patch '"} + path.string() + "': ";
  what += std::to_string(failures.size());
  what += (failures.size() == 1) ? " record failed" : " records failed";
  for (const auto& f: failures) {
    what += "\n  record ";
    what += std::to_string(f.record);
    what += " (";
    what += f.id;
    what += "): ";
    what += f.message;
  }
  return what;
} // PatchError::Describe

} // crj_fix
