#include "Modification.hpp"
#include "Errors.hpp"
#include "FileOps.hpp"

#include <nlohmann/json.hpp>

#include <format>
#include <string>

namespace crj_fix {

using json = nlohmann::json;

namespace {

[[noreturn]] void Fail(std::string_view origin, std::string_view msg) {
  throw CatalogError{std::format("{}: {}", origin, msg)};
} // Fail

std::string RequireString(const json& entry, const char* key,
                          std::size_t index, std::string_view origin)
{
  auto it = entry.find(key);
  if (it == entry.end() || it->is_null())
    Fail(origin, std::format("Modifications[{}]: missing \"{}\"", index, key));
  if (!it->is_string())
    Fail(origin, std::format("Modifications[{}]: \"{}\" is not a string",
                             index, key));
  auto s = it->get<std::string>();
  if (s.empty())
    Fail(origin, std::format("Modifications[{}]: \"{}\" is empty", index, key));
  return s;
} // RequireString

} // local

Catalog ParseCatalog(std::string_view text, std::string_view origin) {
  auto root = json{};
  try {
    root = json::parse(text.begin(), text.end());
  }
  catch (const json::parse_error& x) {
    Fail(origin, std::format("JSON parse error: {}", x.what()));
  }

  if (!root.is_object())
    Fail(origin, "top level is not an object");
  auto list = root.find("Modifications");
  if (list == root.end() || !list->is_array())
    Fail(origin, "\"Modifications\" is missing or not an array");

  auto out = Catalog{};
  out.reserve(list->size());
  for (auto i = std::size_t{0}; i != list->size(); ++i) {
    const auto& entry = (*list)[i];
    if (!entry.is_object())
      Fail(origin, std::format("Modifications[{}] is not an object", i));
    out.push_back(Modification{
      .buttonId       = RequireString(entry, "ButtonId",       i, origin),
      .knobId         = RequireString(entry, "KnobId",         i, origin),
      .knobAnimName   = RequireString(entry, "KnobAnimName",   i, origin),
      .knobChangeName = RequireString(entry, "KnobChangeName", i, origin),
      .pushAnimName   = RequireString(entry, "PushAnimName",   i, origin),
      .pushName       = RequireString(entry, "PushName",       i, origin),
    });
  }
  return out;
} // ParseCatalog

Catalog LoadCatalog(const std::filesystem::path& path) {
  auto text = ReadTextFile(path);
  return ParseCatalog(text, path.string());
} // LoadCatalog

} // crj_fix
