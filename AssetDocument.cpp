#include "AssetDocument.hpp"
#include "Errors.hpp"
#include "FileOps.hpp"
#include "xml/FragmentScanner.hpp"

#include <gsl-lite/gsl-lite.hpp>

#include <format>
#include <optional>

namespace crj_fix {

namespace {

constexpr auto ParseOptions = pugi::parse_default | pugi::parse_comments;
constexpr auto FormatOptions = pugi::format_indent
                             | pugi::format_no_declaration;

/// pugixml always emits '\n'; rewrite it to the configured line ending.
class NewlineWriter final : public pugi::xml_writer {
  std::string& _out;
  std::string_view _newline;
public:
  NewlineWriter(std::string& out, std::string_view newline)
    : _out{out}, _newline{newline} { }
  void write(const void* data, std::size_t size) override {
    auto chunk = std::string_view{static_cast<const char*>(data), size};
    for (auto ch: chunk) {
      if (ch == '\n')
        _out += _newline;
      else
        _out += ch;
    }
  }
}; // NewlineWriter

} // local

AssetDocument ParseAssetDocument(std::string_view text,
                                 const fs::path& origin)
{
  auto scanner = xml::FragmentScanner{text};
  auto info = std::optional<xml::ElementSpan>{};
  auto behaviors = std::optional<xml::ElementSpan>{};
  try {
    info = scanner.AdvanceTo(ModelInfoTag);
    if (!info)
      throw MalformedSourceDocument{origin, "missing <ModelInfo> element"};
    behaviors = scanner.AdvanceTo(ModelBehaviorsTag);
    if (!behaviors) {
      throw MalformedSourceDocument{origin,
                                    "missing <ModelBehaviors> element"};
    }
  }
  catch (const xml::ScanError& x) {
    throw MalformedSourceDocument{origin, x.what()};
  }

  auto doc = AssetDocument{};
  doc.header = std::string{info->markup};
  doc.body = std::make_unique<pugi::xml_document>();
  auto res = doc.body->load_buffer(behaviors->markup.data(),
                                   behaviors->markup.size(),
                                   ParseOptions, pugi::encoding_utf8);
  if (!res) {
    auto offset = behaviors->begin + static_cast<std::size_t>(res.offset);
    auto msg = std::format("<ModelBehaviors>: {} (line {})",
                           res.description(), xml::LineOf(text, offset));
    throw MalformedSourceDocument{origin, msg};
  }
  return doc;
} // ParseAssetDocument

AssetDocument ReadAssetDocument(const fs::path& path) {
  auto text = ReadTextFile(path);
  return ParseAssetDocument(text, path);
} // ReadAssetDocument

std::string FormatAssetDocument(const AssetDocument& doc,
                                const WriterSettings& settings)
{
  gsl_Expects(doc.body != nullptr);
  auto out = std::string{};
  out.reserve(doc.header.size() * 2);
  out += settings.newline;
  out += doc.header;
  out += settings.newline;
  auto writer = NewlineWriter{out, settings.newline};
  doc.body->save(writer, settings.indent.c_str(), FormatOptions,
                 pugi::encoding_utf8);
  return out;
} // FormatAssetDocument

void WriteAssetDocument(const fs::path& path, const AssetDocument& doc,
                        const WriterSettings& settings)
{
  WriteTextFile(path, FormatAssetDocument(doc, settings));
} // WriteAssetDocument

} // crj_fix
