/// @file
/// @brief Streaming tokenizer for XML text that is not a single document.
///
/// Model behavior files carry two sibling root elements (<ModelInfo> and
/// <ModelBehaviors>), which every DOM parser rejects. The scanner walks the
/// raw text token by token and hands back byte ranges of whole elements, so
/// callers can keep one element verbatim and give another to a real parser.
///
/// Notes:
/// - Offsets index the original text (a leading UTF-8 BOM is skipped).
/// - No entity decoding and no well-formedness checks beyond tag nesting.
/// - Attribute values may contain '>' and '/'.
#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <cstddef>

namespace crj_fix::xml {

struct Token {
  enum class Kind {
    Text, StartTag, EmptyTag, EndTag, Comment, CData,
    ProcessingInstruction, DocType
  };
  Kind kind = Kind::Text;
  std::string_view name;  // tags only
  std::size_t begin = 0;  // offset of '<' (or first text byte)
  std::size_t end   = 0;  // one past the last byte
}; // Token

const char* Name(Token::Kind kind) noexcept;

/// Outer markup of one element, start tag through end tag.
struct ElementSpan {
  std::string_view name;
  std::size_t begin = 0;
  std::size_t end   = 0;
  std::string_view markup;
}; // ElementSpan

class ScanError : public std::runtime_error {
  std::size_t _offset;
public:
  ScanError(const std::string& what, std::size_t offset)
    : std::runtime_error{what}, _offset{offset} { }
  std::size_t offset() const noexcept { return _offset; }
}; // ScanError

class FragmentScanner {
  std::string_view _text;
  std::size_t _pos = 0;

  [[noreturn]] void Fail(std::size_t offset, std::string_view what) const;
  Token Delimited(Token::Kind kind, std::string_view close, std::size_t skip);
  std::string_view ReadName(std::size_t from) const;
  Token ReadDocType();
  Token ReadEndTag();
  Token ReadStartTag();

public:
  explicit FragmentScanner(std::string_view text);

  /// @return the next token, or nullopt at end of input.
  /// @throws ScanError on unterminated markup.
  std::optional<Token> Next();

  /// Skip forward to the next element named @p name at the current nesting
  /// level and consume it whole. Elements with other names are skipped with
  /// their subtrees. Stops (returning nullopt) at end of input or at an end
  /// tag that closes an enclosing element; that end tag is not consumed.
  /// @throws ScanError on mismatched or unterminated tags.
  std::optional<ElementSpan> AdvanceTo(std::string_view name);

  std::size_t position() const noexcept { return _pos; }
  std::string_view text() const noexcept { return _text; }
}; // FragmentScanner

/// 1-based line number of @p offset in @p text.
std::size_t LineOf(std::string_view text, std::size_t offset);

} // crj_fix::xml
