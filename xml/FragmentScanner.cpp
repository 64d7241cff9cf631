#include "FragmentScanner.hpp"

#include <gsl-lite/gsl-lite.hpp>

#include <algorithm>
#include <format>
#include <vector>
#include <cctype>

namespace crj_fix::xml {

namespace {

constexpr std::string_view Utf8Bom = "\xEF\xBB\xBF";

bool IsSpace(char ch) {
  return std::isspace(static_cast<unsigned char>(ch)) != 0;
}

bool EndsName(char ch) {
  return IsSpace(ch) || ch == '/' || ch == '>' || ch == '<';
}

} // local

const char* Name(Token::Kind kind) noexcept {
  switch (kind) {
    case Token::Kind::Text:                  return "Text";
    case Token::Kind::StartTag:              return "StartTag";
    case Token::Kind::EmptyTag:              return "EmptyTag";
    case Token::Kind::EndTag:                return "EndTag";
    case Token::Kind::Comment:               return "Comment";
    case Token::Kind::CData:                 return "CData";
    case Token::Kind::ProcessingInstruction: return "ProcessingInstruction";
    case Token::Kind::DocType:               return "DocType";
    default: return nullptr;
  }
} // Name(Token::Kind)

std::size_t LineOf(std::string_view text, std::size_t offset) {
  gsl_Expects(offset <= text.size());
  auto head = text.substr(0, offset);
  return 1 + static_cast<std::size_t>(std::ranges::count(head, '\n'));
} // LineOf

FragmentScanner::FragmentScanner(std::string_view text)
  : _text{text}
{
  if (_text.starts_with(Utf8Bom))
    _pos = Utf8Bom.size();
} // FragmentScanner::ctor

void FragmentScanner::Fail(std::size_t offset, std::string_view what) const {
  throw ScanError{std::format("{} (line {})", what, LineOf(_text, offset)),
                  offset};
} // Fail

Token FragmentScanner::Delimited(Token::Kind kind, std::string_view close,
                                 std::size_t skip)
{
  auto begin = _pos;
  auto e = _text.find(close, _pos + skip);
  if (e == std::string_view::npos)
    Fail(begin, std::format("unterminated {}", Name(kind)));
  _pos = e + close.size();
  return Token{kind, {}, begin, _pos};
} // Delimited

std::string_view FragmentScanner::ReadName(std::size_t from) const {
  auto p = from;
  while (p < _text.size() && !EndsName(_text[p]))
    ++p;
  if (p == from)
    Fail(from, "missing tag name");
  return _text.substr(from, p - from);
} // ReadName

Token FragmentScanner::ReadDocType() {
  auto begin = _pos;
  auto depth = 0;
  for (auto p = _pos + 2; p < _text.size(); ++p) {
    switch (_text[p]) {
      case '[': ++depth; break;
      case ']': --depth; break;
      case '>':
        if (depth <= 0) {
          _pos = p + 1;
          return Token{Token::Kind::DocType, {}, begin, _pos};
        }
        break;
      default: break;
    }
  }
  Fail(begin, "unterminated DocType");
} // ReadDocType

Token FragmentScanner::ReadEndTag() {
  auto begin = _pos;
  auto name = ReadName(_pos + 2);
  auto p = _pos + 2 + name.size();
  while (p < _text.size() && IsSpace(_text[p]))
    ++p;
  if (p >= _text.size() || _text[p] != '>')
    Fail(begin, std::format("unterminated end tag </{}>", name));
  _pos = p + 1;
  return Token{Token::Kind::EndTag, name, begin, _pos};
} // ReadEndTag

Token FragmentScanner::ReadStartTag() {
  auto begin = _pos;
  auto name = ReadName(_pos + 1);
  auto quote = '\0';
  auto p = _pos + 1 + name.size();
  for (; p < _text.size(); ++p) {
    auto ch = _text[p];
    if (quote != '\0') {
      if (ch == quote)
        quote = '\0';
    }
    else if (ch == '"' || ch == '\'') {
      quote = ch;
    }
    else if (ch == '>') {
      break;
    }
    else if (ch == '<') {
      Fail(p, std::format("unexpected '<' inside start tag <{}>", name));
    }
  }
  if (p >= _text.size())
    Fail(begin, std::format("unterminated start tag <{}>", name));
  auto kind = (_text[p - 1] == '/') ? Token::Kind::EmptyTag
                                     : Token::Kind::StartTag;
  _pos = p + 1;
  return Token{kind, name, begin, _pos};
} // ReadStartTag

std::optional<Token> FragmentScanner::Next() {
  if (_pos >= _text.size())
    return std::nullopt;

  if (_text[_pos] != '<') {
    auto begin = _pos;
    auto lt = _text.find('<', _pos);
    _pos = (lt == std::string_view::npos) ? _text.size() : lt;
    return Token{Token::Kind::Text, {}, begin, _pos};
  }

  auto rest = _text.substr(_pos);
  if (rest.starts_with("<!--"))
    return Delimited(Token::Kind::Comment, "-->", 4);
  if (rest.starts_with("<![CDATA["))
    return Delimited(Token::Kind::CData, "]]>", 9);
  if (rest.starts_with("<?"))
    return Delimited(Token::Kind::ProcessingInstruction, "?>", 2);
  if (rest.starts_with("<!"))
    return ReadDocType();
  if (rest.starts_with("</"))
    return ReadEndTag();
  return ReadStartTag();
} // Next

std::optional<ElementSpan> FragmentScanner::AdvanceTo(std::string_view name) {
  auto open = std::vector<std::string_view>{};
  auto begin = std::optional<std::size_t>{};

  auto span = [this, name](std::size_t b, std::size_t e) {
    return ElementSpan{name, b, e, _text.substr(b, e - b)};
  };

  while (auto tok = Next()) {
    switch (tok->kind) {
      case Token::Kind::StartTag:
        if (open.empty() && tok->name == name)
          begin = tok->begin;
        open.push_back(tok->name);
        break;
      case Token::Kind::EmptyTag:
        if (open.empty() && tok->name == name)
          return span(tok->begin, tok->end);
        break;
      case Token::Kind::EndTag:
        if (open.empty()) {
          _pos = tok->begin;
          return std::nullopt;
        }
        if (open.back() != tok->name) {
          Fail(tok->begin,
               std::format("mismatched end tag </{}>, expected </{}>",
                           tok->name, open.back()));
        }
        open.pop_back();
        if (open.empty() && begin)
          return span(*begin, tok->end);
        break;
      default:
        break;
    }
  }

  if (!open.empty())
    Fail(_text.size(), std::format("unterminated element <{}>", open.back()));
  return std::nullopt;
} // AdvanceTo

} // crj_fix::xml
