#pragma once

#include <cstdint>
#include <string_view>

#include "kdlnum/basic/source_file.hpp"

namespace kdlnum::syntax
{

enum class TokenKind : uint8_t {
  Eof,
  Unknown,

  // Comments are emitted so tools can preserve user text
  LineComment,   // // ...
  BlockComment,  // /* ... */

  NumberLiteral,   // token.text is the literal as written (underscores kept)
  TypeAnnotation,  // token.text is the text between the parentheses

  Separator,  // , or ;
};

struct Token
{
  TokenKind kind = TokenKind::Unknown;
  SourceRange range;      // byte range in the input (including parentheses)
  std::string_view text;  // slice view (for TypeAnnotation: interior)

  // False for a block comment or type annotation missing its closing delimiter
  bool terminated = true;

  [[nodiscard]] uint32_t begin() const noexcept { return range.begin(); }
  [[nodiscard]] uint32_t end() const noexcept { return range.end(); }
};

[[nodiscard]] constexpr std::string_view to_string(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::Eof:
      return "<eof>";
    case TokenKind::Unknown:
      return "<unknown>";
    case TokenKind::LineComment:
      return "<line_comment>";
    case TokenKind::BlockComment:
      return "<block_comment>";
    case TokenKind::NumberLiteral:
      return "number";
    case TokenKind::TypeAnnotation:
      return "type annotation";
    case TokenKind::Separator:
      return "separator";
  }
  return "<unknown>";
}

}  // namespace kdlnum::syntax
