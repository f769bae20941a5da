#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "kdlnum/syntax/token.hpp"

namespace kdlnum::syntax
{

class Lexer
{
public:
  explicit Lexer(std::string_view src) : src_(src) {}

  [[nodiscard]] std::vector<Token> lex_all();

private:
  [[nodiscard]] Token next_token();

  [[nodiscard]] bool eof() const noexcept { return pos_ >= src_.size(); }
  [[nodiscard]] char peek(size_t lookahead = 0) const noexcept
  {
    const size_t i = pos_ + lookahead;
    return (i < src_.size()) ? src_[i] : '\0';
  }
  [[nodiscard]] bool starts_with(std::string_view s) const noexcept;

  void advance(size_t n = 1) noexcept { pos_ += n; }

  void skip_whitespace();

  [[nodiscard]] bool at_word_boundary() const noexcept;
  void skip_word();

  [[nodiscard]] Token lex_line_comment();
  [[nodiscard]] Token lex_block_comment();
  [[nodiscard]] Token lex_number();
  [[nodiscard]] Token lex_type_annotation();
  [[nodiscard]] Token lex_unknown();

  [[nodiscard]] Token make_token(TokenKind kind, uint32_t start) const noexcept;

  std::string_view src_;
  size_t pos_ = 0;
};

/// Literal text with `_` digit separators removed (`1_000` -> `1000`).
[[nodiscard]] std::string strip_digit_separators(std::string_view literal);

}  // namespace kdlnum::syntax
