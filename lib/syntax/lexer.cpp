#include "kdlnum/syntax/lexer.hpp"

#include "kdlnum/basic/char_classes.hpp"

namespace kdlnum::syntax
{
namespace
{

bool is_space(char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; }
bool is_separator(char c) { return c == ',' || c == ';'; }

}  // namespace

bool Lexer::starts_with(std::string_view s) const noexcept
{
  return src_.size() >= pos_ + s.size() && src_.substr(pos_, s.size()) == s;
}

bool Lexer::at_word_boundary() const noexcept
{
  return eof() || is_space(peek()) || is_separator(peek()) || starts_with("//") ||
         starts_with("/*");
}

void Lexer::skip_word()
{
  while (!at_word_boundary()) {
    advance(1);
  }
}

void Lexer::skip_whitespace()
{
  while (!eof() && is_space(peek())) {
    advance(1);
  }
}

Token Lexer::make_token(TokenKind kind, uint32_t start) const noexcept
{
  const auto end = static_cast<uint32_t>(pos_);
  Token t;
  t.kind = kind;
  t.range = SourceRange(start, end);
  t.text = src_.substr(start, end - start);
  return t;
}

Token Lexer::lex_line_comment()
{
  const auto start = static_cast<uint32_t>(pos_);
  advance(2);
  while (!eof() && peek() != '\n') {
    advance(1);
  }
  Token t = make_token(TokenKind::LineComment, start);
  t.text = {};  // tools should use t.range to slice the input
  return t;
}

Token Lexer::lex_block_comment()
{
  const auto start = static_cast<uint32_t>(pos_);
  advance(2);
  while (!eof() && !starts_with("*/")) {
    advance(1);
  }

  // Unterminated block comment: consume to EOF and flag the token.
  const bool terminated = starts_with("*/");
  if (terminated) {
    advance(2);
  }

  Token t = make_token(TokenKind::BlockComment, start);
  t.text = {};
  t.terminated = terminated;
  return t;
}

Token Lexer::lex_number()
{
  const auto start = static_cast<uint32_t>(pos_);

  // A literal runs to the next word boundary, so `1-2` or `0xff(u8)` stays
  // one (malformed) literal; the parser decides whether the text is a number.
  advance(1);
  skip_word();

  return make_token(TokenKind::NumberLiteral, start);
}

Token Lexer::lex_type_annotation()
{
  const auto start = static_cast<uint32_t>(pos_);
  // opening parenthesis
  advance(1);

  const auto payload_start = static_cast<uint32_t>(pos_);
  while (!eof() && peek() != ')' && peek() != '\n' && peek() != '\r') {
    advance(1);
  }
  const auto payload_end = static_cast<uint32_t>(pos_);

  const bool terminated = peek() == ')';
  if (terminated) {
    advance(1);
  }

  Token t = make_token(TokenKind::TypeAnnotation, start);
  t.text = src_.substr(payload_start, payload_end - payload_start);
  t.terminated = terminated;
  return t;
}

Token Lexer::lex_unknown()
{
  const auto start = static_cast<uint32_t>(pos_);
  // Consume the whole word so one stray identifier yields one token.
  advance(1);
  while (!eof() && peek() != '(' && !at_word_boundary()) {
    advance(1);
  }
  return make_token(TokenKind::Unknown, start);
}

Token Lexer::next_token()
{
  skip_whitespace();

  if (eof()) {
    const auto at = static_cast<uint32_t>(src_.size());
    Token t;
    t.kind = TokenKind::Eof;
    t.range = SourceRange(at, at);
    return t;
  }

  if (starts_with("//")) {
    return lex_line_comment();
  }
  if (starts_with("/*")) {
    return lex_block_comment();
  }

  const char c = peek();

  if (c == '(') {
    return lex_type_annotation();
  }
  if (is_separator(c)) {
    const auto start = static_cast<uint32_t>(pos_);
    advance(1);
    return make_token(TokenKind::Separator, start);
  }

  // A lone sign is not a number.
  if (chars::is_valid_numeric_start(c)) {
    const bool signed_start = c == '+' || c == '-';
    if (!signed_start || chars::is_valid_decimal_char(peek(1))) {
      return lex_number();
    }
  }

  return lex_unknown();
}

std::vector<Token> Lexer::lex_all()
{
  std::vector<Token> out;
  while (true) {
    const Token t = next_token();
    out.push_back(t);
    if (t.kind == TokenKind::Eof) {
      break;
    }
  }
  return out;
}

std::string strip_digit_separators(std::string_view literal)
{
  std::string out;
  out.reserve(literal.size());
  for (const char c : literal) {
    if (c != '_') {
      out.push_back(c);
    }
  }
  return out;
}

}  // namespace kdlnum::syntax
