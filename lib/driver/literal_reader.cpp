// kdlnum/driver/literal_reader.cpp - Literal reader implementation
//
#include "kdlnum/driver/literal_reader.hpp"

#include <fmt/core.h>

#include <optional>
#include <utility>

#include "kdlnum/syntax/lexer.hpp"

namespace kdlnum
{

namespace
{

using syntax::Token;
using syntax::TokenKind;

class LiteralReader
{
public:
  explicit LiteralReader(ReadResult & result) : result_(result) {}

  void on_token(const Token & tok)
  {
    switch (tok.kind) {
      case TokenKind::LineComment:
        // An annotation does not carry over to the next line.
        flush_annotation();
        break;
      case TokenKind::BlockComment:
        if (!tok.terminated) {
          result_.diagnostics.report_warning(tok.range, "unterminated block comment")
            .with_code(k_diag_unterminated_comment)
            .with_label("comment runs to the end of the input")
            .with_help("close the comment with `*/`");
        }
        break;
      case TokenKind::TypeAnnotation:
        on_annotation(tok);
        break;
      case TokenKind::NumberLiteral:
        on_number(tok);
        break;
      case TokenKind::Separator:
        flush_annotation();
        break;
      case TokenKind::Unknown:
        flush_annotation();
        result_.diagnostics
          .report_error(tok.range, fmt::format("unexpected text '{}'", tok.text))
          .with_code(k_diag_unexpected_text)
          .with_label("expected a number, a type annotation or a separator");
        break;
      case TokenKind::Eof:
        flush_annotation();
        break;
    }
  }

private:
  void on_annotation(const Token & tok)
  {
    flush_annotation();
    if (!tok.terminated) {
      result_.diagnostics.report_error(tok.range, "unterminated type annotation")
        .with_code(k_diag_unterminated_annotation)
        .with_label("missing `)`");
      return;
    }
    pending_ = tok;
  }

  void on_number(const Token & tok)
  {
    NumberValue::TypeAnnotation type;
    if (pending_) {
      type = std::string(pending_->text);
      pending_.reset();
    }

    LiteralParseResult parsed = parse_literal_word(tok.text, std::move(type));
    switch (parsed.status) {
      case LiteralStatus::Ok:
        result_.entries.push_back(LiteralEntry{tok.range, std::string(tok.text), *parsed.value});
        break;
      case LiteralStatus::NotANumber:
        result_.diagnostics.report_error(tok.range, "malformed numeric literal")
          .with_code(k_diag_malformed_literal)
          .with_label(parsed.message);
        break;
      case LiteralStatus::UnsupportedMagnitude:
        result_.diagnostics.report_error(tok.range, "numeric literal is too large")
          .with_code(k_diag_unsupported_magnitude)
          .with_label(parsed.message)
          .with_help("write the value in decimal or hexadecimal");
        break;
    }
  }

  /// Report an annotation that was not directly followed by a number.
  void flush_annotation()
  {
    if (!pending_) {
      return;
    }
    result_.diagnostics.report_error(pending_->range, "type annotation without a number")
      .with_code(k_diag_dangling_annotation)
      .with_label(fmt::format("`({})` must be followed by a numeric literal", pending_->text));
    pending_.reset();
  }

  ReadResult & result_;
  std::optional<Token> pending_;
};

}  // namespace

LiteralParseResult parse_literal_word(std::string_view word, NumberValue::TypeAnnotation type)
{
  const std::string text = syntax::strip_digit_separators(word);
  return parse_literal_text(text, std::move(type));
}

ReadResult read_literals(const SourceFile & source)
{
  ReadResult result;
  LiteralReader reader(result);

  syntax::Lexer lexer(source.content());
  for (const Token & tok : lexer.lex_all()) {
    reader.on_token(tok);
  }

  return result;
}

}  // namespace kdlnum
