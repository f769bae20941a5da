// kdlnum/driver/literal_reader.hpp - Read every numeric literal of a source
//
// Runs the literal lexer over a source and hands each literal to the parse
// cascade, collecting the values and any diagnostics.
//
#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "kdlnum/basic/diagnostic.hpp"
#include "kdlnum/basic/source_file.hpp"
#include "kdlnum/number/literal_parser.hpp"
#include "kdlnum/number/number_value.hpp"

namespace kdlnum
{

// Diagnostic codes
inline constexpr const char * k_diag_malformed_literal = "E001";
inline constexpr const char * k_diag_unsupported_magnitude = "E002";
inline constexpr const char * k_diag_unexpected_text = "E003";
inline constexpr const char * k_diag_unterminated_annotation = "E004";
inline constexpr const char * k_diag_dangling_annotation = "E005";
inline constexpr const char * k_diag_unterminated_comment = "W001";

/**
 * A successfully parsed literal.
 */
struct LiteralEntry
{
  /// Byte range of the literal (without its annotation)
  SourceRange range;

  /// Literal as written, underscores included
  std::string text;

  NumberValue value;
};

struct ReadResult
{
  std::vector<LiteralEntry> entries;
  DiagnosticBag diagnostics;

  [[nodiscard]] bool has_errors() const { return diagnostics.has_errors(); }
};

/**
 * Parse one literal as written in a document: `_` digit separators are
 * removed before the parse cascade runs.
 */
[[nodiscard]] LiteralParseResult parse_literal_word(
  std::string_view word, NumberValue::TypeAnnotation type = std::nullopt);

/**
 * Read all literals of a source.
 *
 * Literals that fail to parse are reported and skipped; reading always
 * continues to the end of the source.
 */
[[nodiscard]] ReadResult read_literals(const SourceFile & source);

}  // namespace kdlnum
