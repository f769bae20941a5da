// kdlnum/number/literal_parser.hpp - Overflow-aware numeric literal parsing
//
// Turns the digit text of a literal into the narrowest NumberValue able to
// hold it: Float64 for decimal literals with a point or exponent, otherwise
// Int32, then Int64, then BigInt.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "kdlnum/number/number_value.hpp"

namespace kdlnum
{

// ============================================================================
// Literal Text Helpers
// ============================================================================

/**
 * Literal text split into its radix and digit part.
 */
struct LiteralText
{
  int radix = 10;
  std::string_view digits;  ///< text after the `0x` / `0o` / `0b` prefix
};

/**
 * Detect a `0x`, `0o` or `0b` prefix. Any other text is radix 10 and is
 * returned unchanged.
 */
[[nodiscard]] LiteralText split_radix_prefix(std::string_view text) noexcept;

/// Single scan for `.` and `e`/`E`.
[[nodiscard]] LexicalFlags scan_lexical_flags(std::string_view digits) noexcept;

// ============================================================================
// Parse Result
// ============================================================================

enum class LiteralStatus : uint8_t {
  Ok,
  NotANumber,            ///< empty or malformed text
  UnsupportedMagnitude,  ///< beyond Int64 in a radix BigInt cannot carry
};

struct LiteralParseResult
{
  LiteralStatus status = LiteralStatus::NotANumber;

  /// Parsed value (only set if status == Ok)
  std::optional<NumberValue> value;

  /// Human-readable reason (empty on success)
  std::string message;

  [[nodiscard]] bool success() const noexcept { return status == LiteralStatus::Ok; }

  static LiteralParseResult ok(NumberValue v)
  {
    LiteralParseResult r;
    r.status = LiteralStatus::Ok;
    r.value = std::move(v);
    return r;
  }

  static LiteralParseResult not_a_number(std::string msg)
  {
    LiteralParseResult r;
    r.status = LiteralStatus::NotANumber;
    r.message = std::move(msg);
    return r;
  }

  static LiteralParseResult unsupported_magnitude(std::string msg)
  {
    LiteralParseResult r;
    r.status = LiteralStatus::UnsupportedMagnitude;
    r.message = std::move(msg);
    return r;
  }
};

// ============================================================================
// Parsing
// ============================================================================

/**
 * Run the parse cascade on prefix-stripped digits.
 *
 * Decimal digits may carry one leading `+` or `-`; non-decimal digits may
 * carry a leading `+` only. Never throws for malformed or oversized input.
 *
 * @param digits Literal text with any radix prefix removed
 * @param radix 2, 8, 10 or 16
 * @param flags Lexical flags of the literal (consulted for radix 10 only)
 * @param type Type annotation to attach to the value
 * @throws NumberError (InvalidRadix) if radix is not supported
 */
[[nodiscard]] LiteralParseResult parse_literal(
  std::string_view digits, int radix, LexicalFlags flags,
  NumberValue::TypeAnnotation type = std::nullopt);

/**
 * Parse complete literal text: prefix detection, flag scan, then the cascade.
 */
[[nodiscard]] LiteralParseResult parse_literal_text(
  std::string_view text, NumberValue::TypeAnnotation type = std::nullopt);

}  // namespace kdlnum
