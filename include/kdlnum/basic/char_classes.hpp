// kdlnum/basic/char_classes.hpp - Character class predicates for numeric literals
//
// Used by the literal lexer to decide when a numeric literal starts, and by
// the literal parser to validate digits before any conversion is attempted.
//
#pragma once

namespace kdlnum::chars
{

/**
 * Check if the character is valid at the beginning of a numeric value.
 *
 * Accepts a sign or a decimal digit.
 */
[[nodiscard]] constexpr bool is_valid_numeric_start(char c) noexcept
{
  switch (c) {
    case '+':
    case '-':
    case '0':
    case '1':
    case '2':
    case '3':
    case '4':
    case '5':
    case '6':
    case '7':
    case '8':
    case '9':
      return true;
    default:
      return false;
  }
}

[[nodiscard]] constexpr bool is_valid_decimal_char(char c) noexcept { return c >= '0' && c <= '9'; }

[[nodiscard]] constexpr bool is_valid_hex_char(char c) noexcept
{
  return is_valid_decimal_char(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

[[nodiscard]] constexpr bool is_valid_octal_char(char c) noexcept { return c >= '0' && c <= '7'; }

[[nodiscard]] constexpr bool is_valid_binary_char(char c) noexcept { return c == '0' || c == '1'; }

/**
 * Check if the character is a digit in the given radix.
 *
 * Radices other than 2, 8, 10 and 16 have no digits.
 */
[[nodiscard]] constexpr bool is_valid_digit(char c, int radix) noexcept
{
  switch (radix) {
    case 2:
      return is_valid_binary_char(c);
    case 8:
      return is_valid_octal_char(c);
    case 10:
      return is_valid_decimal_char(c);
    case 16:
      return is_valid_hex_char(c);
    default:
      return false;
  }
}

/// Radix prefix marker following a leading '0' (`x`, `o`, `b`), or 0 if none.
[[nodiscard]] constexpr int radix_for_prefix(char marker) noexcept
{
  switch (marker) {
    case 'x':
      return 16;
    case 'o':
      return 8;
    case 'b':
      return 2;
    default:
      return 0;
  }
}

}  // namespace kdlnum::chars
