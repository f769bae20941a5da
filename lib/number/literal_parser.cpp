// kdlnum/number/literal_parser.cpp - Parse cascade implementation
//
#include "kdlnum/number/literal_parser.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <type_traits>

#include "kdlnum/basic/char_classes.hpp"
#include "kdlnum/number/number_error.hpp"

namespace kdlnum
{

namespace
{

// ============================================================================
// Conversion steps
// ============================================================================

enum class ConversionStatus : uint8_t {
  Ok,
  Overflow,
  Malformed,
};

template <typename T>
struct Conversion
{
  ConversionStatus status = ConversionStatus::Malformed;
  T value{};
};

/// Sign and digits of an integer literal, validated for its radix.
struct IntegerText
{
  bool negative = false;
  std::string_view digits;
};

std::optional<IntegerText> split_integer_sign(std::string_view text, int radix)
{
  IntegerText out;
  if (!text.empty() && (text.front() == '+' || text.front() == '-')) {
    // Non-decimal radices are unsigned magnitudes.
    if (text.front() == '-' && radix != 10) {
      return std::nullopt;
    }
    out.negative = text.front() == '-';
    text.remove_prefix(1);
  }

  if (text.empty()) {
    return std::nullopt;
  }
  const bool all_digits = std::all_of(
    text.begin(), text.end(), [radix](char c) { return chars::is_valid_digit(c, radix); });
  if (!all_digits) {
    return std::nullopt;
  }

  out.digits = text;
  return out;
}

template <typename T>
Conversion<T> convert_integer(const IntegerText & text, int radix)
{
  using U = std::make_unsigned_t<T>;

  U magnitude = 0;
  const char * begin = text.digits.data();
  const char * end = text.digits.data() + text.digits.size();
  auto [ptr, ec] = std::from_chars(begin, end, magnitude, radix);
  if (ec == std::errc::result_out_of_range) {
    return {ConversionStatus::Overflow, T{}};
  }
  if (ec != std::errc{} || ptr != end) {
    return {ConversionStatus::Malformed, T{}};
  }

  const auto max_positive = static_cast<U>(std::numeric_limits<T>::max());
  if (!text.negative) {
    // For radix 2/8/16 this is the sign-bit check: such literals never turn negative.
    if (magnitude > max_positive) {
      return {ConversionStatus::Overflow, T{}};
    }
    return {ConversionStatus::Ok, static_cast<T>(magnitude)};
  }

  // Allow the minimum value, whose magnitude is one past max_positive.
  const U max_abs = max_positive + 1U;
  if (magnitude > max_abs) {
    return {ConversionStatus::Overflow, T{}};
  }
  if (magnitude == max_abs) {
    return {ConversionStatus::Ok, std::numeric_limits<T>::min()};
  }
  return {ConversionStatus::Ok, static_cast<T>(-static_cast<T>(magnitude))};
}

Conversion<mpz_class> convert_bigint(const IntegerText & text, int radix)
{
  std::string digits;
  if (radix == 16) {
    // A guaranteed-zero leading digit: the high bit of the first hex digit
    // must never be taken as a sign.
    digits.reserve(text.digits.size() + 1);
    digits.push_back('0');
  }
  digits.append(text.digits.data(), text.digits.size());

  mpz_class value;
  if (value.set_str(digits, radix) != 0) {
    return {ConversionStatus::Malformed, mpz_class{}};
  }
  if (text.negative) {
    value = -value;
  }
  return {ConversionStatus::Ok, std::move(value)};
}

bool is_decimal_float_char(char c)
{
  return chars::is_valid_decimal_char(c) || c == '.' || c == 'e' || c == 'E' || c == '+' ||
         c == '-';
}

Conversion<double> convert_double(std::string_view text)
{
  // Restricting the alphabet keeps strtod away from hex floats, inf/nan and
  // leading whitespace.
  if (text.empty() || !std::all_of(text.begin(), text.end(), is_decimal_float_char)) {
    return {ConversionStatus::Malformed, 0.0};
  }

  // strtod requires a null-terminated string.
  const std::string tmp(text);
  char * end = nullptr;
  errno = 0;
  const double v = std::strtod(tmp.c_str(), &end);
  if (end != tmp.c_str() + tmp.size()) {
    return {ConversionStatus::Malformed, 0.0};
  }
  if (errno == ERANGE && std::isinf(v)) {
    return {ConversionStatus::Overflow, 0.0};
  }
  // Underflow keeps the correctly rounded (denormal or zero) result.
  return {ConversionStatus::Ok, v};
}

std::string describe(std::string_view digits, int radix)
{
  return fmt::format("'{}' is not a valid base-{} number", digits, radix);
}

}  // namespace

// ============================================================================
// Literal Text Helpers
// ============================================================================

LiteralText split_radix_prefix(std::string_view text) noexcept
{
  if (text.size() >= 2 && text[0] == '0') {
    const int radix = chars::radix_for_prefix(text[1]);
    if (radix != 0) {
      return {radix, text.substr(2)};
    }
  }
  return {10, text};
}

LexicalFlags scan_lexical_flags(std::string_view digits) noexcept
{
  LexicalFlags flags;
  for (const char c : digits) {
    switch (c) {
      case 'e':
      case 'E':
        flags.has_scientific_notation = true;
        break;
      case '.':
        flags.has_decimal_point = true;
        break;
      default:
        break;
    }
  }
  return flags;
}

// ============================================================================
// Parsing
// ============================================================================

LiteralParseResult parse_literal(
  std::string_view digits, int radix, LexicalFlags flags, NumberValue::TypeAnnotation type)
{
  if (!is_supported_radix(radix)) {
    throw NumberError(
      NumberErrorKind::InvalidRadix,
      fmt::format("radix must be one of 2, 8, 10, 16 (got {})", radix));
  }

  if (digits.empty()) {
    return LiteralParseResult::not_a_number("empty numeric literal");
  }

  // Fractional and exponent literals are always Float64, even when integral.
  if (radix == 10 && (flags.has_decimal_point || flags.has_scientific_notation)) {
    const auto d = convert_double(digits);
    if (d.status != ConversionStatus::Ok) {
      return LiteralParseResult::not_a_number(
        d.status == ConversionStatus::Overflow
          ? fmt::format("'{}' is out of range for a 64-bit float", digits)
          : describe(digits, radix));
    }
    return LiteralParseResult::ok(NumberValue::from_double(d.value, flags, std::move(type)));
  }

  const auto text = split_integer_sign(digits, radix);
  if (!text) {
    return LiteralParseResult::not_a_number(describe(digits, radix));
  }

  // Fast path: the vast majority of literals fit in 32 bits.
  const auto i32 = convert_integer<int32_t>(*text, radix);
  if (i32.status == ConversionStatus::Ok) {
    return LiteralParseResult::ok(NumberValue::from_int32(i32.value, radix, std::move(type)));
  }
  if (i32.status == ConversionStatus::Malformed) {
    return LiteralParseResult::not_a_number(describe(digits, radix));
  }

  const auto i64 = convert_integer<int64_t>(*text, radix);
  if (i64.status == ConversionStatus::Ok) {
    return LiteralParseResult::ok(NumberValue::from_int64(i64.value, radix, std::move(type)));
  }
  if (i64.status == ConversionStatus::Malformed) {
    return LiteralParseResult::not_a_number(describe(digits, radix));
  }

  if (radix != 10 && radix != 16) {
    return LiteralParseResult::unsupported_magnitude(fmt::format(
      "base-{} numbers larger than a signed 64-bit integer are not supported", radix));
  }

  auto big = convert_bigint(*text, radix);
  if (big.status != ConversionStatus::Ok) {
    return LiteralParseResult::not_a_number(describe(digits, radix));
  }
  return LiteralParseResult::ok(
    NumberValue::from_bigint(std::move(big.value), radix, std::move(type)));
}

LiteralParseResult parse_literal_text(std::string_view text, NumberValue::TypeAnnotation type)
{
  if (text.empty()) {
    return LiteralParseResult::not_a_number("empty numeric literal");
  }
  if (text == "0") {
    return LiteralParseResult::ok(NumberValue::zero(10, std::move(type)));
  }

  const LiteralText literal = split_radix_prefix(text);
  const LexicalFlags flags = scan_lexical_flags(literal.digits);
  return parse_literal(literal.digits, literal.radix, flags, std::move(type));
}

}  // namespace kdlnum
