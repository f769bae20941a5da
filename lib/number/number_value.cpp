// kdlnum/number/number_value.cpp - NumberValue implementation
//
#include "kdlnum/number/number_value.hpp"

#include <fmt/core.h>

#include <array>
#include <charconv>
#include <cmath>
#include <ostream>
#include <type_traits>
#include <utility>

#include "kdlnum/number/literal_parser.hpp"
#include "kdlnum/number/number_error.hpp"

namespace kdlnum
{

namespace
{

void require_radix(int radix)
{
  if (!is_supported_radix(radix)) {
    throw NumberError(
      NumberErrorKind::InvalidRadix,
      fmt::format("radix must be one of 2, 8, 10, 16 (got {})", radix));
  }
}

template <typename T>
std::string integer_to_string(T value, int radix)
{
  // 64 binary digits plus sign
  std::array<char, 72> buf{};
  auto [ptr, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), value, radix);
  (void)ec;  // buffer is large enough for any 64-bit value in base 2
  return std::string(buf.data(), ptr);
}

std::string non_finite_to_string(double value)
{
  if (std::isnan(value)) return "nan";
  return value < 0 ? "-inf" : "inf";
}

/// `1E+010` style exponents are reduced to `1E+10`; at least one digit is kept.
std::string strip_exponent_zeros(std::string text)
{
  const auto e = text.find('E');
  if (e == std::string::npos) {
    return text;
  }
  size_t digits = e + 1;
  if (digits < text.size() && (text[digits] == '+' || text[digits] == '-')) {
    ++digits;
  }
  size_t first_nonzero = digits;
  while (first_nonzero + 1 < text.size() && text[first_nonzero] == '0') {
    ++first_nonzero;
  }
  text.erase(digits, first_nonzero - digits);
  return text;
}

std::string double_to_string(double value, LexicalFlags flags)
{
  if (!std::isfinite(value)) {
    return non_finite_to_string(value);
  }

  if (flags.has_scientific_notation) {
    const int precision = flags.has_decimal_point ? 1 : 0;
    return strip_exponent_zeros(fmt::format("{:.{}E}", value, precision));
  }

  // Shortest round-trip digits in fixed notation; 512 covers the longest
  // fixed expansion of a finite double.
  std::array<char, 512> buf{};
  auto [ptr, ec] =
    std::to_chars(buf.data(), buf.data() + buf.size(), value, std::chars_format::fixed);
  (void)ec;
  std::string text(buf.data(), ptr);
  if (text.find('.') == std::string::npos) {
    text += ".0";
  }
  return text;
}

size_t hash_combine(size_t seed, size_t value) noexcept
{
  return seed ^ (value + 0x9e3779b97f4a7c15ULL + (seed << 6U) + (seed >> 2U));
}

size_t hash_bigint(const mpz_class & value) noexcept
{
  const mpz_srcptr z = value.get_mpz_t();
  size_t h = std::hash<int>{}(mpz_sgn(z));
  const size_t limbs = mpz_size(z);
  for (size_t i = 0; i < limbs; ++i) {
    h = hash_combine(h, std::hash<mp_limb_t>{}(mpz_getlimbn(z, static_cast<mp_size_t>(i))));
  }
  return h;
}

}  // namespace

// ============================================================================
// Factory Methods
// ============================================================================

NumberValue NumberValue::zero(int radix, TypeAnnotation type)
{
  require_radix(radix);
  return {Payload{std::in_place_type<int32_t>, 0}, radix, LexicalFlags{}, std::move(type)};
}

NumberValue NumberValue::from_int32(int32_t value, int radix, TypeAnnotation type)
{
  require_radix(radix);
  return {Payload{std::in_place_type<int32_t>, value}, radix, LexicalFlags{}, std::move(type)};
}

NumberValue NumberValue::from_int64(int64_t value, int radix, TypeAnnotation type)
{
  require_radix(radix);
  return {Payload{std::in_place_type<int64_t>, value}, radix, LexicalFlags{}, std::move(type)};
}

NumberValue NumberValue::from_bigint(mpz_class value, int radix, TypeAnnotation type)
{
  if (radix != 10 && radix != 16) {
    throw NumberError(
      NumberErrorKind::InvalidRadix,
      fmt::format("big integers must be base 10 or 16 (got {})", radix));
  }
  return {
    Payload{std::in_place_type<mpz_class>, std::move(value)}, radix, LexicalFlags{},
    std::move(type)};
}

NumberValue NumberValue::from_double(double value, int radix, TypeAnnotation type)
{
  if (radix != 10) {
    throw NumberError(
      NumberErrorKind::InvalidRadix,
      fmt::format("floating point numbers must be base 10 (got {})", radix));
  }
  return {Payload{std::in_place_type<double>, value}, radix, LexicalFlags{}, std::move(type)};
}

NumberValue NumberValue::from_double(double value, LexicalFlags flags, TypeAnnotation type)
{
  return {Payload{std::in_place_type<double>, value}, 10, flags, std::move(type)};
}

std::optional<NumberValue> NumberValue::from(std::string_view text, TypeAnnotation type)
{
  LiteralParseResult result = parse_literal_text(text, std::move(type));
  switch (result.status) {
    case LiteralStatus::Ok:
      return std::move(result.value);
    case LiteralStatus::NotANumber:
      return std::nullopt;
    case LiteralStatus::UnsupportedMagnitude:
      throw NumberError(NumberErrorKind::UnsupportedMagnitude, result.message);
  }
  return std::nullopt;
}

// ============================================================================
// Rendering
// ============================================================================

std::string NumberValue::as_basic_string(int target_radix) const
{
  require_radix(target_radix);

  return std::visit(
    [&](const auto & v) -> std::string {
      using T = std::decay_t<decltype(v)>;
      if constexpr (std::is_same_v<T, int32_t> || std::is_same_v<T, int64_t>) {
        return integer_to_string(v, target_radix);
      } else if constexpr (std::is_same_v<T, mpz_class>) {
        if (target_radix != 10) {
          throw NumberError(
            NumberErrorKind::UnsupportedRadix,
            fmt::format(
              "big integers can only be rendered in base 10 (requested {})", target_radix));
        }
        return v.get_str(10);
      } else {
        static_assert(std::is_same_v<T, double>);
        return double_to_string(v, flags_);
      }
    },
    payload_);
}

std::string NumberValue::to_string() const
{
  return fmt::format(
    "NumberValue{{value='{}', type={}}}", as_basic_string(), type_ ? *type_ : "null");
}

size_t NumberValue::hash() const noexcept
{
  size_t h = std::hash<int>{}(radix_);
  h = hash_combine(h, payload_.index());
  const size_t payload_hash = std::visit(
    [](const auto & v) -> size_t {
      using T = std::decay_t<decltype(v)>;
      if constexpr (std::is_same_v<T, mpz_class>) {
        return hash_bigint(v);
      } else {
        return std::hash<T>{}(v);
      }
    },
    payload_);
  return hash_combine(h, payload_hash);
}

bool operator==(const NumberValue & a, const NumberValue & b)
{
  if (a.payload_.index() != b.payload_.index() || a.radix_ != b.radix_) {
    return false;
  }

  if (const auto * ai = std::get_if<int32_t>(&a.payload_)) {
    return *ai == std::get<int32_t>(b.payload_);
  }
  if (const auto * al = std::get_if<int64_t>(&a.payload_)) {
    return *al == std::get<int64_t>(b.payload_);
  }
  if (const auto * ab = std::get_if<mpz_class>(&a.payload_)) {
    return *ab == std::get<mpz_class>(b.payload_);
  }
  return std::get<double>(a.payload_) == std::get<double>(b.payload_);
}

std::ostream & operator<<(std::ostream & os, const NumberValue & value)
{
  return os << value.to_string();
}

}  // namespace kdlnum
