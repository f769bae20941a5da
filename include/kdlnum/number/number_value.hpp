// kdlnum/number/number_value.hpp - Typed numeric value of a KDL literal
//
// A NumberValue is stored in the narrowest of four representations
// (Int32, Int64, BigInt, Float64) together with the radix the literal was
// written in and an optional user type annotation. Float64 values also keep
// the lexical flags of their literal so they can be printed back in the
// same form.
//
#pragma once

#include <gmpxx.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace kdlnum
{

// ============================================================================
// Number Kind
// ============================================================================

/**
 * Native storage of a NumberValue. The order matches the payload variant.
 */
enum class NumberKind : uint8_t {
  Int32,    ///< 32-bit signed integer
  Int64,    ///< 64-bit signed integer
  BigInt,   ///< Arbitrary-precision integer (GMP)
  Float64,  ///< IEEE double
};

[[nodiscard]] constexpr std::string_view to_string(NumberKind kind) noexcept
{
  switch (kind) {
    case NumberKind::Int32:
      return "int32";
    case NumberKind::Int64:
      return "int64";
    case NumberKind::BigInt:
      return "bigint";
    case NumberKind::Float64:
      return "float64";
  }
  return "";
}

/**
 * What the literal text looked like. Only meaningful for radix 10.
 */
struct LexicalFlags
{
  bool has_decimal_point = false;
  bool has_scientific_notation = false;

  [[nodiscard]] bool operator==(const LexicalFlags & other) const noexcept
  {
    return has_decimal_point == other.has_decimal_point &&
           has_scientific_notation == other.has_scientific_notation;
  }
  [[nodiscard]] bool operator!=(const LexicalFlags & other) const noexcept
  {
    return !(*this == other);
  }
};

/// True for 2, 8, 10 and 16.
[[nodiscard]] constexpr bool is_supported_radix(int radix) noexcept
{
  return radix == 2 || radix == 8 || radix == 10 || radix == 16;
}

// ============================================================================
// NumberValue
// ============================================================================

class NumberValue
{
public:
  using Payload = std::variant<int32_t, int64_t, mpz_class, double>;
  using TypeAnnotation = std::optional<std::string>;

  // ===========================================================================
  // Factory Methods
  // ===========================================================================

  /**
   * Canonical zero (Int32) in the given radix.
   *
   * @throws NumberError (InvalidRadix) if radix is not 2, 8, 10 or 16
   */
  [[nodiscard]] static NumberValue zero(int radix, TypeAnnotation type = std::nullopt);

  /// The payload is stored verbatim; only the radix is checked.
  [[nodiscard]] static NumberValue from_int32(
    int32_t value, int radix = 10, TypeAnnotation type = std::nullopt);

  [[nodiscard]] static NumberValue from_int64(
    int64_t value, int radix = 10, TypeAnnotation type = std::nullopt);

  /// BigInt values only exist in radix 10 and 16.
  [[nodiscard]] static NumberValue from_bigint(
    mpz_class value, int radix = 10, TypeAnnotation type = std::nullopt);

  /// Float64 values only exist in radix 10.
  [[nodiscard]] static NumberValue from_double(
    double value, int radix = 10, TypeAnnotation type = std::nullopt);

  /// Float64 carrying the lexical flags of the literal it was parsed from.
  [[nodiscard]] static NumberValue from_double(
    double value, LexicalFlags flags, TypeAnnotation type = std::nullopt);

  /**
   * Parse literal text such as `42`, `-1.5e3`, `0xff`, `0o17` or `0b101`.
   *
   * Returns std::nullopt for empty or malformed text.
   *
   * @throws NumberError (UnsupportedMagnitude) for binary or octal literals
   *         beyond the 64-bit range
   */
  [[nodiscard]] static std::optional<NumberValue> from(
    std::string_view text, TypeAnnotation type = std::nullopt);

  // ===========================================================================
  // Accessors
  // ===========================================================================

  [[nodiscard]] NumberKind kind() const noexcept
  {
    return static_cast<NumberKind>(payload_.index());
  }
  [[nodiscard]] int radix() const noexcept { return radix_; }
  [[nodiscard]] const TypeAnnotation & type() const noexcept { return type_; }
  [[nodiscard]] LexicalFlags flags() const noexcept { return flags_; }
  [[nodiscard]] const Payload & payload() const noexcept { return payload_; }

  [[nodiscard]] bool is_integer() const noexcept { return kind() != NumberKind::Float64; }
  [[nodiscard]] bool is_float() const noexcept { return kind() == NumberKind::Float64; }

  /// Only valid if kind() matches; throws std::bad_variant_access otherwise
  [[nodiscard]] int32_t as_int32() const { return std::get<int32_t>(payload_); }
  [[nodiscard]] int64_t as_int64() const { return std::get<int64_t>(payload_); }
  [[nodiscard]] const mpz_class & as_bigint() const { return std::get<mpz_class>(payload_); }
  [[nodiscard]] double as_double() const { return std::get<double>(payload_); }

  // ===========================================================================
  // Rendering
  // ===========================================================================

  /**
   * Render the value without radix prefix.
   *
   * Integers are written in target_radix. Floats ignore target_radix and
   * follow their lexical flags: `1E+10`, `1.0E-5`, or fixed notation with at
   * least one fractional digit (`1.0`).
   *
   * @throws NumberError (InvalidRadix) for a target radix outside {2, 8, 10, 16}
   * @throws NumberError (UnsupportedRadix) for BigInt in any base but 10
   */
  [[nodiscard]] std::string as_basic_string(int target_radix = 10) const;

  /// Debug form: NumberValue{value='...', type=...}
  [[nodiscard]] std::string to_string() const;

  [[nodiscard]] size_t hash() const noexcept;

  /// Variant, radix and payload must match; the type annotation is ignored.
  friend bool operator==(const NumberValue & a, const NumberValue & b);
  friend bool operator!=(const NumberValue & a, const NumberValue & b) { return !(a == b); }

private:
  NumberValue(Payload payload, int radix, LexicalFlags flags, TypeAnnotation type)
  : payload_(std::move(payload)), radix_(radix), flags_(flags), type_(std::move(type))
  {
  }

  Payload payload_;
  int radix_ = 10;
  LexicalFlags flags_;
  TypeAnnotation type_;
};

std::ostream & operator<<(std::ostream & os, const NumberValue & value);

}  // namespace kdlnum

namespace std
{

template <>
struct hash<kdlnum::NumberValue>
{
  size_t operator()(const kdlnum::NumberValue & value) const noexcept { return value.hash(); }
};

}  // namespace std
