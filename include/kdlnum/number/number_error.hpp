// kdlnum/number/number_error.hpp - Capability errors raised by NumberValue
//
// Malformed literal text is never reported through this type; it is an
// absent value. NumberError signals that the request itself cannot be served
// by the number model (bad radix, magnitude the radix cannot carry, ...).
//
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace kdlnum
{

enum class NumberErrorKind : uint8_t {
  InvalidRadix,          ///< radix outside {2, 8, 10, 16}, or outside a variant's domain
  UnsupportedMagnitude,  ///< value beyond Int64 in a radix BigInt cannot carry
  UnsupportedRadix,      ///< BigInt rendering requested in a base other than 10
};

[[nodiscard]] constexpr std::string_view to_string(NumberErrorKind kind) noexcept
{
  switch (kind) {
    case NumberErrorKind::InvalidRadix:
      return "invalid radix";
    case NumberErrorKind::UnsupportedMagnitude:
      return "unsupported magnitude";
    case NumberErrorKind::UnsupportedRadix:
      return "unsupported radix";
  }
  return "";
}

class NumberError : public std::runtime_error
{
public:
  NumberError(NumberErrorKind kind, const std::string & message)
  : std::runtime_error(message), kind_(kind)
  {
  }

  [[nodiscard]] NumberErrorKind kind() const noexcept { return kind_; }

private:
  NumberErrorKind kind_;
};

}  // namespace kdlnum
