// kdlnum/print/number_writer.hpp - Write NumberValues back as KDL text
//
#pragma once

#include <gsl/span>

#include <iosfwd>
#include <string>
#include <string_view>

#include "kdlnum/number/number_value.hpp"
#include "kdlnum/print/print_config.hpp"

namespace kdlnum
{

/**
 * Write a value as KDL literal text.
 *
 * Decimal values use as_basic_string() with the exponent marker replaced by
 * config.exponent_char. Binary, octal and hexadecimal values keep their
 * prefix and digits when config.respect_radix is set, and are written in
 * decimal otherwise.
 *
 * @throws NumberError (UnsupportedRadix) for a base-16 BigInt when the radix
 *         is respected
 */
void write_number(std::ostream & os, const NumberValue & value, const PrintConfig & config = {});

/// write_number preceded by the `(type)` annotation, if the value has one.
void write_typed_number(
  std::ostream & os, const NumberValue & value, const PrintConfig & config = {});

/// Same text as write_number, returned as a string.
[[nodiscard]] std::string to_kdl_string(
  const NumberValue & value, const PrintConfig & config = {});

/// Write each value with its annotation, with separator between consecutive values.
void write_numbers(
  std::ostream & os, gsl::span<const NumberValue> values, const PrintConfig & config = {},
  std::string_view separator = " ");

}  // namespace kdlnum
