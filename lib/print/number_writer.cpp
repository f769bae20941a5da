// kdlnum/print/number_writer.cpp - Number writer implementation
//
#include "kdlnum/print/number_writer.hpp"

#include <algorithm>
#include <ostream>
#include <sstream>

namespace kdlnum
{

namespace
{

std::string_view radix_prefix(int radix)
{
  switch (radix) {
    case 2:
      return "0b";
    case 8:
      return "0o";
    case 16:
      return "0x";
    default:
      return "";
  }
}

std::string decimal_text(const NumberValue & value, char exponent_char)
{
  std::string text = value.as_basic_string();
  if (exponent_char != 'E') {
    std::replace(text.begin(), text.end(), 'E', exponent_char);
  }
  return text;
}

}  // namespace

void write_number(std::ostream & os, const NumberValue & value, const PrintConfig & config)
{
  if (value.radix() != 10 && config.respect_radix) {
    os << radix_prefix(value.radix()) << value.as_basic_string(value.radix());
    return;
  }
  os << decimal_text(value, config.exponent_char);
}

void write_typed_number(std::ostream & os, const NumberValue & value, const PrintConfig & config)
{
  if (value.type()) {
    os << '(' << *value.type() << ')';
  }
  write_number(os, value, config);
}

std::string to_kdl_string(const NumberValue & value, const PrintConfig & config)
{
  std::ostringstream oss;
  write_number(oss, value, config);
  return oss.str();
}

void write_numbers(
  std::ostream & os, gsl::span<const NumberValue> values, const PrintConfig & config,
  std::string_view separator)
{
  bool first = true;
  for (const auto & value : values) {
    if (!first) {
      os << separator;
    }
    first = false;
    write_typed_number(os, value, config);
  }
}

}  // namespace kdlnum
