// kdlnum/json/number_json.cpp - JSON serialization implementation
//
#include "kdlnum/json/number_json.hpp"

#include <cmath>
#include <string>
#include <type_traits>
#include <variant>

namespace kdlnum
{
namespace
{

using nlohmann::json;

json j_payload(const NumberValue & value)
{
  return std::visit(
    [&value](const auto & v) -> json {
      using T = std::decay_t<decltype(v)>;
      if constexpr (std::is_same_v<T, mpz_class>) {
        return v.get_str(10);
      } else if constexpr (std::is_same_v<T, double>) {
        if (!std::isfinite(v)) {
          return value.as_basic_string();
        }
        return v;
      } else {
        return v;
      }
    },
    value.payload());
}

json j_flags(LexicalFlags flags)
{
  return json{
    {"decimal_point", flags.has_decimal_point},
    {"scientific_notation", flags.has_scientific_notation}};
}

}  // namespace

json to_json(const NumberValue & value)
{
  json j{
    {"kind", std::string(to_string(value.kind()))},
    {"radix", value.radix()},
    {"value", j_payload(value)},
    {"type", nullptr}};
  if (value.type()) {
    j["type"] = *value.type();
  }
  if (value.is_float()) {
    j["flags"] = j_flags(value.flags());
  }
  return j;
}

}  // namespace kdlnum
