// kdlnum/json/number_json.hpp - JSON serialization for numeric values
//
// Provides a machine-readable view of a NumberValue, returning
// nlohmann::json objects.
//
#pragma once

#include <nlohmann/json.hpp>

#include "kdlnum/number/number_value.hpp"

namespace kdlnum
{

/**
 * Serialize a value to JSON.
 *
 * Keys: `kind`, `radix`, `value`, `type` (null when absent) and, for
 * Float64, `flags`. BigInt values and non-finite floats are written as
 * decimal strings; every other value is a JSON number.
 *
 * @param value The value to serialize
 * @return JSON representation of the value
 */
[[nodiscard]] nlohmann::json to_json(const NumberValue & value);

}  // namespace kdlnum
