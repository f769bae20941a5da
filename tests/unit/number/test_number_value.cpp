#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <sstream>
#include <unordered_set>

#include "kdlnum/number/number_error.hpp"
#include "kdlnum/number/number_value.hpp"

using kdlnum::LexicalFlags;
using kdlnum::NumberError;
using kdlnum::NumberErrorKind;
using kdlnum::NumberKind;
using kdlnum::NumberValue;

namespace
{

template <typename F>
NumberErrorKind error_kind_of(F && fn)
{
  try {
    fn();
  } catch (const NumberError & e) {
    return e.kind();
  }
  ADD_FAILURE() << "expected NumberError";
  return NumberErrorKind::UnsupportedMagnitude;
}

}  // namespace

TEST(NumberValue, ZeroIsInt32InAnyRadix)
{
  const auto z = NumberValue::zero(16);
  EXPECT_EQ(z.kind(), NumberKind::Int32);
  EXPECT_EQ(z.radix(), 16);
  EXPECT_EQ(z.as_int32(), 0);
  EXPECT_EQ(z.as_basic_string(16), "0");
  EXPECT_FALSE(z.type().has_value());

  EXPECT_EQ(
    error_kind_of([] { (void)NumberValue::zero(3); }), NumberErrorKind::InvalidRadix);
}

TEST(NumberValue, FactoriesEnforceRadixDomain)
{
  EXPECT_EQ(
    error_kind_of([] { (void)NumberValue::from_int32(5, 7); }), NumberErrorKind::InvalidRadix);
  EXPECT_EQ(
    error_kind_of([] { (void)NumberValue::from_bigint(mpz_class(5), 8); }),
    NumberErrorKind::InvalidRadix);
  EXPECT_EQ(
    error_kind_of([] { (void)NumberValue::from_double(1.0, 16); }),
    NumberErrorKind::InvalidRadix);

}

TEST(NumberValue, FactoriesStorePayloadVerbatim)
{
  const auto hex = NumberValue::from_int32(-1, 16);
  EXPECT_EQ(hex.kind(), NumberKind::Int32);
  EXPECT_EQ(hex.radix(), 16);
  EXPECT_EQ(hex.as_int32(), -1);
  EXPECT_EQ(hex.as_basic_string(16), "-1");

  const auto bin = NumberValue::from_int64(-6, 2);
  EXPECT_EQ(bin.as_int64(), -6);
  EXPECT_EQ(bin.as_basic_string(2), "-110");

  const auto big = NumberValue::from_bigint(mpz_class("-99999999999999999999"), 16);
  EXPECT_EQ(big.radix(), 16);
  EXPECT_EQ(big.as_basic_string(), "-99999999999999999999");

  // Parsing still refuses negative non-decimal text.
  EXPECT_FALSE(NumberValue::from("-0x1").has_value());
}

TEST(NumberValue, IntegerRenderingInTargetRadix)
{
  const auto v = NumberValue::from_int32(255, 16);
  EXPECT_EQ(v.as_basic_string(), "255");
  EXPECT_EQ(v.as_basic_string(16), "ff");
  EXPECT_EQ(v.as_basic_string(8), "377");
  EXPECT_EQ(v.as_basic_string(2), "11111111");

  const auto big = NumberValue::from_int64(std::numeric_limits<int64_t>::min());
  EXPECT_EQ(big.as_basic_string(), "-9223372036854775808");

  EXPECT_EQ(
    error_kind_of([&] { (void)v.as_basic_string(36); }), NumberErrorKind::InvalidRadix);
}

TEST(NumberValue, BigIntRendersOnlyInDecimal)
{
  const auto v = NumberValue::from_bigint(mpz_class("18446744073709551616"), 16);
  EXPECT_EQ(v.kind(), NumberKind::BigInt);
  EXPECT_EQ(v.as_basic_string(), "18446744073709551616");
  EXPECT_EQ(
    error_kind_of([&] { (void)v.as_basic_string(16); }), NumberErrorKind::UnsupportedRadix);

  const auto neg = NumberValue::from_bigint(mpz_class("-99999999999999999999"));
  EXPECT_EQ(neg.as_basic_string(), "-99999999999999999999");
}

TEST(NumberValue, FloatRenderingFollowsLexicalFlags)
{
  EXPECT_EQ(NumberValue::from_double(1.0).as_basic_string(), "1.0");
  EXPECT_EQ(NumberValue::from_double(100.0).as_basic_string(), "100.0");
  EXPECT_EQ(NumberValue::from_double(0.1).as_basic_string(), "0.1");
  EXPECT_EQ(NumberValue::from_double(-2.5).as_basic_string(), "-2.5");

  const LexicalFlags sci{false, true};
  const LexicalFlags sci_point{true, true};
  EXPECT_EQ(NumberValue::from_double(1e10, sci).as_basic_string(), "1E+10");
  EXPECT_EQ(NumberValue::from_double(1e10, sci_point).as_basic_string(), "1.0E+10");
  EXPECT_EQ(NumberValue::from_double(1.5e-5, sci_point).as_basic_string(), "1.5E-5");
  EXPECT_EQ(NumberValue::from_double(3.0, sci).as_basic_string(), "3E+0");

  // Floats ignore the requested radix.
  EXPECT_EQ(NumberValue::from_double(2.0).as_basic_string(16), "2.0");
}

TEST(NumberValue, NonFiniteFloats)
{
  EXPECT_EQ(
    NumberValue::from_double(std::numeric_limits<double>::quiet_NaN()).as_basic_string(), "nan");
  EXPECT_EQ(
    NumberValue::from_double(std::numeric_limits<double>::infinity()).as_basic_string(), "inf");
  EXPECT_EQ(
    NumberValue::from_double(-std::numeric_limits<double>::infinity()).as_basic_string(), "-inf");
}

TEST(NumberValue, EqualityIgnoresTypeAnnotation)
{
  EXPECT_EQ(NumberValue::from_int32(1, 10, "u8"), NumberValue::from_int32(1));
  EXPECT_NE(NumberValue::from_int32(1), NumberValue::from_int64(1));
  EXPECT_NE(NumberValue::from_int32(1, 10), NumberValue::from_int32(1, 16));
  EXPECT_NE(NumberValue::from_int32(1), NumberValue::from_int32(2));
  EXPECT_EQ(
    NumberValue::from_bigint(mpz_class("123456789012345678901234567890")),
    NumberValue::from_bigint(mpz_class("123456789012345678901234567890")));
  EXPECT_NE(NumberValue::from_double(1.0), NumberValue::from_int32(1));
}

TEST(NumberValue, HashIsConsistentWithEquality)
{
  const auto a = NumberValue::from_bigint(mpz_class("123456789012345678901234567890"), 10, "x");
  const auto b = NumberValue::from_bigint(mpz_class("123456789012345678901234567890"));
  EXPECT_EQ(a.hash(), b.hash());

  std::unordered_set<NumberValue> set;
  set.insert(NumberValue::from_int32(7));
  set.insert(NumberValue::from_int32(7, 10, "i32"));
  set.insert(NumberValue::from_int32(7, 16));
  set.insert(NumberValue::from_int64(7));
  EXPECT_EQ(set.size(), 3U);
}

TEST(NumberValue, DebugString)
{
  EXPECT_EQ(
    NumberValue::from_int32(42, 10, "u8").to_string(), "NumberValue{value='42', type=u8}");
  EXPECT_EQ(NumberValue::from_double(0.5).to_string(), "NumberValue{value='0.5', type=null}");

  std::ostringstream oss;
  oss << NumberValue::zero(10);
  EXPECT_EQ(oss.str(), "NumberValue{value='0', type=null}");
}

TEST(NumberValue, FromText)
{
  const auto hex = NumberValue::from("0xff", "u8");
  ASSERT_TRUE(hex.has_value());
  EXPECT_EQ(hex->kind(), NumberKind::Int32);
  EXPECT_EQ(hex->radix(), 16);
  EXPECT_EQ(hex->as_int32(), 255);
  EXPECT_EQ(hex->type(), "u8");

  const auto zero = NumberValue::from("0");
  ASSERT_TRUE(zero.has_value());
  EXPECT_EQ(*zero, NumberValue::zero(10));

  EXPECT_FALSE(NumberValue::from("").has_value());
  EXPECT_FALSE(NumberValue::from("abc").has_value());
  EXPECT_FALSE(NumberValue::from("-0x10").has_value());

  EXPECT_EQ(
    error_kind_of([] { (void)NumberValue::from("0b" + std::string(64, '1')); }),
    NumberErrorKind::UnsupportedMagnitude);
}
