#include <gtest/gtest.h>

#include <limits>
#include <string>

#include "kdlnum/number/literal_parser.hpp"
#include "kdlnum/number/number_error.hpp"

using kdlnum::LexicalFlags;
using kdlnum::LiteralStatus;
using kdlnum::NumberKind;
using kdlnum::parse_literal;
using kdlnum::parse_literal_text;

TEST(NumberLiteralParser, SplitRadixPrefix)
{
  auto t = kdlnum::split_radix_prefix("0x1F");
  EXPECT_EQ(t.radix, 16);
  EXPECT_EQ(t.digits, "1F");

  t = kdlnum::split_radix_prefix("0o17");
  EXPECT_EQ(t.radix, 8);
  EXPECT_EQ(t.digits, "17");

  t = kdlnum::split_radix_prefix("0b");
  EXPECT_EQ(t.radix, 2);
  EXPECT_EQ(t.digits, "");

  t = kdlnum::split_radix_prefix("0");
  EXPECT_EQ(t.radix, 10);
  EXPECT_EQ(t.digits, "0");

  t = kdlnum::split_radix_prefix("-0x1");
  EXPECT_EQ(t.radix, 10);
  EXPECT_EQ(t.digits, "-0x1");
}

TEST(NumberLiteralParser, ScanLexicalFlags)
{
  EXPECT_EQ(kdlnum::scan_lexical_flags("123"), (LexicalFlags{false, false}));
  EXPECT_EQ(kdlnum::scan_lexical_flags("1.5"), (LexicalFlags{true, false}));
  EXPECT_EQ(kdlnum::scan_lexical_flags("1e5"), (LexicalFlags{false, true}));
  EXPECT_EQ(kdlnum::scan_lexical_flags("1.5E-3"), (LexicalFlags{true, true}));
}

TEST(NumberLiteralParser, DecimalIntegerCascade)
{
  auto r = parse_literal_text("2147483647");
  ASSERT_TRUE(r.success());
  EXPECT_EQ(r.value->kind(), NumberKind::Int32);
  EXPECT_EQ(r.value->as_int32(), std::numeric_limits<int32_t>::max());

  r = parse_literal_text("2147483648");
  ASSERT_TRUE(r.success());
  EXPECT_EQ(r.value->kind(), NumberKind::Int64);
  EXPECT_EQ(r.value->as_int64(), 2147483648LL);

  r = parse_literal_text("-2147483648");
  ASSERT_TRUE(r.success());
  EXPECT_EQ(r.value->kind(), NumberKind::Int32);
  EXPECT_EQ(r.value->as_int32(), std::numeric_limits<int32_t>::min());

  r = parse_literal_text("-2147483649");
  ASSERT_TRUE(r.success());
  EXPECT_EQ(r.value->kind(), NumberKind::Int64);

  r = parse_literal_text("9223372036854775807");
  ASSERT_TRUE(r.success());
  EXPECT_EQ(r.value->kind(), NumberKind::Int64);
  EXPECT_EQ(r.value->as_int64(), std::numeric_limits<int64_t>::max());

  r = parse_literal_text("-9223372036854775808");
  ASSERT_TRUE(r.success());
  EXPECT_EQ(r.value->kind(), NumberKind::Int64);
  EXPECT_EQ(r.value->as_int64(), std::numeric_limits<int64_t>::min());

  r = parse_literal_text("9223372036854775808");
  ASSERT_TRUE(r.success());
  EXPECT_EQ(r.value->kind(), NumberKind::BigInt);
  EXPECT_EQ(r.value->as_bigint(), mpz_class("9223372036854775808"));

  r = parse_literal_text("-9223372036854775809");
  ASSERT_TRUE(r.success());
  EXPECT_EQ(r.value->kind(), NumberKind::BigInt);
  EXPECT_EQ(r.value->as_basic_string(), "-9223372036854775809");

  r = parse_literal_text("+42");
  ASSERT_TRUE(r.success());
  EXPECT_EQ(r.value->as_int32(), 42);
}

TEST(NumberLiteralParser, HexSignBitEscalates)
{
  auto r = parse_literal_text("0x7fffffff");
  ASSERT_TRUE(r.success());
  EXPECT_EQ(r.value->kind(), NumberKind::Int32);
  EXPECT_EQ(r.value->radix(), 16);

  r = parse_literal_text("0x80000000");
  ASSERT_TRUE(r.success());
  EXPECT_EQ(r.value->kind(), NumberKind::Int64);
  EXPECT_EQ(r.value->as_int64(), 0x80000000LL);

  r = parse_literal_text("0x8000000000000000");
  ASSERT_TRUE(r.success());
  EXPECT_EQ(r.value->kind(), NumberKind::BigInt);
  EXPECT_EQ(r.value->radix(), 16);
  EXPECT_EQ(r.value->as_basic_string(), "9223372036854775808");

  // A high first digit must not turn the magnitude negative.
  r = parse_literal_text("0xffffffffffffffffff");
  ASSERT_TRUE(r.success());
  EXPECT_GT(r.value->as_bigint(), 0);
  EXPECT_EQ(r.value->as_basic_string(), "4722366482869645213695");
}

TEST(NumberLiteralParser, BinaryAndOctalStopAtInt64)
{
  auto r = parse_literal_text("0b" + std::string(63, '1'));
  ASSERT_TRUE(r.success());
  EXPECT_EQ(r.value->kind(), NumberKind::Int64);
  EXPECT_EQ(r.value->as_int64(), std::numeric_limits<int64_t>::max());

  r = parse_literal_text("0b" + std::string(64, '1'));
  EXPECT_EQ(r.status, LiteralStatus::UnsupportedMagnitude);
  EXPECT_FALSE(r.value.has_value());

  r = parse_literal_text("0b1" + std::string(80, '0'));
  EXPECT_EQ(r.status, LiteralStatus::UnsupportedMagnitude);

  r = parse_literal_text("0o777777777777777777777");
  ASSERT_TRUE(r.success());
  EXPECT_EQ(r.value->kind(), NumberKind::Int64);

  r = parse_literal_text("0o1777777777777777777777");
  EXPECT_EQ(r.status, LiteralStatus::UnsupportedMagnitude);
}

TEST(NumberLiteralParser, NegativeNonDecimalIsNotANumber)
{
  EXPECT_EQ(parse_literal("-10", 16, {}).status, LiteralStatus::NotANumber);
  EXPECT_EQ(parse_literal("-1", 2, {}).status, LiteralStatus::NotANumber);
  EXPECT_EQ(parse_literal("-ffffffffffffffffffff", 16, {}).status, LiteralStatus::NotANumber);

  const auto r = parse_literal("+ff", 16, {});
  ASSERT_TRUE(r.success());
  EXPECT_EQ(r.value->as_int32(), 255);
}

TEST(NumberLiteralParser, FloatsFromDecimalFlags)
{
  auto r = parse_literal_text("1.5");
  ASSERT_TRUE(r.success());
  EXPECT_EQ(r.value->kind(), NumberKind::Float64);
  EXPECT_DOUBLE_EQ(r.value->as_double(), 1.5);
  EXPECT_EQ(r.value->flags(), (LexicalFlags{true, false}));

  // Integral exponent literals are still floats.
  r = parse_literal_text("1e3");
  ASSERT_TRUE(r.success());
  EXPECT_EQ(r.value->kind(), NumberKind::Float64);
  EXPECT_DOUBLE_EQ(r.value->as_double(), 1000.0);
  EXPECT_EQ(r.value->as_basic_string(), "1E+3");

  r = parse_literal_text("-2.5E-3");
  ASSERT_TRUE(r.success());
  EXPECT_DOUBLE_EQ(r.value->as_double(), -0.0025);
  EXPECT_EQ(r.value->as_basic_string(), "-2.5E-3");

  // Underflow keeps the rounded result.
  r = parse_literal_text("1e-999");
  ASSERT_TRUE(r.success());
  EXPECT_EQ(r.value->as_double(), 0.0);

  EXPECT_EQ(parse_literal_text("1e999").status, LiteralStatus::NotANumber);
}

TEST(NumberLiteralParser, MalformedTextIsNotANumber)
{
  for (const char * text : {"", "12abc", "0x", "0xg", "0o8", "0b2", "1.5.5", "1e", "--1", "0x1.5",
                            "inf", "nan", " 1"}) {
    const auto r = parse_literal_text(text);
    EXPECT_EQ(r.status, LiteralStatus::NotANumber) << text;
    EXPECT_FALSE(r.value.has_value()) << text;
  }
}

TEST(NumberLiteralParser, FlagsAreIgnoredOutsideDecimal)
{
  EXPECT_EQ(parse_literal("1.5", 16, LexicalFlags{true, false}).status, LiteralStatus::NotANumber);

  const auto r = parse_literal("1e", 16, LexicalFlags{false, true});
  ASSERT_TRUE(r.success());
  EXPECT_EQ(r.value->as_int32(), 0x1e);
}

TEST(NumberLiteralParser, TypeAnnotationIsAttached)
{
  const auto r = parse_literal_text("0o17", std::string("u16"));
  ASSERT_TRUE(r.success());
  EXPECT_EQ(r.value->radix(), 8);
  EXPECT_EQ(r.value->as_int32(), 15);
  EXPECT_EQ(r.value->type(), "u16");
}

TEST(NumberLiteralParser, UnsupportedRadixThrows)
{
  try {
    (void)parse_literal("10", 3, {});
    FAIL() << "expected NumberError";
  } catch (const kdlnum::NumberError & e) {
    EXPECT_EQ(e.kind(), kdlnum::NumberErrorKind::InvalidRadix);
  }
}

TEST(NumberLiteralParser, Int32TextRoundTripsInItsRadix)
{
  const int32_t samples[] = {0, 1, 7, 255, 65535, 123456789, std::numeric_limits<int32_t>::max()};
  for (const int radix : {2, 8, 10, 16}) {
    for (const int32_t n : samples) {
      const auto digits = kdlnum::NumberValue::from_int32(n).as_basic_string(radix);
      const auto r = parse_literal(digits, radix, {});
      ASSERT_TRUE(r.success()) << digits;
      EXPECT_EQ(r.value->kind(), NumberKind::Int32) << digits;
      EXPECT_EQ(r.value->as_int32(), n) << digits;
    }
  }

  const auto r = parse_literal_text(std::to_string(std::numeric_limits<int32_t>::min() + 1));
  ASSERT_TRUE(r.success());
  EXPECT_EQ(r.value->as_int32(), std::numeric_limits<int32_t>::min() + 1);
}

TEST(NumberLiteralParser, FloatTextRendersInItsOwnForm)
{
  EXPECT_EQ(parse_literal_text("1.0").value->as_basic_string(), "1.0");
  EXPECT_EQ(parse_literal_text("1e10").value->as_basic_string(), "1E+10");
  EXPECT_EQ(parse_literal_text("1.0e10").value->as_basic_string(), "1.0E+10");
}
