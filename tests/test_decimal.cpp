#include "mortcalc/domain/decimal.h"

#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <string>
#include <string_view>

using namespace mortcalc::domain;

namespace {

Decimal dec(std::string_view text) {
  const auto parsed = parse_decimal(text);
  REQUIRE(parsed.has_value());
  return parsed.value();
}

}  // namespace

TEST_CASE("parse_decimal: accepts plain decimal forms", "[domain][decimal]") {
  CHECK(dec("1000") == dec("1e3"));
  CHECK(dec("+1000") == dec("1000"));
  CHECK(dec("6.5") == dec("6.50"));
  CHECK(dec(".5") == dec("0.5"));
  CHECK(dec("5.") == dec("5"));
  CHECK(dec("2.5E-1") == dec("0.25"));
  CHECK(dec("-5") < dec("0"));
}

TEST_CASE("parse_decimal: canonical form", "[domain][decimal]") {
  const Decimal value = dec("001200.00");
  CHECK(value.digits == "12");
  CHECK(value.exponent == 4);
  CHECK_FALSE(value.negative);

  const Decimal fraction = dec("-0.0305");
  CHECK(fraction.digits == "305");
  CHECK(fraction.exponent == -1);
  CHECK(fraction.negative);

  CHECK(dec("-0.000").is_zero());
  CHECK(dec("-0.000") == dec("0"));
  CHECK_FALSE(dec("-0.000").negative);
}

TEST_CASE("parse_decimal: rejects non-numeric text", "[domain][decimal]") {
  CHECK_FALSE(parse_decimal("").has_value());
  CHECK_FALSE(parse_decimal("abc").has_value());
  CHECK_FALSE(parse_decimal("12abc").has_value());
  CHECK_FALSE(parse_decimal(".").has_value());
  CHECK_FALSE(parse_decimal("1e").has_value());
  CHECK_FALSE(parse_decimal("1,000").has_value());
  CHECK_FALSE(parse_decimal("1_000").has_value());
  CHECK_FALSE(parse_decimal("1 000").has_value());
  CHECK_FALSE(parse_decimal("0x10").has_value());
  CHECK_FALSE(parse_decimal("--1").has_value());
}

TEST_CASE("parse_decimal: non-finite literals are not numbers", "[domain][decimal]") {
  CHECK_FALSE(parse_decimal("NaN").has_value());
  CHECK_FALSE(parse_decimal("nan").has_value());
  CHECK_FALSE(parse_decimal("Infinity").has_value());
  CHECK_FALSE(parse_decimal("-inf").has_value());
}

TEST_CASE("Decimal ordering", "[domain][decimal]") {
  CHECK(dec("-2") < dec("-1"));
  CHECK(dec("-0.5") > dec("-1"));
  CHECK(dec("0.12") < dec("0.125"));
  CHECK(dec("99") < dec("100"));
  CHECK(dec("0.01") < dec("0.1"));
  CHECK(dec("50.0") == dec("50"));
  CHECK(dec("10000000") > dec("9999999.999"));
}

TEST_CASE("Decimal ordering keeps every digit", "[domain][decimal]") {
  const std::string zeros(120, '0');
  const std::string nines(120, '9');

  CHECK(dec("10000000." + zeros + "1") > dec("10000000"));
  CHECK(dec("999." + nines) < dec("1000"));
  CHECK(dec("0.00" + nines) < dec("0.01"));
  CHECK(dec("50." + zeros + "1") > dec("50.0"));
}

TEST_CASE("decimal_to_double", "[domain][decimal]") {
  CHECK(decimal_to_double(dec("6.5")) == 6.5);
  CHECK(decimal_to_double(dec("300000")) == 300000.0);
  CHECK(decimal_to_double(dec("-0.25")) == -0.25);
  CHECK(decimal_to_double(dec("0")) == 0.0);
  // Exact ordering and the double value may disagree past double precision.
  CHECK(decimal_to_double(dec("1000.0000000000000000001")) == 1000.0);
}

TEST_CASE("parse_decimal: oversized exponents stay ordered", "[domain][decimal]") {
  const Decimal huge = dec("1e99999999999");
  CHECK(huge > dec("1e100"));
  CHECK(std::isinf(decimal_to_double(huge)));

  const Decimal tiny = dec("1e-99999999999");
  CHECK(tiny > dec("0"));
  CHECK(tiny < dec("1e-100"));
  CHECK(decimal_to_double(tiny) == 0.0);

  const Decimal clamped = dec("1e99999999999999999999");
  CHECK(clamped > huge);

  CHECK(dec("0e99999999999999999999") == dec("0"));
}

TEST_CASE("is_whole_number", "[domain][decimal]") {
  CHECK(is_whole_number(dec("30")));
  CHECK(is_whole_number(dec("30.000")));
  CHECK(is_whole_number(dec("0")));
  CHECK(is_whole_number(dec("1.5e1")));
  CHECK_FALSE(is_whole_number(dec("2.5")));
  CHECK_FALSE(is_whole_number(dec("0.5")));
}
