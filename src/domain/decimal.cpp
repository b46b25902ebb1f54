#include "mortcalc/domain/decimal.h"

#include <boost/multiprecision/cpp_dec_float.hpp>

#include <limits>
#include <string>

namespace mortcalc::domain {

namespace {

constexpr bool is_digit(const char ch) {
  return ch >= '0' && ch <= '9';
}

// Exponents with more significant digits than this are clamped.
constexpr std::size_t kMaxExponentDigits = 15;
constexpr std::int64_t kExponentClamp = 1'000'000'000'000'000'000;

// Beyond this a double is already infinite (or zero).
constexpr std::int64_t kDoubleExponentLimit = 400;

// Digits handed to the conversion backend; far more than a double resolves.
constexpr std::size_t kConversionDigits = 60;

int sign_of(const Decimal& value) {
  if (value.is_zero()) {
    return 0;
  }
  return value.negative ? -1 : 1;
}

int compare_magnitude(const Decimal& lhs, const Decimal& rhs) {
  if (lhs.is_zero() || rhs.is_zero()) {
    return (lhs.is_zero() ? 0 : 1) - (rhs.is_zero() ? 0 : 1);
  }
  if (lhs.exponent != rhs.exponent) {
    return lhs.exponent < rhs.exponent ? -1 : 1;
  }
  // Same exponent: both are 0.<digits>, so digit strings order lexicographically.
  const int cmp = lhs.digits.compare(rhs.digits);
  return (cmp > 0) - (cmp < 0);
}

}  // namespace

std::strong_ordering Decimal::operator<=>(const Decimal& other) const {
  const int sign = sign_of(*this);
  const int other_sign = sign_of(other);
  if (sign != other_sign) {
    return sign <=> other_sign;
  }
  const int magnitude = compare_magnitude(*this, other);
  return (sign < 0 ? -magnitude : magnitude) <=> 0;
}

std::optional<Decimal> parse_decimal(std::string_view text) {
  std::size_t pos = 0;
  bool negative = false;

  if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
    negative = text[pos] == '-';
    ++pos;
  }

  const std::size_t int_start = pos;
  while (pos < text.size() && is_digit(text[pos])) {
    ++pos;
  }
  const std::string_view int_part = text.substr(int_start, pos - int_start);

  std::string_view frac_part;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    const std::size_t frac_start = pos;
    while (pos < text.size() && is_digit(text[pos])) {
      ++pos;
    }
    frac_part = text.substr(frac_start, pos - frac_start);
  }

  if (int_part.empty() && frac_part.empty()) {
    return std::nullopt;
  }

  bool exponent_negative = false;
  std::string_view exponent_digits;
  if (pos < text.size() && (text[pos] == 'e' || text[pos] == 'E')) {
    ++pos;
    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
      exponent_negative = text[pos] == '-';
      ++pos;
    }
    const std::size_t exp_start = pos;
    while (pos < text.size() && is_digit(text[pos])) {
      ++pos;
    }
    if (pos == exp_start) {
      return std::nullopt;
    }
    exponent_digits = text.substr(exp_start, pos - exp_start);
  }

  if (pos != text.size()) {
    return std::nullopt;
  }

  std::string all_digits{int_part};
  all_digits.append(frac_part);

  const auto first = all_digits.find_first_not_of('0');
  if (first == std::string::npos) {
    return Decimal{};
  }
  const auto last = all_digits.find_last_not_of('0');

  Decimal result;
  result.negative = negative;
  result.digits = all_digits.substr(first, last - first + 1);

  const auto exp_first = exponent_digits.find_first_not_of('0');
  const std::string_view exp_significant =
      exp_first == std::string_view::npos ? std::string_view{} : exponent_digits.substr(exp_first);
  if (exp_significant.size() > kMaxExponentDigits) {
    result.exponent = exponent_negative ? -kExponentClamp : kExponentClamp;
    return result;
  }

  std::int64_t written_exponent = 0;
  for (const char ch : exp_significant) {
    written_exponent = written_exponent * 10 + (ch - '0');
  }
  if (exponent_negative) {
    written_exponent = -written_exponent;
  }

  // all_digits read as an integer has (size - first) digits and is scaled by
  // 10^-(fraction length) before the written exponent applies.
  result.exponent = static_cast<std::int64_t>(all_digits.size() - first) -
                    static_cast<std::int64_t>(frac_part.size()) + written_exponent;
  return result;
}

double decimal_to_double(const Decimal& value) {
  if (value.is_zero() || value.exponent < -kDoubleExponentLimit) {
    return value.negative ? -0.0 : 0.0;
  }
  if (value.exponent > kDoubleExponentLimit) {
    return value.negative ? -std::numeric_limits<double>::infinity()
                          : std::numeric_limits<double>::infinity();
  }

  std::string literal = value.negative ? "-0." : "0.";
  literal.append(value.digits, 0, kConversionDigits);
  literal += 'e';
  literal += std::to_string(value.exponent);
  return boost::multiprecision::cpp_dec_float_50{literal.c_str()}.convert_to<double>();
}

bool is_whole_number(const Decimal& value) {
  return value.is_zero() || value.exponent >= static_cast<std::int64_t>(value.digits.size());
}

}  // namespace mortcalc::domain
