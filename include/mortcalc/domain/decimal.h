#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace mortcalc::domain {

// Decimal is the exact value of a decimal literal:
//
//   (negative ? -1 : 1) * 0.<digits> * 10^exponent
//
// digits has no leading or trailing zeros. Zero is empty digits, exponent 0,
// not negative. Because the form is canonical, member equality is value
// equality, and no digit of the input is ever dropped.
struct Decimal {
  bool negative{false};      // NOLINT(readability-identifier-naming)
  std::string digits;        // NOLINT(readability-identifier-naming)
  std::int64_t exponent{0};  // NOLINT(readability-identifier-naming)

  [[nodiscard]] bool is_zero() const { return digits.empty(); }

  bool operator==(const Decimal& other) const = default;
  std::strong_ordering operator<=>(const Decimal& other) const;
};

// parse_decimal accepts the plain decimal grammar:
//   [+-] digits [. digits] [(e|E) [+-] digits]     (either side of '.' may be empty, not both)
// Returns nullopt for anything else, including "NaN", "Infinity", hex and digit separators.
// Exponents with more than 15 significant digits are clamped to +/-1e18, which
// still orders them beyond every literal of ordinary length.
[[nodiscard]] std::optional<Decimal> parse_decimal(std::string_view text);

// decimal_to_double converts to the calculator's working type (nearest double;
// magnitudes outside the double range become infinity or zero).
[[nodiscard]] double decimal_to_double(const Decimal& value);

// is_whole_number is true when value has no fractional part.
[[nodiscard]] bool is_whole_number(const Decimal& value);

}  // namespace mortcalc::domain
