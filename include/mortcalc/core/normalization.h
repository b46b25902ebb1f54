#pragma once

#include <string>
#include <string_view>

namespace mortcalc::core {

// is_ascii_space matches the ASCII whitespace set: space, \t, \n, \v, \f, \r.
// Locale-independent (no std::isspace).
constexpr bool is_ascii_space(const char ch) {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\v' || ch == '\f' || ch == '\r';
}

// trim removes leading and trailing ASCII whitespace.
inline std::string trim(const std::string_view input) {
  std::size_t start = 0;
  while (start < input.size() && is_ascii_space(input[start])) {
    ++start;
  }

  // All whitespace
  if (start == input.size()) {
    return std::string{};
  }

  std::size_t end = input.size();
  while (end > start && is_ascii_space(input[end - 1])) {
    --end;
  }

  return std::string{input.substr(start, end - start)};
}

}  // namespace mortcalc::core
