#pragma once

namespace mortcalc::domain {

// LoanTerms holds the three validated inputs of a fixed-rate loan.
// Only constructed after validation, so the ranges below always hold:
//   principal            [1000, 10000000]
//   annual_rate_percent  [0.01, 50.0]      (5.25 means 5.25%)
//   years                [1, 50]
struct LoanTerms {
  double principal{0.0};            // NOLINT(readability-identifier-naming)
  double annual_rate_percent{0.0};  // NOLINT(readability-identifier-naming)
  int years{0};                     // NOLINT(readability-identifier-naming)
};

}  // namespace mortcalc::domain
