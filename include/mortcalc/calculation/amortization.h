#pragma once

#include "mortcalc/core/logger.h"
#include "mortcalc/core/result.h"
#include "mortcalc/domain/loan_terms.h"
#include "mortcalc/domain/payment_breakdown.h"

#include <string>

namespace mortcalc::calculation {

constexpr int kMonthsPerYear = 12;
constexpr double kPercentDivisor = 100.0;

// CalculationError reports arithmetic that left the finite range.
// The detail is for logs only; callers present a generic message.
struct CalculationError {
  std::string detail;  // NOLINT(readability-identifier-naming)
};

// calculate_monthly_payment applies the fixed-rate amortization formula
//
//   r = annual_rate_percent / 100 / 12,  n = years * 12
//   M = P * r * (1 + r)^n / ((1 + r)^n - 1)      (r != 0)
//   M = P / n                                     (r == 0)
//
// Inputs are expected to be validated. Any non-finite intermediate or result
// is returned as CalculationError and logged at ERROR.
[[nodiscard]] core::Result<double, CalculationError> calculate_monthly_payment(
    double principal, double annual_rate_percent, double years, core::ILogger& logger);

// compute_breakdown derives the monthly payment, total paid over the term
// (monthly * years * 12) and total interest (total - principal).
[[nodiscard]] core::Result<domain::PaymentBreakdown, CalculationError> compute_breakdown(
    const domain::LoanTerms& terms, core::ILogger& logger);

}  // namespace mortcalc::calculation
