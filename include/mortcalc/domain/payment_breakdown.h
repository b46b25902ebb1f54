#pragma once

#include "mortcalc/domain/loan_terms.h"

#include <nlohmann/json.hpp>

namespace mortcalc::domain {

// PaymentBreakdown is derived from LoanTerms on every request and never stored.
// Monetary fields are unrounded here; rounding is applied when rendered.
struct PaymentBreakdown {
  LoanTerms terms;              // NOLINT(readability-identifier-naming)
  double monthly_payment{0.0};  // NOLINT(readability-identifier-naming)
  double total_payment{0.0};    // NOLINT(readability-identifier-naming)
  double total_interest{0.0};   // NOLINT(readability-identifier-naming)
};

// round_currency rounds to 2 fractional digits, ties to even.
[[nodiscard]] double round_currency(double amount);

/// Serialize to the success response record:
/// {success, monthlyPayment, totalPayment, totalInterest, principal, annualRate, years}
[[nodiscard]] nlohmann::json payment_breakdown_to_json(const PaymentBreakdown& breakdown);

}  // namespace mortcalc::domain
