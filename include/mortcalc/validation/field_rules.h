#pragma once

#include "mortcalc/validation/validation_request.h"

namespace mortcalc::validation {

// Request payload keys.
constexpr const char* kPrincipalKey = "principal";
constexpr const char* kAnnualRateKey = "annualRate";
constexpr const char* kYearsKey = "years";

// Loan amount in currency units, 1,000 to 10,000,000 inclusive.
[[nodiscard]] FieldRule principal_rule();

// Annual percentage rate, 0.01% to 50% inclusive.
[[nodiscard]] FieldRule annual_rate_rule();

// Loan term, 1 to 50 whole years.
[[nodiscard]] FieldRule years_rule();

}  // namespace mortcalc::validation
