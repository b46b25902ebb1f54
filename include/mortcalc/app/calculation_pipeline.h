#pragma once

#include "mortcalc/core/logger.h"
#include "mortcalc/domain/payment_breakdown.h"

#include <nlohmann/json.hpp>

#include <string>
#include <variant>
#include <vector>

namespace mortcalc::app {

// ────────────────────────────────────────────────────────────────
// Request
// ────────────────────────────────────────────────────────────────

// Raw, unvalidated field values as they arrived. An absent key is null.
struct CalculationRequest {
  nlohmann::json principal;    // NOLINT(readability-identifier-naming)
  nlohmann::json annual_rate;  // NOLINT(readability-identifier-naming)
  nlohmann::json years;        // NOLINT(readability-identifier-naming)
};

// request_from_payload picks the three known keys out of a JSON object.
// Missing keys stay null; unknown keys are ignored.
[[nodiscard]] CalculationRequest request_from_payload(const nlohmann::json& payload);

// ────────────────────────────────────────────────────────────────
// Outcome
// ────────────────────────────────────────────────────────────────

struct CalculationSucceeded {
  domain::PaymentBreakdown breakdown;  // NOLINT(readability-identifier-naming)
};

// One message per failed field, ordered principal, annual rate, years.
struct ValidationFailed {
  std::vector<std::string> details;  // NOLINT(readability-identifier-naming)
};

struct CalculationFailed {};

struct UnexpectedFailure {};

using CalculationOutcome =
    std::variant<CalculationSucceeded, ValidationFailed, CalculationFailed, UnexpectedFailure>;

// ────────────────────────────────────────────────────────────────
// Pipeline
// ────────────────────────────────────────────────────────────────

// Validate all three fields (errors are collected, never short-circuited),
// then compute the breakdown. Never throws.
// Logs: WARN per rejected malicious value, ERROR on calculation or unexpected
// failure, INFO on success (no monetary values).
[[nodiscard]] CalculationOutcome run_calculation_pipeline(const CalculationRequest& request,
                                                          core::ILogger& logger);

// Response record for the outcome:
//   success     -> payment_breakdown_to_json()
//   validation  -> {"error": "Validation failed", "details": [...]}
//   calculation -> {"error": "Calculation error occurred"}
//   unexpected  -> {"error": "An unexpected error occurred"}
[[nodiscard]] nlohmann::json outcome_to_json(const CalculationOutcome& outcome);

// HTTP status for the outcome: 200, 400, 400, 500 respectively.
[[nodiscard]] int outcome_http_status(const CalculationOutcome& outcome);

}  // namespace mortcalc::app
