#include "mortcalc/app/calculation_pipeline.h"

#include "mortcalc/calculation/amortization.h"
#include "mortcalc/domain/loan_terms.h"
#include "mortcalc/validation/field_rules.h"
#include "mortcalc/validation/input_validator.h"

#include <cmath>
#include <exception>
#include <optional>
#include <utility>

namespace mortcalc::app {

using json = nlohmann::json;

namespace {

// Runs one field and appends its message on failure.
std::optional<double> validate_into(const validation::FieldRule& rule, const json& raw_value,
                                    core::ILogger& logger, std::vector<std::string>& errors) {
  auto result = validation::validate_field(validation::ValidationRequest{rule, raw_value}, logger);
  if (!result.has_value()) {
    errors.push_back(result.error().message);
    return std::nullopt;
  }
  return result.value();
}

CalculationOutcome run_unchecked(const CalculationRequest& request, core::ILogger& logger) {
  std::vector<std::string> errors;

  const auto principal =
      validate_into(validation::principal_rule(), request.principal, logger, errors);
  const auto annual_rate =
      validate_into(validation::annual_rate_rule(), request.annual_rate, logger, errors);
  const auto years = validate_into(validation::years_rule(), request.years, logger, errors);

  if (!errors.empty()) {
    return ValidationFailed{std::move(errors)};
  }

  domain::LoanTerms terms;
  terms.principal = principal.value();
  terms.annual_rate_percent = annual_rate.value();
  terms.years = static_cast<int>(std::lround(years.value()));

  auto breakdown = calculation::compute_breakdown(terms, logger);
  if (!breakdown.has_value()) {
    return CalculationFailed{};
  }

  logger.info("Mortgage calculation completed successfully");
  return CalculationSucceeded{breakdown.value()};
}

}  // namespace

CalculationRequest request_from_payload(const json& payload) {
  CalculationRequest request;
  if (!payload.is_object()) {
    return request;
  }
  if (payload.contains(validation::kPrincipalKey)) {
    request.principal = payload.at(validation::kPrincipalKey);
  }
  if (payload.contains(validation::kAnnualRateKey)) {
    request.annual_rate = payload.at(validation::kAnnualRateKey);
  }
  if (payload.contains(validation::kYearsKey)) {
    request.years = payload.at(validation::kYearsKey);
  }
  return request;
}

CalculationOutcome run_calculation_pipeline(const CalculationRequest& request,
                                            core::ILogger& logger) {
  try {
    return run_unchecked(request, logger);
  } catch (const std::exception& e) {
    logger.error(std::string{"Unexpected error: "} + e.what());
    return UnexpectedFailure{};
  }
}

json outcome_to_json(const CalculationOutcome& outcome) {
  if (const auto* ok = std::get_if<CalculationSucceeded>(&outcome)) {
    return domain::payment_breakdown_to_json(ok->breakdown);
  }
  if (const auto* invalid = std::get_if<ValidationFailed>(&outcome)) {
    return json{{"error", "Validation failed"}, {"details", invalid->details}};
  }
  if (std::holds_alternative<CalculationFailed>(outcome)) {
    return json{{"error", "Calculation error occurred"}};
  }
  return json{{"error", "An unexpected error occurred"}};
}

int outcome_http_status(const CalculationOutcome& outcome) {
  if (std::holds_alternative<CalculationSucceeded>(outcome)) {
    return 200;
  }
  if (std::holds_alternative<UnexpectedFailure>(outcome)) {
    return 500;
  }
  return 400;
}

}  // namespace mortcalc::app
