#include "mortcalc/calculation/amortization.h"

#include <cmath>
#include <sstream>

namespace mortcalc::calculation {

namespace {

core::Result<double, CalculationError> calculation_error(core::ILogger& logger,
                                                         const std::string& detail) {
  logger.error("Calculation error: " + detail);
  return core::Result<double, CalculationError>::err(CalculationError{detail});
}

std::string describe(double principal, double annual_rate_percent, double years) {
  std::ostringstream oss;
  oss << "principal=" << principal << " annual_rate=" << annual_rate_percent
      << " years=" << years;
  return oss.str();
}

}  // namespace

core::Result<double, CalculationError> calculate_monthly_payment(double principal,
                                                                 double annual_rate_percent,
                                                                 double years,
                                                                 core::ILogger& logger) {
  const double monthly_rate = annual_rate_percent / kPercentDivisor / kMonthsPerYear;
  const double num_payments = years * kMonthsPerYear;

  if (!std::isfinite(monthly_rate) || !std::isfinite(num_payments) || num_payments <= 0.0) {
    return calculation_error(logger, "invalid term or rate (" +
                                         describe(principal, annual_rate_percent, years) + ")");
  }

  double monthly_payment = 0.0;
  if (monthly_rate == 0.0) {
    monthly_payment = principal / num_payments;
  } else {
    const double factor = std::pow(1.0 + monthly_rate, num_payments);
    const double denominator = factor - 1.0;
    if (!std::isfinite(factor) || denominator == 0.0) {
      return calculation_error(logger, "compounding factor out of range (" +
                                           describe(principal, annual_rate_percent, years) + ")");
    }
    monthly_payment = principal * (monthly_rate * factor) / denominator;
  }

  if (!std::isfinite(monthly_payment)) {
    return calculation_error(logger, "monthly payment is not finite (" +
                                         describe(principal, annual_rate_percent, years) + ")");
  }

  return core::Result<double, CalculationError>::ok(monthly_payment);
}

core::Result<domain::PaymentBreakdown, CalculationError> compute_breakdown(
    const domain::LoanTerms& terms, core::ILogger& logger) {
  using BreakdownResult = core::Result<domain::PaymentBreakdown, CalculationError>;

  const auto monthly = calculate_monthly_payment(terms.principal, terms.annual_rate_percent,
                                                 static_cast<double>(terms.years), logger);
  if (!monthly.has_value()) {
    return BreakdownResult::err(monthly.error());
  }

  domain::PaymentBreakdown breakdown;
  breakdown.terms = terms;
  breakdown.monthly_payment = monthly.value();
  breakdown.total_payment = breakdown.monthly_payment * terms.years * kMonthsPerYear;
  breakdown.total_interest = breakdown.total_payment - terms.principal;

  if (!std::isfinite(breakdown.total_payment) || !std::isfinite(breakdown.total_interest)) {
    logger.error("Calculation error: totals are not finite");
    return BreakdownResult::err(CalculationError{"totals are not finite"});
  }

  return BreakdownResult::ok(breakdown);
}

}  // namespace mortcalc::calculation
