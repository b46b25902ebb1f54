#include "mortcalc/domain/payment_breakdown.h"

#include <cmath>

namespace mortcalc::domain {

double round_currency(double amount) {
  // std::nearbyint honours the default FE_TONEAREST mode (ties to even).
  return std::nearbyint(amount * 100.0) / 100.0;
}

nlohmann::json payment_breakdown_to_json(const PaymentBreakdown& breakdown) {
  nlohmann::json j;
  j["success"] = true;
  j["monthlyPayment"] = round_currency(breakdown.monthly_payment);
  j["totalPayment"] = round_currency(breakdown.total_payment);
  j["totalInterest"] = round_currency(breakdown.total_interest);
  j["principal"] = breakdown.terms.principal;
  j["annualRate"] = breakdown.terms.annual_rate_percent;
  j["years"] = breakdown.terms.years;
  return j;
}

}  // namespace mortcalc::domain
