#include "mortcalc/validation/field_rules.h"

namespace mortcalc::validation {

FieldRule principal_rule() {
  return FieldRule{"Principal", "1000", "10000000", false};
}

FieldRule annual_rate_rule() {
  return FieldRule{"Annual Interest Rate", "0.01", "50.0", false};
}

FieldRule years_rule() {
  return FieldRule{"Years", "1", "50", true};
}

}  // namespace mortcalc::validation
