#pragma once

#include "mortcalc/core/logger.h"
#include "mortcalc/validation/validation_request.h"
#include "mortcalc/validation/validation_result.h"

#include <nlohmann/json.hpp>

#include <string>

namespace mortcalc::validation {

// coerce_to_trimmed_string renders a raw payload value as text and trims it.
//   string          -> the string itself
//   number          -> shortest round-trip form ("6.5", "300000")
//   boolean         -> "true" / "false"
//   null / absent   -> ""
//   array / object  -> compact JSON text
[[nodiscard]] std::string coerce_to_trimmed_string(const nlohmann::json& raw_value);

// validate_field runs the layered checks for one field, in order:
//   1. empty after trimming           -> "<field> cannot be empty"
//   2. malicious pattern              -> "Invalid characters detected in <field>"  (WARN logged)
//   3. not a decimal number           -> "<field> must be a valid number"
//   4. below rule.min_bound           -> "<field> must be at least <min>"
//   5. above rule.max_bound           -> "<field> must be no more than <max>"
//   6. rule.whole_number, fractional  -> "<field> must be a whole number"
// On success returns the value as double.
//
// Never throws: any internal failure is logged at ERROR and reported as
// "Validation error for <field>" with kind kInternal.
[[nodiscard]] ValidationResult validate_field(const ValidationRequest& request,
                                              core::ILogger& logger);

}  // namespace mortcalc::validation
