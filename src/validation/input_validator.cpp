#include "mortcalc/validation/input_validator.h"

#include "mortcalc/core/normalization.h"
#include "mortcalc/domain/decimal.h"
#include "mortcalc/validation/malicious_patterns.h"

#include <exception>
#include <optional>
#include <stdexcept>
#include <utility>

namespace mortcalc::validation {

using json = nlohmann::json;

namespace {

ValidationResult fail(ValidationErrorKind kind, std::string message) {
  return ValidationResult::err(ValidationError{kind, std::move(message)});
}

// Quoted, escaped rendering of untrusted input for log lines.
std::string quote_for_log(const std::string& value) {
  return json(value).dump(-1, ' ', false, json::error_handler_t::replace);
}

domain::Decimal parse_bound(const std::string& literal) {
  auto bound = domain::parse_decimal(literal);
  if (!bound.has_value()) {
    throw std::invalid_argument("invalid bound literal '" + literal + "'");
  }
  return std::move(bound.value());
}

ValidationResult validate_field_unchecked(const ValidationRequest& request,
                                          core::ILogger& logger) {
  const FieldRule& rule = request.rule;
  const std::string text = coerce_to_trimmed_string(request.raw_value);

  if (text.empty()) {
    return fail(ValidationErrorKind::kEmptyInput, rule.field_name + " cannot be empty");
  }

  if (find_malicious_pattern(text).has_value()) {
    logger.warn("Malicious pattern detected in " + rule.field_name + ": " + quote_for_log(text));
    return fail(ValidationErrorKind::kMaliciousPattern,
                "Invalid characters detected in " + rule.field_name);
  }

  const auto parsed = domain::parse_decimal(text);
  if (!parsed.has_value()) {
    return fail(ValidationErrorKind::kNotANumber, rule.field_name + " must be a valid number");
  }
  const domain::Decimal& value = parsed.value();

  if (rule.min_bound.has_value() && value < parse_bound(rule.min_bound.value())) {
    return fail(ValidationErrorKind::kBelowMinimum,
                rule.field_name + " must be at least " + rule.min_bound.value());
  }

  if (rule.max_bound.has_value() && value > parse_bound(rule.max_bound.value())) {
    return fail(ValidationErrorKind::kAboveMaximum,
                rule.field_name + " must be no more than " + rule.max_bound.value());
  }

  if (rule.whole_number && !domain::is_whole_number(value)) {
    return fail(ValidationErrorKind::kNotWholeNumber, rule.field_name + " must be a whole number");
  }

  return ValidationResult::ok(domain::decimal_to_double(value));
}

}  // namespace

std::string coerce_to_trimmed_string(const json& raw_value) {
  if (raw_value.is_null() || raw_value.is_discarded()) {
    return std::string{};
  }
  if (raw_value.is_string()) {
    return core::trim(raw_value.get_ref<const std::string&>());
  }
  return core::trim(raw_value.dump(-1, ' ', false, json::error_handler_t::replace));
}

ValidationResult validate_field(const ValidationRequest& request, core::ILogger& logger) {
  try {
    return validate_field_unchecked(request, logger);
  } catch (const std::exception& e) {
    logger.error("Validation error for " + request.rule.field_name + ": " + e.what());
    return fail(ValidationErrorKind::kInternal, "Validation error for " + request.rule.field_name);
  }
}

}  // namespace mortcalc::validation
