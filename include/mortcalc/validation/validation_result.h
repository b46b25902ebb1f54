#pragma once

#include "mortcalc/core/result.h"

#include <string>

namespace mortcalc::validation {

// Per-field failure categories. Every kind except kInternal is a deterministic
// property of the submitted value; kInternal means validation itself failed.
enum class ValidationErrorKind {
  kEmptyInput,
  kMaliciousPattern,
  kNotANumber,
  kBelowMinimum,
  kAboveMaximum,
  kNotWholeNumber,
  kInternal,
};

struct ValidationError {
  ValidationErrorKind kind{ValidationErrorKind::kInternal};  // NOLINT(readability-identifier-naming)
  std::string message;  // NOLINT(readability-identifier-naming)
};

// Exactly one of value() / error() is populated.
using ValidationResult = core::Result<double, ValidationError>;

}  // namespace mortcalc::validation
