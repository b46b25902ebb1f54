#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace mortcalc::validation {

// FieldRule is the static part of a validation: how the field is named in
// messages and which inclusive bounds apply. Bounds are decimal literals so
// that messages echo them exactly as written ("0.01", "50.0").
struct FieldRule {
  std::string field_name;                // NOLINT(readability-identifier-naming)
  std::optional<std::string> min_bound;  // NOLINT(readability-identifier-naming)
  std::optional<std::string> max_bound;  // NOLINT(readability-identifier-naming)
  bool whole_number{false};              // NOLINT(readability-identifier-naming)
};

// ValidationRequest pairs a rule with one raw payload value.
// raw_value may be a string, number, boolean or null (absent key).
struct ValidationRequest {
  FieldRule rule;            // NOLINT(readability-identifier-naming)
  nlohmann::json raw_value;  // NOLINT(readability-identifier-naming)
};

}  // namespace mortcalc::validation
