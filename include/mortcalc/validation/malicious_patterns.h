#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mortcalc::validation {

// Source text of the rejected-content patterns, in evaluation order.
// All are matched case-insensitively anywhere in the value.
[[nodiscard]] const std::vector<std::string>& malicious_pattern_sources();

// find_malicious_pattern returns the source of the first pattern that matches
// text, or nullopt when the text is clean.
// Throws std::runtime_error if the regex engine gives up on pathological input.
[[nodiscard]] std::optional<std::string> find_malicious_pattern(std::string_view text);

}  // namespace mortcalc::validation
