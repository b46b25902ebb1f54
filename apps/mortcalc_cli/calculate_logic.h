#pragma once

#include "mortcalc/core/logger.h"

#include <optional>
#include <ostream>
#include <string>

namespace mortcalc::cli {

// Exit codes of the calculate command.
constexpr int kExitSuccess = 0;
constexpr int kExitUnexpected = 1;
constexpr int kExitRejected = 2;

struct CalculateArgs {
  std::optional<std::string> principal;    // NOLINT(readability-identifier-naming)
  std::optional<std::string> annual_rate;  // NOLINT(readability-identifier-naming)
  std::optional<std::string> years;        // NOLINT(readability-identifier-naming)
  bool verbose{false};                     // NOLINT(readability-identifier-naming)
  bool show_help{false};                   // NOLINT(readability-identifier-naming)
};

CalculateArgs parse_calculate_args(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

[[nodiscard]] std::string calculate_usage_text();

// run_calculate feeds the flags through the calculation pipeline and writes
// the response record (one line of JSON) to out.
// Flags that were not given are treated as absent payload keys.
// Returns kExitSuccess, kExitRejected (validation or calculation failure) or
// kExitUnexpected.
int run_calculate(const CalculateArgs& args, core::ILogger& logger, std::ostream& out);

}  // namespace mortcalc::cli
