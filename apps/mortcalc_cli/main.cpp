#include "mortcalc/core/clock.h"
#include "mortcalc/core/logger.h"

#include "calculate_logic.h"

#include <iostream>

using namespace mortcalc;

int main(int argc, char* argv[]) {
  const auto args = cli::parse_calculate_args(argc, argv);
  if (args.show_help) {
    std::cout << cli::calculate_usage_text();
    return cli::kExitSuccess;
  }

  // Only warnings and errors reach stderr unless --verbose; stdout carries the JSON record.
  core::SystemClock clock;
  core::StderrLogger logger(clock, args.verbose ? core::LogLevel::kDebug : core::LogLevel::kWarn);

  return cli::run_calculate(args, logger, std::cout);
}
