#include "calculate_logic.h"

#include "mortcalc/app/calculation_pipeline.h"

#include "../shared/arg_parser.h"

#include <vector>

namespace mortcalc::cli {

namespace {

using Option = apps::Option<CalculateArgs>;

std::vector<Option> build_option_registry() {
  return {
      {"--principal", true, "Loan amount (1000-10000000)",
       [](CalculateArgs& a, const std::string& v) {
         a.principal = v;
         return true;
       }},
      {"--annual-rate", true, "Annual interest rate in percent (0.01-50)",
       [](CalculateArgs& a, const std::string& v) {
         a.annual_rate = v;
         return true;
       }},
      {"--years", true, "Loan term in whole years (1-50)",
       [](CalculateArgs& a, const std::string& v) {
         a.years = v;
         return true;
       }},
      {"--verbose", false, "Log pipeline diagnostics to stderr",
       [](CalculateArgs& a, const std::string& /*v*/) {
         a.verbose = true;
         return true;
       }},
      {"--help", false, "Print this help and exit",
       [](CalculateArgs& a, const std::string& /*v*/) {
         a.show_help = true;
         return true;
       }},
  };
}

nlohmann::json optional_to_json(const std::optional<std::string>& value) {
  return value.has_value() ? nlohmann::json(value.value()) : nlohmann::json();
}

}  // namespace

CalculateArgs parse_calculate_args(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  return apps::parse_options<CalculateArgs>(argc, argv, build_option_registry());
}

std::string calculate_usage_text() {
  return apps::format_usage("mortcalc_cli --principal <amount> --annual-rate <percent> --years <n>",
                            build_option_registry());
}

int run_calculate(const CalculateArgs& args, core::ILogger& logger, std::ostream& out) {
  app::CalculationRequest request;
  request.principal = optional_to_json(args.principal);
  request.annual_rate = optional_to_json(args.annual_rate);
  request.years = optional_to_json(args.years);

  const auto outcome = app::run_calculation_pipeline(request, logger);
  out << app::outcome_to_json(outcome).dump() << "\n";

  switch (app::outcome_http_status(outcome)) {
    case 200:
      return kExitSuccess;
    case 400:
      return kExitRejected;
    default:
      return kExitUnexpected;
  }
}

}  // namespace mortcalc::cli
