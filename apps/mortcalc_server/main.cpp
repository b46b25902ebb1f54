#include "mortcalc/core/clock.h"
#include "mortcalc/core/logger.h"
#include "mortcalc/core/version.h"

#include "config.h"
#include "http_server.h"
#include "server_context.h"
#include "startup_guard.h"

#include <exception>
#include <iostream>

using namespace mortcalc;

int main(int argc, char* argv[]) {
  auto config = server::parse_args(argc, argv);

  if (config.show_help) {
    std::cout << server::usage_text();
    return 0;
  }

  // Validate config before emitting any startup output so no partial messages appear on error.
  const std::string config_error = server::validate_server_config(config);
  if (!config_error.empty()) {
    std::cerr << config_error << "\n";
    return 1;
  }

  core::SystemClock clock;
  core::StderrLogger logger(clock, config.log_level);

  logger.info(std::string{"mortcalc HTTP server v"} + core::kBuildVersion);
  logger.info("Log level: " + std::string{core::log_level_to_string(config.log_level)} +
              ", max body: " + std::to_string(config.max_body_bytes) + " bytes");

  server::ServerContext ctx{logger, config};

  try {
    server::run_http_server(ctx);
  } catch (const std::exception& e) {
    logger.error(std::string{"Failed to start HTTP server: "} + e.what());
    return 1;
  }

  return 0;
}
