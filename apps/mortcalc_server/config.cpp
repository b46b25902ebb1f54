#include "config.h"

#include "../shared/arg_parser.h"

#include <charconv>
#include <iostream>
#include <vector>

namespace mortcalc::server {

namespace {

using Option = apps::Option<ServerConfig>;

// ────────────────────────────────────────────────────────────────
// Option Handlers
// ────────────────────────────────────────────────────────────────

template <typename Int>
bool parse_integer(const std::string& value, Int& out) {
  const char* first = value.data();
  const char* last = value.data() + value.size();
  const auto [ptr, ec] = std::from_chars(first, last, out);
  return ec == std::errc{} && ptr == last;
}

bool handle_host(ServerConfig& config, const std::string& value) {
  config.host = value;
  return true;
}

bool handle_port(ServerConfig& config, const std::string& value) {
  int port = 0;
  if (!parse_integer(value, port)) {
    std::cerr << "Invalid --port: " << value << " (expected an integer)\n";
    config.has_invalid_option = true;
    return false;
  }
  config.port = port;
  return true;
}

bool handle_route_prefix(ServerConfig& config, const std::string& value) {
  config.route_prefix = value;
  return true;
}

bool handle_log_level(ServerConfig& config, const std::string& value) {
  const auto level = core::parse_log_level(value);
  if (!level.has_value()) {
    std::cerr << "Invalid --log-level: " << value << " (valid: debug, info, warn, error)\n";
    config.has_invalid_option = true;
    return false;
  }
  config.log_level = level.value();
  return true;
}

bool handle_max_body_bytes(ServerConfig& config, const std::string& value) {
  std::size_t bytes = 0;
  if (!parse_integer(value, bytes)) {
    std::cerr << "Invalid --max-body-bytes: " << value << " (expected an integer)\n";
    config.has_invalid_option = true;
    return false;
  }
  config.max_body_bytes = bytes;
  return true;
}

bool handle_threads(ServerConfig& config, const std::string& value) {
  int threads = 0;
  if (!parse_integer(value, threads)) {
    std::cerr << "Invalid --threads: " << value << " (expected an integer)\n";
    config.has_invalid_option = true;
    return false;
  }
  config.worker_threads = threads;
  return true;
}

bool handle_idle_timeout(ServerConfig& config, const std::string& value) {
  int seconds = 0;
  if (!parse_integer(value, seconds)) {
    std::cerr << "Invalid --idle-timeout: " << value << " (expected seconds)\n";
    config.has_invalid_option = true;
    return false;
  }
  config.idle_timeout_seconds = seconds;
  return true;
}

bool handle_help(ServerConfig& config, const std::string& /*value*/) {
  config.show_help = true;
  return true;
}

// ────────────────────────────────────────────────────────────────
// Option Registry
// ────────────────────────────────────────────────────────────────

std::vector<Option> build_option_registry() {
  return {
      {"--host", true, "Address to bind (default 0.0.0.0)", handle_host},
      {"--port", true, "TCP port to listen on (default 5000)", handle_port},
      {"--route-prefix", true, "Path prefix for all routes, e.g. /api/mortgage",
       handle_route_prefix},
      {"--log-level", true, "Minimum log level (debug|info|warn|error)", handle_log_level},
      {"--max-body-bytes", true, "Largest accepted request body (default 65536)",
       handle_max_body_bytes},
      {"--threads", true, "Worker threads serving connections (default 4)", handle_threads},
      {"--idle-timeout", true, "Seconds before an idle connection is closed (default 30)",
       handle_idle_timeout},
      {"--help", false, "Print this help and exit", handle_help},
  };
}

}  // namespace

// ────────────────────────────────────────────────────────────────
// Parser
// ────────────────────────────────────────────────────────────────

ServerConfig parse_args(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  return apps::parse_options<ServerConfig>(
      argc, argv, build_option_registry(), 1, ServerConfig{},
      [](ServerConfig& config) { config.has_invalid_option = true; });
}

std::string usage_text() {
  return apps::format_usage("mortcalc_server [options]", build_option_registry());
}

}  // namespace mortcalc::server
