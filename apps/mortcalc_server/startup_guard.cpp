#include "startup_guard.h"

#include <boost/asio/ip/address.hpp>

namespace mortcalc::server {

std::string validate_server_config(const ServerConfig& config) {
  if (config.has_invalid_option) {
    return "Error: invalid command-line options (see messages above).\n"
           "       Run with --help to list accepted flags.";
  }

  if (config.port < 1 || config.port > 65535) {
    return "Error: --port " + std::to_string(config.port) + " is out of range (1-65535).";
  }

  boost::system::error_code ec;
  (void)boost::asio::ip::make_address(config.host, ec);
  if (ec) {
    return "Error: --host '" + config.host +
           "' is not a valid IP address.\n"
           "       Pass a literal address such as 0.0.0.0, 127.0.0.1 or ::1.";
  }

  if (!config.route_prefix.empty()) {
    if (config.route_prefix.front() != '/') {
      return "Error: --route-prefix '" + config.route_prefix + "' must start with '/'.";
    }
    if (config.route_prefix.back() == '/') {
      return "Error: --route-prefix '" + config.route_prefix + "' must not end with '/'.";
    }
  }

  if (config.max_body_bytes == 0) {
    return "Error: --max-body-bytes must be greater than zero.";
  }

  if (config.worker_threads < 1 || config.worker_threads > kMaxWorkerThreads) {
    return "Error: --threads " + std::to_string(config.worker_threads) + " is out of range (1-" +
           std::to_string(kMaxWorkerThreads) + ").";
  }

  if (config.idle_timeout_seconds < 1) {
    return "Error: --idle-timeout must be at least 1 second.";
  }

  return "";
}

}  // namespace mortcalc::server
