#pragma once

#include "mortcalc/core/logger.h"

#include <cstddef>
#include <string>

namespace mortcalc::server {

// ServerConfig holds all parsed startup flags for the HTTP server.
// Every field has an explicit default.
struct ServerConfig {
  std::string host{"0.0.0.0"};  // NOLINT(readability-identifier-naming)
  int port{5000};               // NOLINT(readability-identifier-naming)
  // Prepended to every route, e.g. "/api/mortgage". Empty serves /calculate and /health.
  std::string route_prefix;                             // NOLINT(readability-identifier-naming)
  core::LogLevel log_level{core::LogLevel::kInfo};      // NOLINT(readability-identifier-naming)
  std::size_t max_body_bytes{65536};                    // NOLINT(readability-identifier-naming)
  // Threads running the I/O loop; also the number of requests served at once.
  int worker_threads{4};        // NOLINT(readability-identifier-naming)
  // A connection with no complete request within this many seconds is closed.
  int idle_timeout_seconds{30};  // NOLINT(readability-identifier-naming)
  bool show_help{false};                                // NOLINT(readability-identifier-naming)
  // Set by option handlers that reject their value; startup refuses to continue.
  bool has_invalid_option{false};  // NOLINT(readability-identifier-naming)
};

ServerConfig parse_args(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

// usage_text lists every recognised flag with its description.
[[nodiscard]] std::string usage_text();

}  // namespace mortcalc::server
