#pragma once

#include "config.h"

#include <string>

namespace mortcalc::server {

constexpr int kMaxWorkerThreads = 256;

// validate_server_config checks startup preconditions for the HTTP server.
//
// Returns: "" on success, non-empty error message on failure.
// Caller is responsible for printing the error and exiting with code 1.
//
// Preconditions checked (first failure is returned):
// - no option was rejected while parsing
// - port is within 1..65535
// - host parses as an IPv4 or IPv6 address
// - route_prefix is empty, or starts with '/' and does not end with '/'
// - max_body_bytes is non-zero
// - worker_threads is within 1..kMaxWorkerThreads
// - idle_timeout_seconds is positive
[[nodiscard]] std::string validate_server_config(const ServerConfig& config);

}  // namespace mortcalc::server
