#pragma once

#include "mortcalc/core/logger.h"

#include "config.h"

namespace mortcalc::server {

// ServerContext holds all process-lifetime service references passed to every route handler.
// All references must remain valid for the lifetime of run_http_server().
// Handlers only read from it, so it is shared across session threads without locking.
struct ServerContext {
  core::ILogger& logger;        // NOLINT(readability-identifier-naming)
  const ServerConfig& config;   // NOLINT(readability-identifier-naming)
};

}  // namespace mortcalc::server
