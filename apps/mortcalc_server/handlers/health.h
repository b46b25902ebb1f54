#pragma once

#include "../http_protocol.h"
#include "../server_context.h"

namespace mortcalc::server::handlers {

// GET /health: static liveness record.
JsonReply handle_health(const HttpRequest& req, ServerContext& ctx);

}  // namespace mortcalc::server::handlers
