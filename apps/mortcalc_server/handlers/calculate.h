#pragma once

#include "../http_protocol.h"
#include "../server_context.h"

namespace mortcalc::server::handlers {

// POST /calculate: envelope checks, then the calculation pipeline.
JsonReply handle_calculate(const HttpRequest& req, ServerContext& ctx);

}  // namespace mortcalc::server::handlers
