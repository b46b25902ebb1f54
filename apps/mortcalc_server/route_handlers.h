#pragma once

#include "http_protocol.h"
#include "server_context.h"

#include <functional>
#include <map>
#include <string>

namespace mortcalc::server {

using RouteHandler = std::function<JsonReply(const HttpRequest& req, ServerContext& ctx)>;

// Handlers for one path, keyed by method.
using MethodTable = std::map<http::verb, RouteHandler>;

// Routes relative to ServerConfig::route_prefix.
std::map<std::string, MethodTable> build_route_registry();

// dispatch resolves the request path against the registry:
//   no route for the path      -> 404 {"error": "Not found"}
//   route without this method  -> 405 {"error": "Method not allowed"} + Allow header
//   otherwise                  -> the handler's reply
// A handler exception becomes 500 {"error": "An unexpected error occurred"}.
[[nodiscard]] JsonReply dispatch(const std::map<std::string, MethodTable>& registry,
                                 const HttpRequest& req, ServerContext& ctx);

}  // namespace mortcalc::server
