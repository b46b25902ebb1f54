#include "route_handlers.h"

#include "handlers/calculate.h"
#include "handlers/health.h"

#include <exception>
#include <string_view>

namespace mortcalc::server {

namespace {

std::string allow_header(const MethodTable& methods) {
  std::string allow;
  for (const auto& [verb, _] : methods) {
    if (!allow.empty()) {
      allow += ", ";
    }
    const auto name = http::to_string(verb);
    allow.append(name.data(), name.size());
  }
  return allow;
}

}  // namespace

std::map<std::string, MethodTable> build_route_registry() {
  return {
      {"/calculate", {{http::verb::post, handlers::handle_calculate}}},
      {"/health", {{http::verb::get, handlers::handle_health}}},
  };
}

JsonReply dispatch(const std::map<std::string, MethodTable>& registry, const HttpRequest& req,
                   ServerContext& ctx) {
  std::string_view path = request_path(req);

  const std::string& prefix = ctx.config.route_prefix;
  if (!prefix.empty()) {
    if (path.substr(0, prefix.size()) != prefix) {
      return make_error_reply(404, "Not found");
    }
    path.remove_prefix(prefix.size());
  }

  const auto route = registry.find(std::string{path});
  if (route == registry.end()) {
    return make_error_reply(404, "Not found");
  }

  const auto handler = route->second.find(req.method());
  if (handler == route->second.end()) {
    JsonReply reply = make_error_reply(405, "Method not allowed");
    reply.headers.emplace_back("Allow", allow_header(route->second));
    return reply;
  }

  try {
    return handler->second(req, ctx);
  } catch (const std::exception& e) {
    ctx.logger.error(std::string{"Unexpected error: "} + e.what());
    return make_error_reply(500, "An unexpected error occurred");
  }
}

}  // namespace mortcalc::server
