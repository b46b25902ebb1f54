#include "health.h"

#include "mortcalc/core/version.h"

namespace mortcalc::server::handlers {

JsonReply handle_health(const HttpRequest& /*req*/, ServerContext& /*ctx*/) {
  return JsonReply{200, nlohmann::json{{"status", "healthy"}, {"service", core::kServiceName}}, {}};
}

}  // namespace mortcalc::server::handlers
