#include "calculate.h"

#include "mortcalc/app/calculation_pipeline.h"

namespace mortcalc::server::handlers {

JsonReply handle_calculate(const HttpRequest& req, ServerContext& ctx) {
  auto payload = parse_json_object_body(req);
  if (!payload.has_value()) {
    return make_error_reply(400, body_error_message(payload.error()));
  }

  const auto outcome =
      app::run_calculation_pipeline(app::request_from_payload(payload.value()), ctx.logger);

  return JsonReply{app::outcome_http_status(outcome), app::outcome_to_json(outcome), {}};
}

}  // namespace mortcalc::server::handlers
