#include "mortcalc/core/logger.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "config.h"
#include "http_protocol.h"
#include "route_handlers.h"
#include "server_context.h"

#include <nlohmann/json.hpp>

#include <string>

using namespace mortcalc;
using namespace mortcalc::server;
using json = nlohmann::json;

namespace {

// In-process server: routes, an in-memory log sink and a default config.
struct DispatchFixture {
  ServerConfig config;
  core::InMemoryLogger logger;
  ServerContext ctx{logger, config};
  std::map<std::string, MethodTable> registry = build_route_registry();

  JsonReply send(http::verb method, const std::string& target, const std::string& body = "",
                 const std::string& content_type = "application/json") {
    HttpRequest req{method, target, 11};
    if (!content_type.empty()) {
      req.set(http::field::content_type, content_type);
    }
    req.body() = body;
    req.prepare_payload();
    return dispatch(registry, req, ctx);
  }
};

}  // namespace

TEST_CASE("dispatch: POST /calculate success", "[server][routes]") {
  DispatchFixture fx;
  const auto reply = fx.send(http::verb::post, "/calculate",
                             R"({"principal": 300000, "annualRate": 6.5, "years": 30})");

  CHECK(reply.status == 200);
  CHECK(reply.body.at("success") == true);
  CHECK_THAT(reply.body.at("monthlyPayment").get<double>(),
             Catch::Matchers::WithinAbs(1896.20, 1e-9));
  CHECK(reply.body.at("years") == 30);
}

TEST_CASE("dispatch: POST /calculate validation failure is a 400", "[server][routes]") {
  DispatchFixture fx;
  const auto reply = fx.send(http::verb::post, "/calculate",
                             R"({"principal": "<script>alert(1)</script>", "annualRate": "6.5",
                                 "years": "30"})");

  CHECK(reply.status == 400);
  CHECK(reply.body.at("error") == "Validation failed");
  CHECK(reply.body.at("details") == json::array({"Invalid characters detected in Principal"}));
}

TEST_CASE("dispatch: POST /calculate envelope errors", "[server][routes]") {
  DispatchFixture fx;

  const auto wrong_type = fx.send(http::verb::post, "/calculate", R"({"principal":1})", "text/plain");
  CHECK(wrong_type.status == 400);
  CHECK(wrong_type.body.at("error") == "Content-Type must be application/json");

  const auto empty = fx.send(http::verb::post, "/calculate", "{}");
  CHECK(empty.status == 400);
  CHECK(empty.body.at("error") == "Request body cannot be empty");

  const auto malformed = fx.send(http::verb::post, "/calculate", "{\"principal\":");
  CHECK(malformed.status == 400);
  CHECK(malformed.body.at("error") == "Request body must be valid JSON");
}

TEST_CASE("dispatch: identical requests give byte-identical replies", "[server][routes]") {
  DispatchFixture fx;
  const std::string body = R"({"principal": "250000", "annualRate": "3.75", "years": "15"})";

  const auto first = fx.send(http::verb::post, "/calculate", body);
  const auto second = fx.send(http::verb::post, "/calculate", body);
  CHECK(first.status == second.status);
  CHECK(first.body.dump() == second.body.dump());
}

TEST_CASE("dispatch: GET /health", "[server][routes]") {
  DispatchFixture fx;
  const auto reply = fx.send(http::verb::get, "/health", "", "");
  CHECK(reply.status == 200);
  CHECK(reply.body == json{{"status", "healthy"}, {"service", "mortgage-calculator"}});
}

TEST_CASE("dispatch: unknown path and wrong method", "[server][routes]") {
  DispatchFixture fx;

  const auto missing = fx.send(http::verb::get, "/nope", "", "");
  CHECK(missing.status == 404);

  const auto wrong_method = fx.send(http::verb::get, "/calculate", "", "");
  CHECK(wrong_method.status == 405);
  REQUIRE(wrong_method.headers.size() == 1);
  CHECK(wrong_method.headers[0].first == "Allow");
  CHECK(wrong_method.headers[0].second == "POST");
}

TEST_CASE("dispatch: route prefix", "[server][routes]") {
  DispatchFixture fx;
  fx.config.route_prefix = "/api/mortgage";

  CHECK(fx.send(http::verb::get, "/api/mortgage/health", "", "").status == 200);
  CHECK(fx.send(http::verb::get, "/health", "", "").status == 404);
  CHECK(fx.send(http::verb::get, "/api/mortgagehealth", "", "").status == 404);
}
