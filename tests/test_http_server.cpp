#include "mortcalc/core/logger.h"

#include <catch2/catch_test_macros.hpp>

#include "config.h"
#include "http_protocol.h"
#include "http_server.h"
#include "server_context.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

#include <array>
#include <memory>
#include <string>
#include <thread>

using namespace mortcalc;
using namespace mortcalc::server;

namespace net = boost::asio;
namespace beast = boost::beast;
using tcp = net::ip::tcp;
using json = nlohmann::json;

namespace {

constexpr const char* kValidBody = R"({"principal": "300000", "annualRate": "6.5", "years": "30"})";

// Real server on 127.0.0.1 with an ephemeral port, run on one background thread.
// Adjust config before start().
struct LoopbackServer {
  ServerConfig config;
  core::InMemoryLogger logger;
  ServerContext ctx{logger, config};
  net::io_context ioc;
  std::unique_ptr<HttpServer> server;
  std::thread runner;

  LoopbackServer() {
    config.host = "127.0.0.1";
    config.port = 0;
  }

  ~LoopbackServer() {
    ioc.stop();
    if (runner.joinable()) {
      runner.join();
    }
  }

  LoopbackServer(const LoopbackServer&) = delete;
  LoopbackServer& operator=(const LoopbackServer&) = delete;
  LoopbackServer(LoopbackServer&&) = delete;
  LoopbackServer& operator=(LoopbackServer&&) = delete;

  tcp::endpoint start() {
    server = std::make_unique<HttpServer>(ioc, ctx);
    server->run();
    const tcp::endpoint endpoint = server->local_endpoint();
    runner = std::thread([this] { ioc.run(); });
    return endpoint;
  }
};

HttpRequest make_request(http::verb method, const std::string& target, const std::string& body) {
  HttpRequest req{method, target, 11};
  req.set(http::field::host, "127.0.0.1");
  if (!body.empty()) {
    req.set(http::field::content_type, "application/json");
    req.body() = body;
  }
  req.prepare_payload();
  return req;
}

HttpResponse round_trip(tcp::socket& socket, beast::flat_buffer& buffer, const HttpRequest& req) {
  http::write(socket, req);
  HttpResponse res;
  http::read(socket, buffer, res);
  return res;
}

}  // namespace

TEST_CASE("HttpServer: keep-alive serves several requests on one connection",
          "[server][http][socket]") {
  LoopbackServer fx;
  const tcp::endpoint endpoint = fx.start();

  net::io_context client_ioc;
  tcp::socket socket{client_ioc};
  socket.connect(endpoint);
  beast::flat_buffer buffer;

  const auto first =
      round_trip(socket, buffer, make_request(http::verb::post, "/calculate", kValidBody));
  CHECK(first.result_int() == 200);
  CHECK(first.keep_alive());
  CHECK(json::parse(first.body()).at("monthlyPayment") == 1896.2);

  const auto second = round_trip(socket, buffer, make_request(http::verb::get, "/health", ""));
  CHECK(second.result_int() == 200);
  CHECK(json::parse(second.body()).at("status") == "healthy");

  const auto third =
      round_trip(socket, buffer, make_request(http::verb::post, "/calculate", kValidBody));
  CHECK(third.body() == first.body());
}

TEST_CASE("HttpServer: connection closes after a Connection: close request",
          "[server][http][socket]") {
  LoopbackServer fx;
  const tcp::endpoint endpoint = fx.start();

  net::io_context client_ioc;
  tcp::socket socket{client_ioc};
  socket.connect(endpoint);
  beast::flat_buffer buffer;

  HttpRequest req = make_request(http::verb::get, "/health", "");
  req.keep_alive(false);
  const auto res = round_trip(socket, buffer, req);
  CHECK(res.result_int() == 200);
  CHECK_FALSE(res.keep_alive());

  HttpResponse next;
  beast::error_code ec;
  http::read(socket, buffer, next, ec);
  CHECK(ec == http::error::end_of_stream);
}

TEST_CASE("HttpServer: oversized body gets 413 and the connection is closed",
          "[server][http][socket]") {
  LoopbackServer fx;
  fx.config.max_body_bytes = 16;
  const tcp::endpoint endpoint = fx.start();

  net::io_context client_ioc;
  tcp::socket socket{client_ioc};
  socket.connect(endpoint);
  beast::flat_buffer buffer;

  const auto res =
      round_trip(socket, buffer, make_request(http::verb::post, "/calculate", kValidBody));
  CHECK(res.result_int() == 413);
  CHECK_FALSE(res.keep_alive());
  CHECK(json::parse(res.body()) == json{{"error", "Request body too large"}});

  HttpResponse next;
  beast::error_code ec;
  http::read(socket, buffer, next, ec);
  CHECK(ec);
}

TEST_CASE("HttpServer: idle connection is closed after the timeout", "[server][http][socket]") {
  LoopbackServer fx;
  fx.config.idle_timeout_seconds = 1;
  const tcp::endpoint endpoint = fx.start();

  net::io_context client_ioc;
  tcp::socket socket{client_ioc};
  socket.connect(endpoint);

  std::array<char, 1> byte{};
  beast::error_code ec;
  const auto received = socket.read_some(net::buffer(byte), ec);
  CHECK(received == 0);
  CHECK(ec == net::error::eof);
}
