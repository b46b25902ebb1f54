#include "http_server.h"

#include "http_protocol.h"

#include <boost/asio/ip/address.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <chrono>
#include <exception>
#include <memory>
#include <optional>
#include <thread>
#include <utility>
#include <vector>

namespace mortcalc::server {

namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

using RouteRegistry = std::map<std::string, MethodTable>;

// One connection: read a request, dispatch, write the reply, repeat while the
// client keeps the connection alive.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  HttpSession(tcp::socket socket, const RouteRegistry& registry, ServerContext& ctx)
      : stream_(std::move(socket)), registry_(registry), ctx_(ctx) {}

  void start() { do_read(); }

 private:
  void do_read() {
    parser_.emplace();
    parser_->body_limit(ctx_.config.max_body_bytes);

    stream_.expires_after(std::chrono::seconds(ctx_.config.idle_timeout_seconds));
    http::async_read(stream_, buffer_, *parser_,
                     beast::bind_front_handler(&HttpSession::on_read, shared_from_this()));
  }

  void on_read(beast::error_code ec, std::size_t /*bytes_transferred*/) {
    if (ec == http::error::end_of_stream) {
      close();
      return;
    }
    if (ec == http::error::body_limit) {
      HttpRequest stub;
      stub.version(11);
      stub.keep_alive(false);
      send(to_http_response(make_error_reply(413, "Request body too large"), stub));
      return;
    }
    if (ec == beast::error::timeout) {
      // The stream closes itself when the deadline fires.
      ctx_.logger.debug("Closing idle connection");
      return;
    }
    if (ec) {
      ctx_.logger.debug("Dropping connection: " + ec.message());
      close();
      return;
    }

    const HttpRequest request = parser_->release();
    const auto method = http::to_string(request.method());
    const auto target = request.target();
    ctx_.logger.debug("Received: " + std::string(method.data(), method.size()) + " " +
                      std::string(target.data(), target.size()));

    send(to_http_response(dispatch(registry_, request, ctx_), request));
  }

  void send(HttpResponse response) {
    response_ = std::move(response);
    stream_.expires_after(std::chrono::seconds(ctx_.config.idle_timeout_seconds));
    http::async_write(stream_, response_,
                      beast::bind_front_handler(&HttpSession::on_write, shared_from_this()));
  }

  void on_write(beast::error_code ec, std::size_t /*bytes_transferred*/) {
    if (ec) {
      ctx_.logger.debug("Write failed: " + ec.message());
      close();
      return;
    }
    if (!response_.keep_alive()) {
      close();
      return;
    }
    do_read();
  }

  void close() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
  }

  beast::tcp_stream stream_;
  beast::flat_buffer buffer_;
  std::optional<http::request_parser<http::string_body>> parser_;
  HttpResponse response_;
  const RouteRegistry& registry_;
  ServerContext& ctx_;
};

// Keeps a worker alive if a handler throws out of the I/O loop.
void run_io_loop(net::io_context& ioc, core::ILogger& logger) {
  for (;;) {
    try {
      ioc.run();
      return;
    } catch (const std::exception& e) {
      logger.error(std::string{"I/O loop error: "} + e.what());
    }
  }
}

}  // namespace

HttpServer::HttpServer(net::io_context& ioc, ServerContext& ctx)
    : ioc_(ioc), ctx_(ctx), acceptor_(ioc), registry_(build_route_registry()) {}

void HttpServer::run() {
  const tcp::endpoint endpoint{net::ip::make_address(ctx_.config.host),
                               static_cast<unsigned short>(ctx_.config.port)};

  acceptor_.open(endpoint.protocol());
  acceptor_.set_option(net::socket_base::reuse_address(true));
  acceptor_.bind(endpoint);
  acceptor_.listen(net::socket_base::max_listen_connections);

  const tcp::endpoint bound = acceptor_.local_endpoint();
  ctx_.logger.info("Listening on " + bound.address().to_string() + ":" +
                   std::to_string(bound.port()) +
                   (ctx_.config.route_prefix.empty()
                        ? std::string{}
                        : " (prefix " + ctx_.config.route_prefix + ")"));

  do_accept();
}

tcp::endpoint HttpServer::local_endpoint() const {
  return acceptor_.local_endpoint();
}

void HttpServer::do_accept() {
  // Each connection gets its own strand so its handlers never run concurrently.
  acceptor_.async_accept(net::make_strand(ioc_), [this](beast::error_code ec, tcp::socket socket) {
    on_accept(ec, std::move(socket));
  });
}

void HttpServer::on_accept(beast::error_code ec, tcp::socket socket) {
  if (ec == net::error::operation_aborted) {
    return;
  }
  if (ec) {
    ctx_.logger.warn("Accept failed: " + ec.message());
  } else {
    std::make_shared<HttpSession>(std::move(socket), registry_, ctx_)->start();
  }
  do_accept();
}

void run_http_server(ServerContext& ctx) {
  net::io_context ioc{ctx.config.worker_threads};

  HttpServer server{ioc, ctx};
  server.run();

  ctx.logger.info("Serving on " + std::to_string(ctx.config.worker_threads) + " worker threads");

  std::vector<std::thread> workers;
  workers.reserve(static_cast<std::size_t>(ctx.config.worker_threads - 1));
  for (int i = 1; i < ctx.config.worker_threads; ++i) {
    workers.emplace_back([&ioc, &ctx] { run_io_loop(ioc, ctx.logger); });
  }
  run_io_loop(ioc, ctx.logger);

  for (auto& worker : workers) {
    worker.join();
  }
}

}  // namespace mortcalc::server
