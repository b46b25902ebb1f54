#pragma once

#include "route_handlers.h"
#include "server_context.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/system/error_code.hpp>

#include <map>
#include <string>

namespace mortcalc::server {

// HttpServer accepts connections on config.host:config.port and serves each
// one as an asynchronous keep-alive session on the given io_context. Every
// read and write is bounded by config.idle_timeout_seconds.
// The caller runs the io_context; the server must outlive it.
class HttpServer {
 public:
  HttpServer(boost::asio::io_context& ioc, ServerContext& ctx);
  ~HttpServer() = default;

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;
  HttpServer(HttpServer&&) = delete;
  HttpServer& operator=(HttpServer&&) = delete;

  // Opens, binds and listens, then starts accepting.
  // Throws boost::system::system_error if the listening socket cannot be set up.
  void run();

  // Bound address; the actual port when config.port is 0.
  [[nodiscard]] boost::asio::ip::tcp::endpoint local_endpoint() const;

 private:
  void do_accept();
  void on_accept(boost::system::error_code ec, boost::asio::ip::tcp::socket socket);

  boost::asio::io_context& ioc_;
  ServerContext& ctx_;
  boost::asio::ip::tcp::acceptor acceptor_;
  std::map<std::string, MethodTable> registry_;
};

// run_http_server starts an HttpServer and runs its io_context on
// config.worker_threads threads until the process is terminated.
// Throws boost::system::system_error if the listening socket cannot be set up.
void run_http_server(ServerContext& ctx);

}  // namespace mortcalc::server
