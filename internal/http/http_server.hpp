#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/http/registration_handler.hpp"

namespace registry::http {

/*
  Asynchronous HTTP/1.1 server (Boost.Beast).

  One io_context is run by `threads` workers; each connection lives on
  its own strand, so requests on different connections are handled
  concurrently. Keep-alive is honoured.
*/
class HttpServer {
 public:
  static constexpr std::size_t kMaxBodyBytes = 1024 * 1024;

  HttpServer(std::string host, uint16_t port, std::size_t threads, std::shared_ptr<RegistrationHandler> handler);
  ~HttpServer();

  HttpServer(const HttpServer&)            = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  // Binds and starts the workers. Throws on bind failure.
  void Start();

  // Stops accepting, aborts open connections and joins the workers. Idempotent.
  void Stop();

  // The bound port; differs from the configured one when that was 0.
  uint16_t Port() const;

 private:
  void DoAccept();

  std::string                          host_;
  uint16_t                             port_;
  std::size_t                          threads_;
  std::shared_ptr<RegistrationHandler> handler_;

  boost::asio::io_context        ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  std::vector<std::thread>       workers_;
};

} // namespace registry::http
