#include "http_server.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <chrono>
#include <optional>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace registry::http {

namespace beast      = boost::beast;
namespace beast_http = boost::beast::http;
namespace net        = boost::asio;
using tcp            = boost::asio::ip::tcp;

using registry::observability::StringField;

namespace {

constexpr auto kReadTimeout = std::chrono::seconds(30);

// The peer sent bytes that do not parse as HTTP. A message cut short by the
// peer closing is not answered.
bool IsMalformedRequest(const beast::error_code& ec) {
  return ec.category() == beast_http::make_error_code(beast_http::error::bad_version).category() &&
         ec != beast_http::error::partial_message;
}

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  HttpSession(tcp::socket&& socket, std::shared_ptr<RegistrationHandler> handler)
      : stream_(std::move(socket)), handler_(std::move(handler)) {
  }

  void Run() {
    // start on the connection's strand
    net::dispatch(stream_.get_executor(), beast::bind_front_handler(&HttpSession::DoRead, shared_from_this()));
  }

 private:
  void DoRead() {
    parser_.emplace();
    parser_->body_limit(HttpServer::kMaxBodyBytes);

    stream_.expires_after(kReadTimeout);
    beast_http::async_read(stream_, buffer_, *parser_, beast::bind_front_handler(&HttpSession::OnRead, shared_from_this()));
  }

  void OnRead(beast::error_code ec, std::size_t) {
    if (ec == beast_http::error::end_of_stream) {
      DoClose();
      return;
    }
    if (ec == beast_http::error::body_limit) {
      SendResponse(RegistrationHandler::PayloadTooLarge(parser_->get().version()));
      return;
    }
    if (ec && IsMalformedRequest(ec)) {
      REGISTRY_LOG_DEBUG("HTTP request malformed", {StringField("error", ec.message())});
      SendResponse(RegistrationHandler::BadRequest(parser_->get().version()));
      return;
    }
    if (ec) {
      if (ec != beast::error::timeout && ec != net::error::operation_aborted) {
        REGISTRY_LOG_DEBUG("HTTP read failed", {StringField("error", ec.message())});
      }
      return;
    }

    SendResponse(handler_->Handle(parser_->get()));
  }

  void SendResponse(RegistrationHandler::Response&& res) {
    auto response = std::make_shared<RegistrationHandler::Response>(std::move(res));
    response_     = response;

    beast_http::async_write(stream_, *response,
                            beast::bind_front_handler(&HttpSession::OnWrite, shared_from_this(), response->need_eof()));
  }

  void OnWrite(bool close, beast::error_code ec, std::size_t) {
    if (ec) {
      REGISTRY_LOG_DEBUG("HTTP write failed", {StringField("error", ec.message())});
      return;
    }
    if (close) {
      DoClose();
      return;
    }

    response_.reset();
    DoRead();
  }

  void DoClose() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    if (ec && ec != beast::errc::not_connected) {
      REGISTRY_LOG_DEBUG("HTTP shutdown failed", {StringField("error", ec.message())});
    }
  }

  beast::tcp_stream                                                stream_;
  beast::flat_buffer                                               buffer_;
  std::optional<beast_http::request_parser<beast_http::string_body>> parser_;
  std::shared_ptr<RegistrationHandler::Response>                   response_;
  std::shared_ptr<RegistrationHandler>                             handler_;
};

} // namespace

HttpServer::HttpServer(std::string host, uint16_t port, std::size_t threads, std::shared_ptr<RegistrationHandler> handler)
    : host_(std::move(host)),
      port_(port),
      threads_(threads == 0 ? 1 : threads),
      handler_(std::move(handler)),
      ioc_(static_cast<int>(threads_)),
      acceptor_(net::make_strand(ioc_)) {
}

HttpServer::~HttpServer() {
  Stop();
}

void HttpServer::Start() {
  const tcp::endpoint endpoint{net::ip::make_address(host_), port_};

  acceptor_.open(endpoint.protocol());
  acceptor_.set_option(net::socket_base::reuse_address(true));
  acceptor_.bind(endpoint);
  acceptor_.listen(net::socket_base::max_listen_connections);

  DoAccept();

  workers_.reserve(threads_);
  for (std::size_t i = 0; i < threads_; ++i) {
    workers_.emplace_back([this] { ioc_.run(); });
  }

  REGISTRY_LOG_INFO("HTTP server listening", {StringField("address", host_ + ":" + std::to_string(Port()))});
}

void HttpServer::Stop() {
  if (workers_.empty()) {
    return;
  }

  ioc_.stop();
  for (auto& worker : workers_) {
    if (worker.joinable()) worker.join();
  }
  workers_.clear();

  // no worker is running any more; the acceptor can be closed directly
  beast::error_code ec;
  acceptor_.close(ec);
  if (ec) {
    REGISTRY_LOG_WARN("HTTP acceptor close failed", {StringField("error", ec.message())});
  }
  REGISTRY_LOG_INFO("HTTP server stopped");
}

uint16_t HttpServer::Port() const {
  beast::error_code ec;
  const auto        endpoint = acceptor_.local_endpoint(ec);
  return ec ? port_ : endpoint.port();
}

void HttpServer::DoAccept() {
  acceptor_.async_accept(net::make_strand(ioc_), [this](beast::error_code ec, tcp::socket socket) {
    if (ec) {
      if (ec == net::error::operation_aborted) {
        return;
      }
      REGISTRY_LOG_WARN("HTTP accept failed", {StringField("error", ec.message())});
    } else {
      std::make_shared<HttpSession>(std::move(socket), handler_)->Run();
    }
    DoAccept();
  });
}

} // namespace registry::http
