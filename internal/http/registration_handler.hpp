#pragma once

#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>

#include <memory>

#include "internal/service/registration_service.hpp"

namespace registry::http {

/*
  Routes HTTP requests onto RegistrationService and renders JSON bodies
  with the protobuf JSON mapping (lowerCamelCase field names).

    GET  /ping            -> 200 "Pong!"
    GET  /registrations   -> 200 {"success":true,"data":[...]}, ids as numbers
    HEAD on either GET route answers like GET without a body
    POST /submit          -> 200 / 400 / 401 / 409 / 500
    OPTIONS *             -> 204 CORS preflight

  Independent of sockets so it can be driven directly from tests.
*/
class RegistrationHandler {
 public:
  using Request  = boost::beast::http::request<boost::beast::http::string_body>;
  using Response = boost::beast::http::response<boost::beast::http::string_body>;

  explicit RegistrationHandler(std::shared_ptr<registry::service::RegistrationService> service);

  // Never throws; unexpected failures become 500.
  Response Handle(const Request& req) const;

  // Connection-level rejections; both close the connection.
  static Response PayloadTooLarge(unsigned version);
  static Response BadRequest(unsigned version);

 private:
  Response Ping(const Request& req) const;
  Response ListRegistrations(const Request& req) const;
  Response Submit(const Request& req) const;

  std::shared_ptr<registry::service::RegistrationService> service_;
};

} // namespace registry::http
