#include "http_error.hpp"

#include "internal/util/errors.hpp"

namespace registry::http {

namespace beast_http = boost::beast::http;

beast_http::status ToHttpStatus(const std::exception& e) {
  using namespace registry::util;
  using registry::core::ValidationError;

  if (const auto* validation = dynamic_cast<const ValidationFailed*>(&e)) {
    if (validation->reason() == ValidationError::SignatureVerificationFailed) {
      return beast_http::status::unauthorized;
    }
    return beast_http::status::bad_request;
  }
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return beast_http::status::conflict;
  }

  return beast_http::status::internal_server_error;
}

std::string PublicMessage(const std::exception& e) {
  if (ToHttpStatus(e) == beast_http::status::internal_server_error) {
    return "Internal server error";
  }
  return e.what();
}

} // namespace registry::http
