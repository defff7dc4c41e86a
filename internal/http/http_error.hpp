#pragma once

#include <ostream>

#include <boost/beast/http/status.hpp>

#include <exception>
#include <string>

namespace registry::http {

/*
  Converts internal exceptions into HTTP status codes and the message
  placed in the response body.

  Storage and unexpected failures map to 500 with a fixed message; the
  cause stays in the server log.
*/

boost::beast::http::status ToHttpStatus(const std::exception& e);

std::string PublicMessage(const std::exception& e);

} // namespace registry::http
