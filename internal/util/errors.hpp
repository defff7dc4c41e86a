#pragma once

#include <stdexcept>
#include <string>

#include "internal/core/validator.hpp"

namespace registry::util {

/*
  Central error types.

  These get translated later to HTTP and gRPC status codes.
*/

class ValidationFailed : public std::runtime_error {
 public:
  explicit ValidationFailed(core::ValidationError reason)
      : std::runtime_error(core::ReasonMessage(reason)), reason_(reason) {
  }

  core::ValidationError reason() const {
    return reason_;
  }

 private:
  core::ValidationError reason_;
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

// what() carries the internal cause; transports must not echo it.
class StoreUnavailable : public std::runtime_error {
 public:
  explicit StoreUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace registry::util
