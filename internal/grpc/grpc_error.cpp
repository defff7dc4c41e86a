#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace registry::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace registry::util;
  using registry::core::ValidationError;

  if (const auto* validation = dynamic_cast<const ValidationFailed*>(&e)) {
    if (validation->reason() == ValidationError::SignatureVerificationFailed) {
      return {::grpc::StatusCode::UNAUTHENTICATED, e.what()};
    }
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return {::grpc::StatusCode::ALREADY_EXISTS, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, "Internal server error"};
}

} // namespace registry::grpc
