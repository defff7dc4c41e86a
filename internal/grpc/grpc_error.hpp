#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

namespace registry::grpc {

/*
  Converts internal exceptions into gRPC status codes.

  Storage failures are reported with a fixed message; the cause stays in
  the server log.
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace registry::grpc
